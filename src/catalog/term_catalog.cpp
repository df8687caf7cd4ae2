#include "catalog/term_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iterator>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace redline {

namespace {

inline void trim(std::string& s) {
    auto notspace = [](unsigned char c){ return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notspace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notspace).base(), s.end());
}

inline std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<double> as_threshold(const nlohmann::json& v) {
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        try { return std::stod(v.get<std::string>()); } catch (const std::exception&) { return std::nullopt; }
    }
    return std::nullopt;
}

inline bool valid_threshold(double t) {
    return std::isfinite(t) && t >= 0.0 && t <= 100.0;
}

bool as_flag(const nlohmann::json& v) {
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number()) return v.get<double>() != 0.0;
    return false;
}

StructuredEntry parse_object(const nlohmann::json& obj) {
    StructuredEntry entry;
    if (obj.contains("word") && obj["word"].is_string()) {
        entry.word = obj["word"].get<std::string>();
    }

    if (obj.contains("threshold")) {
        entry.threshold = as_threshold(obj["threshold"]);
    } else if (obj.contains("fuzzy_threshold")) {
        entry.threshold = as_threshold(obj["fuzzy_threshold"]);
    }

    if (obj.contains("aggressive")) {
        entry.aggressive = as_flag(obj["aggressive"]);
    }
    if (obj.contains("variant_strategy") && obj["variant_strategy"].is_string() &&
        lower(obj["variant_strategy"].get<std::string>()) == "aggressive") {
        entry.aggressive = true;
    }
    return entry;
}

} // namespace

TermCatalog::TermCatalog(std::vector<Term> terms, double defaultThreshold)
    : terms_(std::move(terms)), defaultThreshold_(defaultThreshold) {}

std::vector<CatalogEntry> TermCatalog::parseEntries(const nlohmann::json& doc) {
    const nlohmann::json* items = nullptr;
    if (doc.is_object() && doc.contains("profanities")) {
        if (doc["profanities"].is_array()) items = &doc["profanities"];
        else if (doc["profanities"].is_null()) return {};
    } else if (doc.is_array()) {
        items = &doc;
    }

    if (!items) {
        std::cerr << "[catalog] Warning: expected a list of terms or an object with 'profanities'\n";
        return {};
    }

    std::vector<CatalogEntry> entries;
    entries.reserve(items->size());
    for (const auto& item : *items) {
        if (item.is_string()) {
            entries.emplace_back(item.get<std::string>());
        } else if (item.is_object()) {
            entries.emplace_back(parse_object(item));
        }
    }
    return entries;
}

std::optional<Term> TermCatalog::resolveEntry(const CatalogEntry& entry, double defaultThreshold) {
    Term term;
    if (const auto* word = std::get_if<std::string>(&entry)) {
        term.word = *word;
        term.threshold = defaultThreshold;
    } else {
        const auto& s = std::get<StructuredEntry>(entry);
        term.word = s.word;
        term.threshold = s.threshold.value_or(defaultThreshold);
        term.aggressive = s.aggressive;
    }

    trim(term.word);
    if (term.word.empty()) return std::nullopt;
    if (!valid_threshold(term.threshold)) {
        std::cerr << "[catalog] Warning: dropping '" << term.word << "', threshold "
                  << term.threshold << " is outside 0..100\n";
        return std::nullopt;
    }
    return term;
}

TermCatalog TermCatalog::fromEntries(const std::vector<CatalogEntry>& entries, double defaultThreshold) {
    if (!valid_threshold(defaultThreshold)) {
        throw std::invalid_argument("Default threshold must be within 0..100, got " +
                                    std::to_string(defaultThreshold));
    }
    std::vector<Term> terms;
    terms.reserve(entries.size());
    for (const auto& entry : entries) {
        if (auto term = resolveEntry(entry, defaultThreshold)) {
            terms.push_back(std::move(*term));
        }
    }
    return TermCatalog(std::move(terms), defaultThreshold);
}

TermCatalog TermCatalog::fromJson(const nlohmann::json& doc, double defaultThreshold) {
    return fromEntries(parseEntries(doc), defaultThreshold);
}

TermCatalog TermCatalog::fromLines(const std::string& content, double defaultThreshold) {
    std::vector<CatalogEntry> entries;
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;
        entries.emplace_back(line);
    }
    return fromEntries(entries, defaultThreshold);
}

TermCatalog TermCatalog::fromText(const std::string& content, double defaultThreshold) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error&) {
        return fromLines(content, defaultThreshold);
    }
    return fromJson(doc, defaultThreshold);
}

TermCatalog TermCatalog::loadFromFile(const std::string& path, double defaultThreshold) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open term catalog: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    TermCatalog catalog = fromText(content, defaultThreshold);
    std::cout << "[catalog] Loaded " << catalog.size() << " terms from " << path << "\n";
    return catalog;
}

std::vector<std::string> TermCatalog::words() const {
    std::vector<std::string> out;
    out.reserve(terms_.size());
    for (const auto& t : terms_) out.push_back(t.word);
    return out;
}

} // namespace redline
