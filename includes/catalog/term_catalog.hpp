#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace redline {

inline constexpr double DEFAULT_THRESHOLD = 85.0;

// One configured term. Many terms may share a word with different
// thresholds; they are not deduplicated.
struct Term {
    std::string word;                       // as configured, not normalized
    double threshold = DEFAULT_THRESHOLD;   // 0..100, compared with >=
    bool aggressive = false;                // wider suffixes, substring + compound rules
};

// Object form of a catalog entry before defaults are applied.
struct StructuredEntry {
    std::string word;
    std::optional<double> threshold;        // "threshold", else "fuzzy_threshold"
    bool aggressive = false;                // "aggressive": true or "variant_strategy": "aggressive"
};

// A catalog entry is either a bare word or an object.
using CatalogEntry = std::variant<std::string, StructuredEntry>;

class TermCatalog {
public:
    TermCatalog() = default;
    explicit TermCatalog(std::vector<Term> terms, double defaultThreshold = DEFAULT_THRESHOLD);

    // Accepts a JSON array of entries, or an object with a "profanities"
    // array. Entries that are neither strings nor objects are skipped.
    static std::vector<CatalogEntry> parseEntries(const nlohmann::json& doc);

    // Applies defaults. Empty words and thresholds outside 0..100 resolve
    // to nothing.
    static std::optional<Term> resolveEntry(const CatalogEntry& entry, double defaultThreshold);

    // Throws std::invalid_argument if defaultThreshold is outside 0..100.
    static TermCatalog fromEntries(const std::vector<CatalogEntry>& entries,
                                   double defaultThreshold = DEFAULT_THRESHOLD);
    static TermCatalog fromJson(const nlohmann::json& doc,
                                double defaultThreshold = DEFAULT_THRESHOLD);

    // One word per line; blank lines and lines starting with '#' are skipped.
    static TermCatalog fromLines(const std::string& content,
                                 double defaultThreshold = DEFAULT_THRESHOLD);

    // JSON first, newline-delimited words when the content is not JSON.
    static TermCatalog fromText(const std::string& content,
                                double defaultThreshold = DEFAULT_THRESHOLD);

    // Throws std::runtime_error if the file cannot be read. Never throws
    // because of individual entries; an empty result is left to the caller.
    static TermCatalog loadFromFile(const std::string& path,
                                    double defaultThreshold = DEFAULT_THRESHOLD);

    const std::vector<Term>& terms() const { return terms_; }
    std::vector<std::string> words() const;
    double defaultThreshold() const { return defaultThreshold_; }
    bool empty() const { return terms_.empty(); }
    std::size_t size() const { return terms_.size(); }

private:
    std::vector<Term> terms_;
    double defaultThreshold_ = DEFAULT_THRESHOLD;
};

} // namespace redline
