#include "subtitle/srt_file.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <iomanip>
#include <iostream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace redline {

namespace {

const std::regex& timestamp_regex() {
    static const std::regex re(R"(^\s*(\d+):(\d{1,2}):(\d{1,2})[,.](\d{1,3})\s*$)");
    return re;
}

const std::regex& timing_line_regex() {
    static const std::regex re(
        R"(^\s*(\d+:\d{1,2}:\d{1,2}[,.]\d{1,3})\s*-->\s*(\d+:\d{1,2}:\d{1,2}[,.]\d{1,3}))");
    return re;
}

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c){ return std::isspace(c); });
}

bool is_index_line(const std::string& line) {
    std::size_t digits = 0;
    for (unsigned char c : line) {
        if (std::isdigit(c)) ++digits;
        else if (!std::isspace(c)) return false;
    }
    return digits > 0;
}

std::vector<std::string> split_lines(const std::string& content) {
    std::string text = content;
    // UTF-8 BOM
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) text.erase(0, 3);

    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::optional<TextUnit> parse_block(const std::vector<std::string>& block) {
    std::size_t timing = 0;
    if (block.size() > 1 && is_index_line(block[0]) && block[1].find("-->") != std::string::npos) {
        timing = 1;
    }

    std::smatch m;
    if (!std::regex_search(block[timing], m, timing_line_regex())) return std::nullopt;

    auto start = parse_srt_timestamp(m[1].str());
    auto end = parse_srt_timestamp(m[2].str());
    if (!start || !end) return std::nullopt;

    TextUnit unit;
    unit.start_ms = *start;
    unit.end_ms = *end;
    for (std::size_t i = timing + 1; i < block.size(); ++i) {
        if (i > timing + 1) unit.text.push_back('\n');
        unit.text += block[i];
    }
    return unit;
}

} // namespace

std::optional<std::int64_t> parse_srt_timestamp(const std::string& text) {
    std::smatch m;
    if (!std::regex_match(text, m, timestamp_regex())) return std::nullopt;

    try {
        const std::int64_t h = std::stoll(m[1].str());
        const std::int64_t mi = std::stoll(m[2].str());
        const std::int64_t s = std::stoll(m[3].str());
        std::string frac = m[4].str();
        frac.resize(3, '0');   // ",5" means 500 ms
        const std::int64_t ms = std::stoll(frac);
        if (mi > 59 || s > 59) return std::nullopt;
        return ((h * 60 + mi) * 60 + s) * 1000 + ms;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string format_srt_timestamp(std::int64_t ms) {
    if (ms < 0) ms = 0;
    const std::int64_t h = ms / 3600000;
    const std::int64_t mi = (ms / 60000) % 60;
    const std::int64_t s = (ms / 1000) % 60;
    const std::int64_t frac = ms % 1000;

    std::ostringstream out;
    out << std::setfill('0')
        << std::setw(2) << h << ':'
        << std::setw(2) << mi << ':'
        << std::setw(2) << s << ','
        << std::setw(3) << frac;
    return out.str();
}

std::vector<TextUnit> parse_srt(const std::string& content) {
    std::vector<TextUnit> units;
    const auto lines = split_lines(content);

    std::vector<std::string> block;
    std::size_t skipped = 0;
    auto flush = [&]() {
        if (block.empty()) return;
        if (auto unit = parse_block(block)) units.push_back(std::move(*unit));
        else ++skipped;
        block.clear();
    };

    for (const auto& line : lines) {
        if (is_blank(line)) flush();
        else block.push_back(line);
    }
    flush();

    if (skipped > 0) {
        std::cerr << "[srt] Warning: skipped " << skipped << " block(s) without a valid timing line\n";
    }
    return units;
}

std::string format_srt(const std::vector<TextUnit>& units) {
    std::ostringstream out;
    for (std::size_t i = 0; i < units.size(); ++i) {
        const auto& u = units[i];
        out << (i + 1) << "\n"
            << format_srt_timestamp(u.start_ms) << " --> " << format_srt_timestamp(u.end_ms) << "\n"
            << u.text << "\n\n";
    }
    return out.str();
}

std::vector<TextUnit> load_srt_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open subtitle file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto units = parse_srt(content);
    std::cout << "[srt] Loaded " << units.size() << " events from " << path << "\n";
    return units;
}

void save_srt_file(const std::string& path, const std::vector<TextUnit>& units) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write subtitle file: " + path);
    }
    file << format_srt(units);
    if (!file.good()) {
        throw std::runtime_error("Failed writing subtitle file: " + path);
    }
}

} // namespace redline
