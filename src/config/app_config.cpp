#include "config/app_config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

namespace redline {

using std::string;

namespace {

string trimmed(const string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

string lowered(string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// '#' and ';' open a comment at the start of a line or after whitespace,
// never inside a quoted value or in the middle of a path.
string strip_comment(const string& line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if ((c == '#' || c == ';') &&
                   (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1])))) {
            return line.substr(0, i);
        }
    }
    return line;
}

string unquoted(const string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

std::optional<double> parse_number(const string& s) {
    try {
        size_t used = 0;
        const double v = std::stod(s, &used);
        if (used != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::size_t> parse_count(const string& s) {
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s.front()))) return std::nullopt;
    try {
        size_t used = 0;
        const auto v = std::stoul(s, &used);
        if (used != s.size()) return std::nullopt;
        return static_cast<std::size_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> parse_flag(const string& s) {
    const string v = lowered(s);
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    return std::nullopt;
}

void apply_setting(AppConfig& cfg, const string& key, const string& val) {
    if (key == "catalog" || key == "catalog_path") cfg.catalog_path = expand_path(val);
    else if (key == "output_dir" || key == "out") cfg.output_dir = expand_path(val);
    else if (key == "default_threshold" || key == "threshold") cfg.default_threshold = parse_number(val);
    else if (key == "db_path" || key == "db") cfg.db_path = expand_path(val);
    else if (key == "merge_epsilon" || key == "epsilon") cfg.merge_epsilon = parse_number(val);
    else if (key == "control_sample_len" || key == "sample_len") cfg.control_sample_len = parse_number(val);
    else if (key == "control_max_samples" || key == "max_samples") cfg.control_max_samples = parse_count(val);
    else if (key == "verbose") cfg.verbose = parse_flag(val);
}

template <typename T>
void overlay(std::optional<T>& dst, const std::optional<T>& src) {
    if (src) dst = src;
}

} // namespace

std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home && *home) return string(home) + p.substr(1);
    }
    return p;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return string(xdg) + "/redline/redline.toml";
    const char* home = std::getenv("HOME");
    string base = home ? string(home) + "/.config" : string(".config");
    return base + "/redline/redline.toml";
}

AppConfig parse_config(const std::string& content) {
    AppConfig cfg;
    std::istringstream in(content);
    string raw;
    while (std::getline(in, raw)) {
        const string line = trimmed(strip_comment(raw));
        if (line.empty()) continue;

        // 'key = value' or 'key: value'
        size_t sep = line.find('=');
        if (sep == string::npos) sep = line.find(':');
        if (sep == string::npos) continue;

        const string key = lowered(trimmed(line.substr(0, sep)));
        const string val = unquoted(trimmed(line.substr(sep + 1)));
        if (key.empty() || val.empty()) continue;
        apply_setting(cfg, key, val);
    }
    return cfg;
}

AppConfig load_config_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) return AppConfig{}; // missing is fine
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return parse_config(content);
}

AppConfig merge_config(const AppConfig& base, const AppConfig& over) {
    AppConfig out = base;
    overlay(out.catalog_path, over.catalog_path);
    overlay(out.output_dir, over.output_dir);
    overlay(out.default_threshold, over.default_threshold);
    overlay(out.db_path, over.db_path);
    overlay(out.merge_epsilon, over.merge_epsilon);
    overlay(out.control_sample_len, over.control_sample_len);
    overlay(out.control_max_samples, over.control_max_samples);
    overlay(out.verbose, over.verbose);
    return out;
}

} // namespace redline
