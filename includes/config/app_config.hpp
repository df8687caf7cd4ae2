#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace redline {

struct AppConfig {
    std::optional<std::string> catalog_path;          // --catalog
    std::optional<std::string> output_dir;            // --out
    std::optional<double> default_threshold;          // --threshold

    std::optional<std::string> db_path;               // --db

    std::optional<double> merge_epsilon;              // --epsilon
    std::optional<double> control_sample_len;         // --sample-len
    std::optional<std::size_t> control_max_samples;   // --max-samples

    std::optional<bool> verbose;                      // -v / --verbose
};

// Returns $XDG_CONFIG_HOME/redline/redline.toml or ~/.config/redline/redline.toml
std::string default_config_path();

// Load config file if it exists. Simple TOML/INI-like: key = value
// '#' or ';' starts a comment at line start or after whitespace, so
// values like /tmp/a#b.db survive. Strings may be quoted.
// Missing file returns an empty AppConfig (all optionals disengaged).
AppConfig load_config_file(const std::string& path);

// Same parser over in-memory content.
AppConfig parse_config(const std::string& content);

// Values set in `over` win; the rest come from `base`.
AppConfig merge_config(const AppConfig& base, const AppConfig& over);

// Expand leading '~/' in paths using $HOME.
std::string expand_path(const std::string& p);

} // namespace redline
