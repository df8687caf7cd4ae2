#include "mute/mute_plan.hpp"

#include "match/match_csv.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace redline {

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open window file: " + path);
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

std::optional<double> as_number(const std::string& s) {
    try {
        std::size_t used = 0;
        double v = std::stod(s, &used);
        if (used == 0 || !std::isfinite(v)) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::size_t> column_index(const std::vector<std::string>& header, const std::string& name) {
    auto it = std::find(header.begin(), header.end(), name);
    if (it == header.end()) return std::nullopt;
    return static_cast<std::size_t>(it - header.begin());
}

bool has_json_extension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return ext == ".json";
}

std::vector<Interval> read_sidecar(const std::string& path) {
    const nlohmann::json doc = nlohmann::json::parse(read_file(path));
    if (!doc.is_array()) {
        throw std::runtime_error("Window sidecar is not a JSON array: " + path);
    }
    std::vector<Interval> windows;
    windows.reserve(doc.size());
    for (const auto& item : doc) {
        windows.push_back({item.at("start").get<double>(), item.at("end").get<double>()});
    }
    return windows;
}

} // namespace

std::vector<Interval> read_mute_intervals_csv(const std::string& path) {
    const auto rows = parse_csv(read_file(path));
    std::vector<Interval> windows;
    if (rows.empty()) return windows;

    const auto& header = rows.front();
    const auto startCol = column_index(header, "start_ms");
    const auto endCol = column_index(header, "end_ms");
    if (!startCol || !endCol) {
        throw std::runtime_error("Match CSV lacks start_ms/end_ms columns: " + path);
    }

    std::size_t skipped = 0;
    for (std::size_t i = 1; i < rows.size(); ++i) {
        const auto& row = rows[i];
        if (row.size() <= std::max(*startCol, *endCol)) { ++skipped; continue; }
        auto start = as_number(row[*startCol]);
        auto end = as_number(row[*endCol]);
        if (!start || !end || *end < *start) { ++skipped; continue; }
        windows.push_back({*start / 1000.0, *end / 1000.0});
    }
    if (skipped > 0) {
        std::cerr << "[mute] Warning: skipped " << skipped << " unusable row(s) in " << path << "\n";
    }
    return windows;
}

std::vector<Interval> load_mute_windows(const std::string& path, double epsilon) {
    std::vector<Interval> raw = has_json_extension(path) ? read_sidecar(path)
                                                         : read_mute_intervals_csv(path);
    return merge_intervals(std::move(raw), epsilon);
}

std::string write_mute_windows(const std::string& output_dir, const std::vector<Interval>& windows) {
    std::filesystem::path dir(output_dir);
    std::filesystem::create_directories(dir);
    const std::string path = (dir / MUTE_WINDOWS_FILE).string();

    nlohmann::json payload = nlohmann::json::array();
    for (const auto& w : windows) {
        payload.push_back(nlohmann::json{{"start", w.start}, {"end", w.end}});
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write window sidecar: " + path);
    }
    file << payload.dump(2) << "\n";
    if (!file.good()) {
        throw std::runtime_error("Failed writing window sidecar: " + path);
    }
    return path;
}

std::string build_volume_filter(const std::vector<Interval>& windows) {
    std::ostringstream enable;
    enable << std::fixed << std::setprecision(3);
    for (std::size_t i = 0; i < windows.size(); ++i) {
        if (i > 0) enable << '+';
        enable << "between(t," << windows[i].start << ',' << windows[i].end << ')';
    }
    return "volume=enable='" + enable.str() + "':volume=0";
}

} // namespace redline
