#pragma once

#include "timing/interval_merger.hpp"

#include <string>
#include <vector>

namespace redline {

inline constexpr const char* MUTE_WINDOWS_FILE = "mute_windows.json";

// Reads start_ms/end_ms from a match CSV by header name, in seconds.
// Rows whose values do not parse, are not finite, or end before they
// start are skipped.
// Throws std::runtime_error if the file cannot be read.
std::vector<Interval> read_mute_intervals_csv(const std::string& path);

// Reads a JSON sidecar (array of {"start", "end"} seconds) when the path
// ends in .json, a match CSV otherwise; the result is merged.
std::vector<Interval> load_mute_windows(const std::string& path,
                                        double epsilon = DEFAULT_MERGE_EPSILON);

// Writes mute_windows.json into output_dir and returns its path.
std::string write_mute_windows(const std::string& output_dir, const std::vector<Interval>& windows);

// volume=enable='between(t,S,E)+...':volume=0 for the transcoder.
std::string build_volume_filter(const std::vector<Interval>& windows);

} // namespace redline
