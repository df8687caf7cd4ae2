#pragma once

#include <cstddef>
#include <vector>

namespace redline {

inline constexpr double DEFAULT_MERGE_EPSILON = 0.001;   // seconds
inline constexpr double DEFAULT_CONTROL_SAMPLE_LEN = 1.0; // seconds
inline constexpr std::size_t DEFAULT_CONTROL_MAX_SAMPLES = 5;

struct Interval {
    double start = 0.0;   // seconds
    double end = 0.0;     // seconds, >= start
};

// Sorts by (start, end) and folds every interval whose start is within
// epsilon of the running end. Throws std::invalid_argument on end < start
// or a non-finite bound.
std::vector<Interval> merge_intervals(std::vector<Interval> intervals,
                                      double epsilon = DEFAULT_MERGE_EPSILON);

// Maximal gaps of [0, total] not covered by `merged` (which must already be
// merged), keeping those at least min_length long, at most max_count.
std::vector<Interval> extract_gaps(const std::vector<Interval>& merged, double total,
                                   double min_length, std::size_t max_count);

// The first sample_len seconds of each gap long enough to hold one.
std::vector<Interval> select_control_spans(const std::vector<Interval>& merged, double total,
                                           double sample_len = DEFAULT_CONTROL_SAMPLE_LEN,
                                           std::size_t max_samples = DEFAULT_CONTROL_MAX_SAMPLES);

} // namespace redline
