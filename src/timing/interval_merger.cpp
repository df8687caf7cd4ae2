#include "timing/interval_merger.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace redline {

std::vector<Interval> merge_intervals(std::vector<Interval> intervals, double epsilon) {
    std::vector<Interval> merged;
    if (intervals.empty()) return merged;

    for (const auto& iv : intervals) {
        if (!std::isfinite(iv.start) || !std::isfinite(iv.end)) {
            throw std::invalid_argument("Interval bounds must be finite");
        }
        if (iv.end < iv.start) {
            throw std::invalid_argument("Interval end before start: " +
                                        std::to_string(iv.start) + " > " + std::to_string(iv.end));
        }
    }

    std::sort(intervals.begin(), intervals.end(), [](const Interval& a, const Interval& b) {
        if (a.start != b.start) return a.start < b.start;
        return a.end < b.end;
    });

    Interval current = intervals.front();
    for (std::size_t i = 1; i < intervals.size(); ++i) {
        const auto& iv = intervals[i];
        if (iv.start <= current.end + epsilon) {
            current.end = std::max(current.end, iv.end);
        } else {
            merged.push_back(current);
            current = iv;
        }
    }
    merged.push_back(current);
    return merged;
}

std::vector<Interval> extract_gaps(const std::vector<Interval>& merged, double total,
                                   double min_length, std::size_t max_count) {
    std::vector<Interval> gaps;
    if (max_count == 0 || total <= 0.0) return gaps;

    auto take = [&](double from, double to) {
        const double len = to - from;
        if (len > 0.0 && len >= min_length) gaps.push_back({from, to});
    };

    double cursor = 0.0;
    for (const auto& w : merged) {
        if (cursor >= total) break;
        take(cursor, std::min(w.start, total));
        cursor = std::max(cursor, w.end);
        if (gaps.size() >= max_count) return gaps;
    }
    if (cursor < total) take(cursor, total);

    if (gaps.size() > max_count) gaps.resize(max_count);
    return gaps;
}

std::vector<Interval> select_control_spans(const std::vector<Interval>& merged, double total,
                                           double sample_len, std::size_t max_samples) {
    std::vector<Interval> spans = extract_gaps(merged, total, sample_len, max_samples);
    for (auto& s : spans) {
        s.end = std::min(s.start + sample_len, s.end);
    }
    return spans;
}

} // namespace redline
