#include "timing/interval_merger.hpp"

#include "test_support.h"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr const char* kSuite = "IntervalMerger";

using redline::Interval;
using redline::test::check;
using redline::test::check_close;

bool same(const std::vector<Interval>& actual, const std::vector<Interval>& expected, const std::string& label) {
    if (actual.size() != expected.size()) {
        return check(false, kSuite, label + " (size " + std::to_string(actual.size()) +
                                    " vs " + std::to_string(expected.size()) + ")");
    }
    bool ok = true;
    for (std::size_t i = 0; i < actual.size(); ++i) {
        ok &= check_close(actual[i].start, expected[i].start, 1e-9, kSuite, label + " start " + std::to_string(i));
        ok &= check_close(actual[i].end, expected[i].end, 1e-9, kSuite, label + " end " + std::to_string(i));
    }
    return ok;
}

bool test_merge_overlapping() {
    return same(redline::merge_intervals({{1.0, 2.0}, {1.9, 2.1}, {3.0, 3.2}}),
                {{1.0, 2.1}, {3.0, 3.2}}, "overlap merge");
}

bool test_merge_unsorted_and_contained() {
    return same(redline::merge_intervals({{5.0, 6.0}, {0.0, 10.0}, {2.0, 3.0}}),
                {{0.0, 10.0}}, "contained intervals");
}

bool test_merge_epsilon() {
    bool ok = true;
    ok &= same(redline::merge_intervals({{1.0, 2.0}, {2.0005, 3.0}}), {{1.0, 3.0}}, "within default epsilon");
    ok &= same(redline::merge_intervals({{1.0, 2.0}, {2.01, 3.0}}), {{1.0, 2.0}, {2.01, 3.0}}, "beyond epsilon");
    ok &= same(redline::merge_intervals({{1.0, 2.0}, {2.4, 3.0}}, 0.5), {{1.0, 3.0}}, "custom epsilon");
    return ok;
}

bool test_merge_degenerate() {
    bool ok = true;
    ok &= check(redline::merge_intervals({}).empty(), kSuite, "empty input");
    ok &= same(redline::merge_intervals({{4.0, 4.0}}), {{4.0, 4.0}}, "zero-length interval");

    bool threw = false;
    try {
        (void)redline::merge_intervals({{2.0, 1.0}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ok &= check(threw, kSuite, "end before start throws");

    bool rejected_nan = false;
    try {
        (void)redline::merge_intervals({{1.0, 2.0}, {std::nan(""), 3.0}});
    } catch (const std::invalid_argument&) {
        rejected_nan = true;
    }
    ok &= check(rejected_nan, kSuite, "nan bound throws");

    bool rejected_inf = false;
    try {
        (void)redline::merge_intervals({{1.0, std::numeric_limits<double>::infinity()}});
    } catch (const std::invalid_argument&) {
        rejected_inf = true;
    }
    ok &= check(rejected_inf, kSuite, "infinite bound throws");
    return ok;
}

bool test_merge_idempotent() {
    const auto once = redline::merge_intervals({{0.5, 1.0}, {0.2, 0.7}, {3.0, 4.0}, {3.9, 5.0}});
    return same(redline::merge_intervals(once), once, "merge of merged");
}

bool test_gaps() {
    const std::vector<Interval> merged = {{1.0, 2.1}, {3.0, 3.2}};
    bool ok = true;
    ok &= same(redline::extract_gaps(merged, 10.0, 0.0, 10),
               {{0.0, 1.0}, {2.1, 3.0}, {3.2, 10.0}}, "all gaps");
    ok &= same(redline::extract_gaps(merged, 10.0, 1.0, 10),
               {{0.0, 1.0}, {3.2, 10.0}}, "gaps at least one second");
    ok &= same(redline::extract_gaps(merged, 10.0, 0.0, 2),
               {{0.0, 1.0}, {2.1, 3.0}}, "capped count");
    ok &= same(redline::extract_gaps(merged, 3.1, 0.0, 10),
               {{0.0, 1.0}, {2.1, 3.0}}, "window past total");
    ok &= same(redline::extract_gaps({}, 4.0, 0.0, 10), {{0.0, 4.0}}, "nothing muted");
    ok &= check(redline::extract_gaps({{0.0, 5.0}}, 5.0, 0.0, 10).empty(), kSuite, "everything muted");
    return ok;
}

bool test_control_spans() {
    const std::vector<Interval> merged = {{1.0, 2.1}, {3.0, 3.2}};
    bool ok = true;
    ok &= same(redline::select_control_spans(merged, 10.0),
               {{0.0, 1.0}, {3.2, 4.2}}, "default sample length");
    ok &= same(redline::select_control_spans(merged, 10.0, 0.5, 1), {{0.0, 0.5}}, "one sample");
    ok &= check(redline::select_control_spans({{0.0, 10.0}}, 10.0).empty(), kSuite, "no room for samples");
    return ok;
}

} // namespace

int main() {
    bool ok = true;
    ok &= test_merge_overlapping();
    ok &= test_merge_unsorted_and_contained();
    ok &= test_merge_epsilon();
    ok &= test_merge_degenerate();
    ok &= test_merge_idempotent();
    ok &= test_gaps();
    ok &= test_control_spans();
    return ok ? 0 : 1;
}
