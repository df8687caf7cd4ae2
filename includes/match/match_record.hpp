#pragma once

#include "match/fuzzy_matcher.hpp"
#include "text/text_unit.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace redline {

// Flat form of a match, one per match, consumed by mute planning.
struct MatchRecord {
    std::int64_t start_ms = 0;
    std::int64_t end_ms = 0;
    std::string matched_text;    // normalized window text
    std::string target_word;     // term word as configured
    double score = 0.0;
    std::string original_text;
    std::string masked_text;
};

// Column order of the record stream.
inline const std::vector<std::string>& match_csv_columns() {
    static const std::vector<std::string> columns = {
        "start_ms", "end_ms", "matched_text", "target_word",
        "score", "original_text", "masked_text"
    };
    return columns;
}

// One record per match; time bounds and both text snapshots are copied
// from the unit.
std::vector<MatchRecord> record_matches(const TextUnit& unit,
                                        const std::string& masked_text,
                                        const std::vector<MatchResult>& matches);

} // namespace redline
