#pragma once

#include "match/fuzzy_matcher.hpp"

#include <string>
#include <vector>

namespace redline {

struct MaskOutcome {
    std::string text;
    // Indices into the match list of matches whose window text and word
    // could not be found as whole words in the original line.
    std::vector<std::size_t> unredacted;
};

// Rewrites the original (non-normalized) line. Longest window text first;
// for each match the literal window text is tried, then the term's word.
// Every whole-word, case-insensitive occurrence becomes a run of '*' of
// the same length. A match that locates nothing is a no-op.
std::string mask_text(const std::string& original, const std::vector<MatchResult>& matches);

// Same output as mask_text, plus the matches that were not locatable.
MaskOutcome mask_with_report(const std::string& original, const std::vector<MatchResult>& matches);

// Whole-word, case-insensitive, non-overlapping occurrences of pattern.
std::size_t count_occurrences(const std::string& text, const std::string& pattern);

} // namespace redline
