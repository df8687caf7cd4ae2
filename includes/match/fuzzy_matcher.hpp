#pragma once

#include "catalog/term_catalog.hpp"

#include <string>
#include <vector>

namespace redline {

struct MatchResult {
    Term term;
    std::string window_text;   // contiguous run of normalized words that scored
    double score = 0.0;        // 0..100
};

// Scores every catalog term against every word window of a line.
//
// Approach:
// - Normalize the line and split it into words.
// - For a term of k normalized words, slide a k-word window one word at a
//   time. Windows that are exactly a stop-word are skipped.
// - Single-word windows against single-word terms use the morphological
//   rules (suffixes, and for aggressive terms substrings and compound
//   particles), falling back to edit similarity with a first-letter
//   penalty. Phrases use plain edit similarity.
// - Every window with score >= threshold is reported. Nothing is merged or
//   deduplicated; order is catalog order, then window position.
class FuzzyMatcher {
public:
    explicit FuzzyMatcher(const TermCatalog& catalog);

    std::vector<MatchResult> findMatches(const std::string& text) const;

    std::size_t termCount() const { return terms_.size(); }

    // Scoring primitives (public for testing). Inputs are normalized.
    static double scoreSingleWord(const std::u32string& query, const std::u32string& target,
                                  bool aggressive);
    static double scoreWindow(const std::string& windowText, const std::string& target,
                              bool aggressive);

    // InDel similarity, 100 * (1 - indel / (|a| + |b|)).
    static double similarityRatio(const std::u32string& a, const std::u32string& b);

    static bool isStopWord(const std::string& windowText);

private:
    struct PreparedTerm {
        Term term;
        std::string target;          // normalized word
        std::size_t wordCount = 0;
    };

    std::vector<PreparedTerm> terms_;
};

} // namespace redline
