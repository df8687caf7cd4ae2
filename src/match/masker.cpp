#include "match/masker.hpp"

#include "text/normalizer.hpp"

#include <unicode/uchar.h>

#include <algorithm>
#include <numeric>

namespace redline {

namespace {

inline bool is_word_char(char32_t c) {
    return c == U'_' || u_isalnum(static_cast<UChar32>(c));
}

// simple (one-to-one) case folding keeps lengths intact and folds
// variants like U+017F long s onto the letter the normalizer produces
inline char32_t fold(char32_t c) {
    return static_cast<char32_t>(u_foldCase(static_cast<UChar32>(c), U_FOLD_CASE_DEFAULT));
}

bool at_boundary(const std::u32string& text, std::size_t pos) {
    const bool before = pos > 0 && is_word_char(text[pos - 1]);
    const bool after = pos < text.size() && is_word_char(text[pos]);
    return before != after;
}

// Left-to-right, non-overlapping, \bpattern\b semantics.
std::vector<std::size_t> find_whole_words(const std::u32string& text, const std::u32string& pattern) {
    std::vector<std::size_t> hits;
    if (pattern.empty() || pattern.size() > text.size()) return hits;

    std::size_t pos = 0;
    while (pos + pattern.size() <= text.size()) {
        bool equal = true;
        for (std::size_t k = 0; k < pattern.size(); ++k) {
            if (fold(text[pos + k]) != fold(pattern[k])) { equal = false; break; }
        }
        if (equal && at_boundary(text, pos) && at_boundary(text, pos + pattern.size())) {
            hits.push_back(pos);
            pos += pattern.size();
        } else {
            ++pos;
        }
    }
    return hits;
}

} // namespace

MaskOutcome mask_with_report(const std::string& original, const std::vector<MatchResult>& matches) {
    MaskOutcome outcome;
    if (matches.empty()) {
        outcome.text = original;
        return outcome;
    }

    const std::u32string source = code_points(original);
    std::u32string masked = source;

    std::vector<std::size_t> order(matches.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::vector<std::size_t> windowLength(matches.size());
    for (std::size_t i = 0; i < matches.size(); ++i) {
        windowLength[i] = code_points(matches[i].window_text).size();
    }
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return windowLength[a] > windowLength[b];
    });

    for (std::size_t idx : order) {
        const auto& match = matches[idx];
        for (const std::string* pattern : {&match.window_text, &match.term.word}) {
            if (pattern->empty()) continue;
            const std::u32string needle = code_points(*pattern);
            const auto hits = find_whole_words(masked, needle);
            for (std::size_t pos : hits) {
                std::fill_n(masked.begin() + static_cast<std::ptrdiff_t>(pos), needle.size(), U'*');
            }
            if (!hits.empty()) break;
        }
    }

    // A later match of an already masked run is still redacted; only
    // matches that never existed in the original line count as lost.
    for (std::size_t i = 0; i < matches.size(); ++i) {
        const auto& match = matches[i];
        const bool located =
            !find_whole_words(source, code_points(match.window_text)).empty() ||
            !find_whole_words(source, code_points(match.term.word)).empty();
        if (!located) outcome.unredacted.push_back(i);
    }

    outcome.text = to_utf8(masked);
    return outcome;
}

std::string mask_text(const std::string& original, const std::vector<MatchResult>& matches) {
    return mask_with_report(original, matches).text;
}

std::size_t count_occurrences(const std::string& text, const std::string& pattern) {
    return find_whole_words(code_points(text), code_points(pattern)).size();
}

} // namespace redline
