#include "match/fuzzy_matcher.hpp"

#include "text/normalizer.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>
#include <vector>

namespace redline {

namespace {

const std::vector<std::u32string>& base_suffixes() {
    static const std::vector<std::u32string> suffixes = {
        U"", U"s", U"ed", U"er", U"ing", U"in"
    };
    return suffixes;
}

const std::vector<std::u32string>& aggressive_suffixes() {
    static const std::vector<std::u32string> suffixes = [] {
        std::vector<std::u32string> all = base_suffixes();
        const std::vector<std::u32string> extra = {
            U"ly", U"ness", U"able", U"ible", U"ful", U"less", U"ward",
            U"wise", U"like", U"ish", U"ment", U"tion", U"sion"
        };
        all.insert(all.end(), extra.begin(), extra.end());
        return all;
    }();
    return suffixes;
}

// Prefixal and particle morphemes allowed to bracket an aggressive target.
const std::vector<std::u32string>& compound_particles() {
    static const std::vector<std::u32string> particles = {
        U"un", U"re", U"pre", U"mis", U"dis", U"over", U"under", U"out", U"up",
        U"down", U"back", U"fore", U"anti", U"pro", U"semi", U"multi", U"non",
        U"sub", U"super", U"inter", U"intra", U"extra", U"ultra", U"mega",
        U"mini", U"micro", U"macro"
    };
    return particles;
}

const std::unordered_set<std::string>& stop_words() {
    static const std::unordered_set<std::string> words = {
        "a", "an", "the", "and", "or", "but", "if", "then", "else",
        "of", "to", "in", "on", "for", "by", "with", "at", "from",
        "as", "is", "it", "its", "be", "are", "was", "were", "am",
        "he", "she", "they", "we", "you", "i", "me", "him", "her",
        "them", "us", "my", "your", "his", "their", "our"
    };
    return words;
}

inline bool contains(const std::u32string& haystack, const std::u32string& needle) {
    return haystack.find(needle) != std::u32string::npos;
}

std::string join_window(const std::vector<std::string>& words, std::size_t first, std::size_t count) {
    std::string out;
    for (std::size_t j = 0; j < count; ++j) {
        if (j > 0) out.push_back(' ');
        out += words[first + j];
    }
    return out;
}

} // namespace

FuzzyMatcher::FuzzyMatcher(const TermCatalog& catalog) {
    terms_.reserve(catalog.size());
    for (const auto& term : catalog.terms()) {
        PreparedTerm p;
        p.term = term;
        p.target = normalize_text(term.word);
        p.wordCount = split_words(p.target).size();
        // terms that normalize to nothing can never match
        if (p.wordCount == 0) continue;
        terms_.push_back(std::move(p));
    }
}

bool FuzzyMatcher::isStopWord(const std::string& windowText) {
    return stop_words().count(windowText) > 0;
}

double FuzzyMatcher::similarityRatio(const std::u32string& a, const std::u32string& b) {
    const std::size_t total = a.size() + b.size();
    if (total == 0) return 100.0;

    // longest common subsequence; indel distance = total - 2 * lcs
    const std::size_t n = a.size(), m = b.size();
    std::vector<std::size_t> prev(m + 1, 0), cur(m + 1, 0);
    for (std::size_t i = 1; i <= n; ++i) {
        cur[0] = 0;
        for (std::size_t j = 1; j <= m; ++j) {
            cur[j] = (a[i-1] == b[j-1]) ? prev[j-1] + 1 : std::max(prev[j], cur[j-1]);
        }
        prev.swap(cur);
    }
    const std::size_t lcs = prev[m];
    return 100.0 * static_cast<double>(2 * lcs) / static_cast<double>(total);
}

double FuzzyMatcher::scoreSingleWord(const std::u32string& query, const std::u32string& target,
                                     bool aggressive) {
    if (query == target) return 100.0;

    const auto& suffixes = aggressive ? aggressive_suffixes() : base_suffixes();
    for (const auto& suffix : suffixes) {
        if (suffix.empty()) continue;
        if (query == target + suffix || target == query + suffix) return 100.0;
    }

    if (aggressive && target.size() >= 3) {
        if (contains(query, target)) return 100.0;
        for (const auto& particle : compound_particles()) {
            if (query == particle + target || query == target + particle) return 100.0;
        }
    }

    double score = similarityRatio(query, target);

    // Typographically close words that start with a different sound are
    // usually different words.
    if (query.size() >= 3 && target.size() >= 3 &&
        query[0] != target[0] &&
        !contains(query, target) && !contains(target, query)) {
        score = std::max(0.0, score - 25.0);
    }
    return score;
}

double FuzzyMatcher::scoreWindow(const std::string& windowText, const std::string& target,
                                 bool aggressive) {
    const auto targetWords = split_words(target);
    const auto windowWords = split_words(windowText);
    if (targetWords.empty() || windowWords.empty()) return 0.0;

    if (targetWords.size() == 1 && windowWords.size() == 1) {
        return scoreSingleWord(code_points(windowText), code_points(target), aggressive);
    }
    return similarityRatio(code_points(windowText), code_points(target));
}

std::vector<MatchResult> FuzzyMatcher::findMatches(const std::string& text) const {
    std::vector<MatchResult> matches;
    if (terms_.empty()) return matches;

    const auto words = split_words(normalize_text(text));

    for (const auto& p : terms_) {
        const std::size_t k = p.wordCount;
        if (words.size() < k) continue;

        for (std::size_t i = 0; i + k <= words.size(); ++i) {
            std::string window = join_window(words, i, k);
            if (isStopWord(window)) continue;

            const double score = scoreWindow(window, p.target, p.term.aggressive);
            if (score >= p.term.threshold) {
                matches.push_back(MatchResult{p.term, std::move(window), score});
            }
        }
    }
    return matches;
}

} // namespace redline
