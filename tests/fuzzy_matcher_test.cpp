#include "match/fuzzy_matcher.hpp"

#include "test_support.h"

#include <string>
#include <vector>

namespace {

constexpr const char* kSuite = "FuzzyMatcher";

using redline::FuzzyMatcher;
using redline::MatchResult;
using redline::Term;
using redline::TermCatalog;
using redline::test::check;
using redline::test::check_close;
using redline::test::check_equal;

TermCatalog catalog_of(std::vector<Term> terms) {
    return TermCatalog(std::move(terms));
}

bool test_exact_word() {
    const FuzzyMatcher matcher(catalog_of({{"damn", 85.0, false}}));
    const auto matches = matcher.findMatches("This is damn funny");
    bool ok = check(matches.size() == 1, kSuite, "exact word: one match");
    if (!ok) return false;
    ok &= check_equal(matches[0].window_text, "damn", kSuite, "exact word window");
    ok &= check_close(matches[0].score, 100.0, 1e-9, kSuite, "exact word score");
    ok &= check_equal(matches[0].term.word, "damn", kSuite, "term carried");
    return ok;
}

bool test_unrelated_derivation_rejected() {
    const FuzzyMatcher matcher(catalog_of({{"damn", 85.0, false}}));
    return check(matcher.findMatches("That damnation is wrong").empty(), kSuite,
                 "damnation is not a variant of damn");
}

bool test_suffix_variants() {
    const FuzzyMatcher matcher(catalog_of({{"damn", 85.0, false}}));
    bool ok = true;

    const auto damned = matcher.findMatches("He was damned");
    ok &= check(damned.size() == 1, kSuite, "damned: one match");
    if (damned.size() == 1) {
        ok &= check_equal(damned[0].window_text, "damned", kSuite, "damned window");
        ok &= check_close(damned[0].score, 100.0, 1e-9, kSuite, "damned score");
    }

    const auto damning = matcher.findMatches("Stop damning him");
    ok &= check(damning.size() == 1 && damning[0].window_text == "damning", kSuite, "damning matches");

    const auto damns = matcher.findMatches("Damns!");
    ok &= check(damns.size() == 1 && damns[0].window_text == "damns", kSuite, "plural suffix");
    return ok;
}

bool test_aggressive_substring() {
    bool ok = true;
    const FuzzyMatcher aggressive(catalog_of({{"use", 85.0, true}}));
    const auto matches = aggressive.findMatches("They misuse the system");
    bool found = false;
    for (const auto& m : matches) {
        if (m.window_text == "misuse" && m.score == 100.0) found = true;
    }
    ok &= check(found, kSuite, "aggressive term matches inside misuse");

    const FuzzyMatcher plain(catalog_of({{"use", 85.0, false}}));
    ok &= check(plain.findMatches("They misuse the system").empty(), kSuite,
                "non-aggressive term does not match misuse");
    return ok;
}

bool test_aggressive_placement_and_reuse() {
    bool ok = true;
    const FuzzyMatcher place(catalog_of({{"place", 85.0, true}}));
    const auto placement = place.findMatches("We need placement");
    ok &= check(placement.size() == 1 && placement[0].window_text == "placement", kSuite,
                "aggressive suffix ment");

    const FuzzyMatcher use(catalog_of({{"use", 85.0, true}}));
    const auto reuse = use.findMatches("We reuse it");
    ok &= check(reuse.size() == 1 && reuse[0].window_text == "reuse", kSuite, "aggressive compound re");
    return ok;
}

bool test_aggressive_suffixes() {
    bool ok = true;
    ok &= check_close(FuzzyMatcher::scoreSingleWord(U"hopeless", U"hope", true), 100.0, 1e-9,
                      kSuite, "aggressive suffix less");
    ok &= check(FuzzyMatcher::scoreSingleWord(U"hopeless", U"hope", false) < 85.0,
                kSuite, "less is not a base suffix");
    ok &= check_close(FuzzyMatcher::scoreSingleWord(U"damn", U"damned", false), 100.0, 1e-9,
                      kSuite, "suffix works in both directions");
    return ok;
}

bool test_short_aggressive_targets_skip_substring() {
    // substring and compound rules need a target of at least three letters
    const double score = FuzzyMatcher::scoreSingleWord(U"undo", U"do", true);
    return check(score < 100.0, kSuite, "two-letter aggressive target is not a substring match");
}

bool test_first_letter_penalty() {
    bool ok = true;
    const double raw = FuzzyMatcher::similarityRatio(U"bat", U"cat");
    ok &= check_close(raw, 200.0 / 3.0, 1e-6, kSuite, "ratio bat/cat");
    ok &= check_close(FuzzyMatcher::scoreSingleWord(U"bat", U"cat", false), 200.0 / 3.0 - 25.0, 1e-6,
                      kSuite, "different first letter penalized");
    ok &= check_close(FuzzyMatcher::scoreSingleWord(U"cart", U"cat", false),
                      FuzzyMatcher::similarityRatio(U"cart", U"cat"), 1e-9,
                      kSuite, "same first letter not penalized");
    return ok;
}

bool test_similarity_ratio() {
    bool ok = true;
    ok &= check_close(FuzzyMatcher::similarityRatio(U"", U""), 100.0, 1e-9, kSuite, "both empty");
    ok &= check_close(FuzzyMatcher::similarityRatio(U"abc", U""), 0.0, 1e-9, kSuite, "one empty");
    ok &= check_close(FuzzyMatcher::similarityRatio(U"damnation", U"damn"), 800.0 / 13.0, 1e-6,
                      kSuite, "damnation/damn");
    ok &= check_close(FuzzyMatcher::similarityRatio(U"abc", U"cba"), FuzzyMatcher::similarityRatio(U"cba", U"abc"),
                      1e-9, kSuite, "symmetric");
    return ok;
}

bool test_stop_words_never_match() {
    bool ok = true;
    const FuzzyMatcher matcher(catalog_of({{"the", 0.0, false}, {"then", 85.0, false}}));
    const auto matches = matcher.findMatches("the end");
    for (const auto& m : matches) {
        ok &= check(m.window_text != "the", kSuite, "stop word window skipped");
    }
    ok &= check(FuzzyMatcher::isStopWord("the"), kSuite, "the is a stop word");
    ok &= check(!FuzzyMatcher::isStopWord("damn"), kSuite, "damn is not a stop word");
    return ok;
}

bool test_phrase_terms() {
    const FuzzyMatcher matcher(catalog_of({{"go to hell", 85.0, false}}));
    bool ok = true;
    const auto matches = matcher.findMatches("Just go to hell, now!");
    ok &= check(matches.size() == 1, kSuite, "phrase: one window");
    if (matches.size() == 1) {
        ok &= check_equal(matches[0].window_text, "go to hell", kSuite, "phrase window");
        ok &= check_close(matches[0].score, 100.0, 1e-9, kSuite, "phrase score");
    }
    ok &= check(matcher.findMatches("go to").empty(), kSuite, "line shorter than phrase");
    return ok;
}

bool test_every_window_reported() {
    const FuzzyMatcher matcher(catalog_of({{"damn", 85.0, false}}));
    const auto matches = matcher.findMatches("Damn, damn, DAMN!");
    bool ok = check(matches.size() == 3, kSuite, "three separate occurrences");
    for (const auto& m : matches) {
        ok &= check_equal(m.window_text, "damn", kSuite, "normalized window");
    }
    return ok;
}

bool test_catalog_order_then_position() {
    const FuzzyMatcher matcher(catalog_of({{"hell", 85.0, false}, {"damn", 85.0, false}}));
    const auto matches = matcher.findMatches("damn this hell");
    bool ok = check(matches.size() == 2, kSuite, "two terms matched");
    if (matches.size() == 2) {
        ok &= check_equal(matches[0].term.word, "hell", kSuite, "first catalog term first");
        ok &= check_equal(matches[1].term.word, "damn", kSuite, "second catalog term second");
    }
    return ok;
}

bool test_thresholds_per_term() {
    bool ok = true;
    const FuzzyMatcher strict(catalog_of({{"damn", 85.0, false}}));
    ok &= check(strict.findMatches("darn it").empty(), kSuite, "darn below default threshold");

    const FuzzyMatcher loose(catalog_of({{"damn", 70.0, false}}));
    const auto matches = loose.findMatches("darn it");
    ok &= check(matches.size() == 1 && matches[0].window_text == "darn", kSuite, "darn within 70");
    if (matches.size() == 1) {
        ok &= check_close(matches[0].score, 75.0, 1e-9, kSuite, "darn score");
    }

    const FuzzyMatcher twice(catalog_of({{"damn", 80.0, false}, {"damn", 95.0, false}}));
    ok &= check(twice.findMatches("damn").size() == 2, kSuite, "duplicate terms both report");
    return ok;
}

bool test_threshold_boundary_inclusive() {
    // ratio of dam/damn is 6/7 of 100
    const double score = FuzzyMatcher::scoreSingleWord(U"dam", U"damn", false);
    const FuzzyMatcher matcher(catalog_of({{"damn", score, false}}));
    return check(matcher.findMatches("dam").size() == 1, kSuite, "score equal to threshold matches");
}

bool test_empty_inputs() {
    bool ok = true;
    const FuzzyMatcher matcher(catalog_of({{"damn", 85.0, false}, {"!!!", 0.0, false}}));
    ok &= check(matcher.termCount() == 1, kSuite, "terms normalizing to nothing are dropped");
    ok &= check(matcher.findMatches("").empty(), kSuite, "empty line");
    ok &= check(matcher.findMatches("  ...  ").empty(), kSuite, "punctuation only");

    const FuzzyMatcher none(TermCatalog{});
    ok &= check(none.findMatches("damn").empty(), kSuite, "empty catalog");
    return ok;
}

bool test_accented_text() {
    const FuzzyMatcher matcher(catalog_of({{"cafe", 85.0, false}}));
    const auto matches = matcher.findMatches("Un café noir");
    return check(matches.size() == 1 && matches[0].window_text == "cafe", kSuite,
                 "diacritics stripped before matching");
}

} // namespace

int main() {
    bool ok = true;
    ok &= test_exact_word();
    ok &= test_unrelated_derivation_rejected();
    ok &= test_suffix_variants();
    ok &= test_aggressive_substring();
    ok &= test_aggressive_placement_and_reuse();
    ok &= test_aggressive_suffixes();
    ok &= test_short_aggressive_targets_skip_substring();
    ok &= test_first_letter_penalty();
    ok &= test_similarity_ratio();
    ok &= test_stop_words_never_match();
    ok &= test_phrase_terms();
    ok &= test_every_window_reported();
    ok &= test_catalog_order_then_position();
    ok &= test_thresholds_per_term();
    ok &= test_threshold_boundary_inclusive();
    ok &= test_empty_inputs();
    ok &= test_accented_text();
    return ok ? 0 : 1;
}
