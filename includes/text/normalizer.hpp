#pragma once

#include <string>
#include <vector>

namespace redline {

// Canonical matchable form of a line of dialogue.
//
// Steps, in order:
// - lowercase
// - compatibility decomposition (NFKD) and removal of combining marks,
//   so "café" becomes "cafe"
// - hyphens, underscores and apostrophes become a space
// - any other punctuation or symbol, and every digit, becomes a space
// - whitespace runs collapse to a single space, ends are trimmed
//
// Only letters and single spaces survive, so the result is a fixed point:
// normalize_text(normalize_text(x)) == normalize_text(x).
std::string normalize_text(const std::string& in);

// Splits already normalized text on spaces.
std::vector<std::string> split_words(const std::string& normalized);

// UTF-8 <-> code points. Lengths and character comparisons in the
// matcher and masker are made on code points, never on bytes.
std::u32string code_points(const std::string& utf8);
std::string to_utf8(const std::u32string& cps);

} // namespace redline
