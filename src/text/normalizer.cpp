#include "text/normalizer.hpp"

#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace redline {

namespace {

const icu::Normalizer2& nfkd_instance() {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfkd = icu::Normalizer2::getNFKDInstance(status);
    if (U_FAILURE(status) || nfkd == nullptr) {
        throw std::runtime_error(std::string("ICU NFKD normalizer unavailable: ") + u_errorName(status));
    }
    return *nfkd;
}

inline bool is_separator(UChar32 c) {
    return c == '-' || c == '_' || c == '\'';
}

} // namespace

std::string normalize_text(const std::string& in) {
    if (in.empty()) return {};

    icu::UnicodeString text = icu::UnicodeString::fromUTF8(in);
    text.toLower(icu::Locale::getRoot());

    UErrorCode status = U_ZERO_ERROR;
    icu::UnicodeString decomposed = nfkd_instance().normalize(text, status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("ICU normalization failed: ") + u_errorName(status));
    }

    // keep letters, map everything else to a space, then collapse
    std::u32string out;
    out.reserve(static_cast<std::size_t>(decomposed.length()));
    bool in_space = true; // swallows leading whitespace
    for (int32_t i = 0; i < decomposed.length(); ) {
        UChar32 c = decomposed.char32At(i);
        i += U16_LENGTH(c);

        if (u_getCombiningClass(c) != 0) continue;

        bool keep = !is_separator(c) && !u_isdigit(c) && u_isalnum(c);
        if (keep) {
            // decomposition can expose uppercase forms (e.g. U+210C)
            out.push_back(static_cast<char32_t>(u_tolower(c)));
            in_space = false;
        } else if (!in_space) {
            out.push_back(U' ');
            in_space = true;
        }
    }
    if (!out.empty() && out.back() == U' ') out.pop_back();

    return to_utf8(out);
}

std::vector<std::string> split_words(const std::string& normalized) {
    std::vector<std::string> words;
    std::istringstream iss(normalized);
    std::string w;
    while (iss >> w) words.push_back(w);
    return words;
}

std::u32string code_points(const std::string& utf8) {
    icu::UnicodeString u = icu::UnicodeString::fromUTF8(utf8);
    std::u32string cps;
    cps.reserve(static_cast<std::size_t>(u.length()));
    for (int32_t i = 0; i < u.length(); ) {
        UChar32 c = u.char32At(i);
        cps.push_back(static_cast<char32_t>(c));
        i += U16_LENGTH(c);
    }
    return cps;
}

std::string to_utf8(const std::u32string& cps) {
    icu::UnicodeString u = icu::UnicodeString::fromUTF32(
        reinterpret_cast<const UChar32*>(cps.data()), static_cast<int32_t>(cps.size()));
    std::string out;
    u.toUTF8String(out);
    return out;
}

} // namespace redline
