#pragma once

#include <cstdint>
#include <string>

namespace redline {

// One subtitle dialogue event. Masking only ever replaces `text`.
struct TextUnit {
    std::int64_t start_ms = 0;
    std::int64_t end_ms = 0;
    std::string text;
};

} // namespace redline
