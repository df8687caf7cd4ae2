#pragma once

#include "text/text_unit.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace redline {

// Parses SubRip content.
// - Blocks are separated by blank lines; the numeric index is optional.
// - Timing: HH:MM:SS,mmm --> HH:MM:SS,mmm ('.' accepted before the
//   milliseconds, trailing position hints ignored).
// - Text lines are joined with '\n'.
// A UTF-8 BOM and CRLF line endings are accepted. Blocks without a valid
// timing line are skipped with a warning.
std::vector<TextUnit> parse_srt(const std::string& content);

// Renumbers from 1 and writes one block per unit.
std::string format_srt(const std::vector<TextUnit>& units);

// Throw std::runtime_error on I/O failure.
std::vector<TextUnit> load_srt_file(const std::string& path);
void save_srt_file(const std::string& path, const std::vector<TextUnit>& units);

// "HH:MM:SS,mmm -> ms"; nullopt when the text is not a timestamp.
std::optional<std::int64_t> parse_srt_timestamp(const std::string& text);
std::string format_srt_timestamp(std::int64_t ms);

} // namespace redline
