#pragma once

#include "match/match_record.hpp"

#include <string>
#include <vector>

namespace redline {

// RFC 4180 record stream: header row, then one row per record in
// match_csv_columns() order. Fields holding a comma, quote, CR or LF are
// quoted with doubled quotes; rows end with CRLF.
std::string format_match_csv(const std::vector<MatchRecord>& records);

// Throws std::runtime_error if the file cannot be written.
void write_match_csv(const std::string& path, const std::vector<MatchRecord>& records);

// Splits CSV content into rows of fields. Quoted fields may span lines.
std::vector<std::vector<std::string>> parse_csv(const std::string& content);

// Shortest text that reads back as the same double, "100.0" style for
// integral values.
std::string format_score(double score);

} // namespace redline
