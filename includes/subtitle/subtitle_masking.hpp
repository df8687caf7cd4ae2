#pragma once

#include "catalog/term_catalog.hpp"
#include "match/match_record.hpp"
#include "storage/match_store.hpp"
#include "text/text_unit.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace redline {

inline constexpr const char* MASKED_SUBTITLES_FILE = "masked_subtitles.srt";
inline constexpr const char* MATCHES_CSV_FILE = "profanity_matches.csv";

struct MaskedUnits {
    std::vector<TextUnit> units;         // same order and timing, masked text
    std::vector<MatchRecord> records;    // unit order, then match order
    std::size_t unredacted = 0;          // matches with no visible redaction
};

struct MaskSummary {
    std::size_t units = 0;
    std::size_t unredacted = 0;
    std::vector<MatchRecord> records;
    std::string masked_path;
    std::string csv_path;                // empty when nothing matched
    std::int64_t run_id = 0;             // set only for recorded runs
};

// Throws std::runtime_error when the catalog is empty.
MaskedUnits mask_units(const std::vector<TextUnit>& units, const TermCatalog& catalog,
                       bool verbose = false);

// Reads an SRT file, masks every event and writes masked_subtitles.srt to
// output_dir (created if missing). profanity_matches.csv is written only
// when at least one match exists.
MaskSummary mask_subtitle_file(const std::string& input_path, const std::string& output_dir,
                               const TermCatalog& catalog, bool verbose = false);

// Same pass, recorded as one run in store. An empty catalog throws before
// the run is opened. A failed pass still closes its run and rethrows the
// original error; a failure to close is only logged.
MaskSummary mask_subtitle_file(const std::string& input_path, const std::string& output_dir,
                               const TermCatalog& catalog, MatchStore& store, bool verbose = false);

} // namespace redline
