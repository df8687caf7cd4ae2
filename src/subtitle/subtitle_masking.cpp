#include "subtitle/subtitle_masking.hpp"

#include "match/fuzzy_matcher.hpp"
#include "match/masker.hpp"
#include "match/match_csv.hpp"
#include "subtitle/srt_file.hpp"

#include <filesystem>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace redline {

namespace {

void close_failed_run(MatchStore& store, std::int64_t run_id) {
    try {
        store.endRun(run_id);
    } catch (const std::exception& e) {
        std::cerr << "[store] Warning: could not close run " << run_id << ": " << e.what() << "\n";
    }
}

} // namespace

MaskedUnits mask_units(const std::vector<TextUnit>& units, const TermCatalog& catalog, bool verbose) {
    if (catalog.empty()) {
        throw std::runtime_error("No terms configured");
    }

    const FuzzyMatcher matcher(catalog);
    MaskedUnits out;
    out.units.reserve(units.size());

    for (const auto& unit : units) {
        const auto matches = matcher.findMatches(unit.text);
        const MaskOutcome masked = mask_with_report(unit.text, matches);

        for (std::size_t idx : masked.unredacted) {
            std::cerr << "[mask] Warning: match '" << matches[idx].window_text
                      << "' (term '" << matches[idx].term.word << "') at "
                      << unit.start_ms << " ms could not be located in the original text\n";
        }
        out.unredacted += masked.unredacted.size();

        if (verbose) {
            for (const auto& m : matches) {
                std::cout << "[mask] " << unit.start_ms << "-" << unit.end_ms << " ms: '"
                          << m.window_text << "' ~ '" << m.term.word << "' score " << m.score << "\n";
            }
        }

        auto records = record_matches(unit, masked.text, matches);
        out.records.insert(out.records.end(),
                           std::make_move_iterator(records.begin()),
                           std::make_move_iterator(records.end()));

        TextUnit rewritten = unit;
        rewritten.text = masked.text;
        out.units.push_back(std::move(rewritten));
    }
    return out;
}

MaskSummary mask_subtitle_file(const std::string& input_path, const std::string& output_dir,
                               const TermCatalog& catalog, bool verbose) {
    if (catalog.empty()) {
        throw std::runtime_error("No terms configured for " + input_path);
    }
    std::cout << "[mask] Using " << catalog.size() << " terms\n";

    const auto units = load_srt_file(input_path);
    MaskedUnits masked = mask_units(units, catalog, verbose);

    std::filesystem::path dir(output_dir);
    std::filesystem::create_directories(dir);

    MaskSummary summary;
    summary.units = masked.units.size();
    summary.unredacted = masked.unredacted;
    summary.masked_path = (dir / MASKED_SUBTITLES_FILE).string();
    save_srt_file(summary.masked_path, masked.units);
    std::cout << "[mask] Masked subtitles saved to " << summary.masked_path << "\n";

    if (!masked.records.empty()) {
        summary.csv_path = (dir / MATCHES_CSV_FILE).string();
        write_match_csv(summary.csv_path, masked.records);
        std::cout << "[mask] Match CSV saved to " << summary.csv_path
                  << " (" << masked.records.size() << " rows)\n";
    } else {
        std::cout << "[mask] No matches found; CSV not written\n";
    }

    summary.records = std::move(masked.records);
    return summary;
}

MaskSummary mask_subtitle_file(const std::string& input_path, const std::string& output_dir,
                               const TermCatalog& catalog, MatchStore& store, bool verbose) {
    if (catalog.empty()) {
        throw std::runtime_error("No terms configured for " + input_path);
    }

    const auto run_id = store.startRun(input_path, catalog.size());
    MaskSummary summary;
    try {
        summary = mask_subtitle_file(input_path, output_dir, catalog, verbose);
        store.logMatches(run_id, summary.records);
    } catch (const std::exception&) {
        close_failed_run(store, run_id);
        throw;
    }
    store.endRun(run_id);
    summary.run_id = run_id;
    return summary;
}

} // namespace redline
