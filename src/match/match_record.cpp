#include "match/match_record.hpp"

namespace redline {

std::vector<MatchRecord> record_matches(const TextUnit& unit,
                                        const std::string& masked_text,
                                        const std::vector<MatchResult>& matches) {
    std::vector<MatchRecord> records;
    records.reserve(matches.size());
    for (const auto& m : matches) {
        records.push_back(MatchRecord{
            .start_ms = unit.start_ms,
            .end_ms = unit.end_ms,
            .matched_text = m.window_text,
            .target_word = m.term.word,
            .score = m.score,
            .original_text = unit.text,
            .masked_text = masked_text
        });
    }
    return records;
}

} // namespace redline
