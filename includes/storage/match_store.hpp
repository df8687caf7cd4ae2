#pragma once

#include "match/match_record.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <string>
#include <vector>

namespace redline {

// Optional record of masking runs and their matches.
// Schema:
//  - runs(id INTEGER PK, started_ms INTEGER, ended_ms INTEGER,
//         input_path TEXT, term_count INTEGER)
//  - matches(id INTEGER PK, run_id INTEGER, start_ms INTEGER, end_ms INTEGER,
//            matched_text TEXT, target_word TEXT, score REAL,
//            original_text TEXT, masked_text TEXT)
//
// Notes:
//  * started_ms/ended_ms are wall clock millis since the epoch.
//  * Not thread-safe; use from one thread.
//  * Every SQLite failure throws std::runtime_error.
class MatchStore {
public:
    explicit MatchStore(const std::string& dbPath);
    ~MatchStore();

    MatchStore(const MatchStore&) = delete;
    MatchStore& operator=(const MatchStore&) = delete;

    // Begins a run; returns the new run id.
    std::int64_t startRun(const std::string& inputPath, std::size_t termCount);

    // Marks end time for a run.
    void endRun(std::int64_t runId);

    // Inserts all records of a run in one transaction.
    void logMatches(std::int64_t runId, const std::vector<MatchRecord>& records);

    std::int64_t matchCount(std::int64_t runId) const;

    const std::string& path() const { return dbPath_; }

private:
    void initSchema();
    static std::int64_t nowMs();

    std::string dbPath_;
    sqlite3* db_ = nullptr;
};

} // namespace redline
