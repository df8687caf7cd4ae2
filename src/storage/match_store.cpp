#include "storage/match_store.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace redline {

namespace {

void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQLite exec failed: " + msg);
    }
}

struct StatementDeleter {
    void operator()(sqlite3_stmt* st) const { if (st) sqlite3_finalize(st); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        sqlite3_finalize(st);
        throw std::runtime_error(std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
    }
    return Statement(st);
}

void bind_text(sqlite3* db, sqlite3_stmt* st, int idx, const std::string& value) {
    if (sqlite3_bind_text(st, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
        throw std::runtime_error(std::string("SQLite bind failed: ") + sqlite3_errmsg(db));
    }
}

void bind_int64(sqlite3* db, sqlite3_stmt* st, int idx, std::int64_t value) {
    if (sqlite3_bind_int64(st, idx, value) != SQLITE_OK) {
        throw std::runtime_error(std::string("SQLite bind failed: ") + sqlite3_errmsg(db));
    }
}

void step_done(sqlite3* db, sqlite3_stmt* st, const char* what) {
    if (sqlite3_step(st) != SQLITE_DONE) {
        throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
    }
}

} // namespace

MatchStore::MatchStore(const std::string& dbPath) : dbPath_(dbPath) {
    std::filesystem::path p(dbPath);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
    if (sqlite3_open(dbPath.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open SQLite DB at " + dbPath + ": " + msg);
    }
    try {
        initSchema();
    } catch (const std::exception&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

MatchStore::~MatchStore() {
    if (db_) sqlite3_close(db_);
}

void MatchStore::initSchema() {
    const char* schema = R"SQL(
    PRAGMA journal_mode=WAL;
    CREATE TABLE IF NOT EXISTS runs (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        started_ms INTEGER NOT NULL,
        ended_ms INTEGER,
        input_path TEXT NOT NULL,
        term_count INTEGER NOT NULL DEFAULT 0
    );
    CREATE TABLE IF NOT EXISTS matches (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        run_id INTEGER NOT NULL,
        start_ms INTEGER NOT NULL,
        end_ms INTEGER NOT NULL,
        matched_text TEXT NOT NULL,
        target_word TEXT NOT NULL,
        score REAL NOT NULL,
        original_text TEXT NOT NULL,
        masked_text TEXT NOT NULL,
        FOREIGN KEY(run_id) REFERENCES runs(id)
    );
    CREATE INDEX IF NOT EXISTS idx_matches_run ON matches(run_id);
    )SQL";
    exec_sql(db_, schema);
}

std::int64_t MatchStore::nowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::int64_t MatchStore::startRun(const std::string& inputPath, std::size_t termCount) {
    Statement st = prepare(db_, "INSERT INTO runs (started_ms, input_path, term_count) VALUES (?, ?, ?);");
    bind_int64(db_, st.get(), 1, nowMs());
    bind_text(db_, st.get(), 2, inputPath);
    bind_int64(db_, st.get(), 3, static_cast<std::int64_t>(termCount));
    step_done(db_, st.get(), "Failed to insert run");
    return sqlite3_last_insert_rowid(db_);
}

void MatchStore::endRun(std::int64_t runId) {
    Statement st = prepare(db_, "UPDATE runs SET ended_ms=? WHERE id=?;");
    bind_int64(db_, st.get(), 1, nowMs());
    bind_int64(db_, st.get(), 2, runId);
    step_done(db_, st.get(), "Failed to end run");
}

void MatchStore::logMatches(std::int64_t runId, const std::vector<MatchRecord>& records) {
    exec_sql(db_, "BEGIN;");
    try {
        Statement st = prepare(db_,
            "INSERT INTO matches (run_id, start_ms, end_ms, matched_text, target_word, score, "
            "original_text, masked_text) VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
        for (const auto& r : records) {
            bind_int64(db_, st.get(), 1, runId);
            bind_int64(db_, st.get(), 2, r.start_ms);
            bind_int64(db_, st.get(), 3, r.end_ms);
            bind_text(db_, st.get(), 4, r.matched_text);
            bind_text(db_, st.get(), 5, r.target_word);
            if (sqlite3_bind_double(st.get(), 6, r.score) != SQLITE_OK) {
                throw std::runtime_error(std::string("SQLite bind failed: ") + sqlite3_errmsg(db_));
            }
            bind_text(db_, st.get(), 7, r.original_text);
            bind_text(db_, st.get(), 8, r.masked_text);
            step_done(db_, st.get(), "Failed to insert match");
            sqlite3_reset(st.get());
        }
        exec_sql(db_, "COMMIT;");
    } catch (const std::exception&) {
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
            std::cerr << "[store] Rollback failed: " << (err ? err : "unknown error") << "\n";
            sqlite3_free(err);
        }
        throw;
    }
}

std::int64_t MatchStore::matchCount(std::int64_t runId) const {
    Statement st = prepare(db_, "SELECT COUNT(*) FROM matches WHERE run_id=?;");
    bind_int64(db_, st.get(), 1, runId);
    if (sqlite3_step(st.get()) != SQLITE_ROW) {
        throw std::runtime_error(std::string("Failed to count matches: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_column_int64(st.get(), 0);
}

} // namespace redline
