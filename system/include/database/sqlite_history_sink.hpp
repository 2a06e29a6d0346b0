// ============= include/database/sqlite_history_sink.hpp =============
/*
 * History Sink - SQLite Backend
 *
 * SCHEMA:
 * CREATE TABLE recognition_history (
 *   id INTEGER PRIMARY KEY AUTOINCREMENT,
 *   source TEXT,                      -- nombre de la imagen (caller)
 *   recognized_faces TEXT,            -- JSON por cara
 *   total_faces_detected INTEGER,
 *   total_faces_recognized INTEGER,
 *   processing_time REAL,             -- ms
 *   gallery_version INTEGER,
 *   warnings TEXT,                    -- separados por '\n'
 *   created_at TEXT NOT NULL          -- "2025-11-24 14:30:52.123"
 * );
 */

#pragma once
#include "database/history_sink.hpp"
#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace facematch {

struct HistoryRecord {
    int64_t id = 0;
    std::string source;
    std::string recognized_faces;   // JSON
    int total_faces_detected = 0;
    int total_faces_recognized = 0;
    double processing_time_ms = 0.0;
    uint64_t gallery_version = 0;
    std::string warnings;
    std::string created_at;
};

class SqliteHistorySink : public HistorySink {
private:
    sqlite3* db;
    std::string db_path;
    std::mutex db_mutex;
    sqlite3_stmt* insert_stmt;

    bool create_table();
    bool prepare_statements();

public:
    // Lanza RecognitionError(StorageFailure) si no puede abrir la base
    explicit SqliteHistorySink(const std::string& db_path);
    ~SqliteHistorySink();

    SqliteHistorySink(const SqliteHistorySink&) = delete;
    SqliteHistorySink& operator=(const SqliteHistorySink&) = delete;

    // Lanza RecognitionError(HistoryAppendFailure)
    void append(const RecognitionRun& run) override;

    // Mas reciente primero
    std::vector<HistoryRecord> recent(int limit = 50);
    int count_total();
};

} // namespace facematch
