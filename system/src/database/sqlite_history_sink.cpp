// ============= src/database/sqlite_history_sink.cpp =============
#include "database/sqlite_history_sink.hpp"
#include "database/sqlite_utils.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

namespace facematch {

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

SqliteHistorySink::SqliteHistorySink(const std::string& db_path)
    : db(nullptr), db_path(db_path), insert_stmt(nullptr)
{
    db = open_database(db_path);

    if (!create_table() || !prepare_statements()) {
        sqlite3_close(db);
        db = nullptr;
        throw RecognitionError(ErrorCode::StorageFailure,
                               "cannot initialise history table in " + db_path);
    }

    spdlog::info("📝 History sink ready: {} ({} runs)", db_path, count_total());
}

SqliteHistorySink::~SqliteHistorySink() {
    if (insert_stmt) sqlite3_finalize(insert_stmt);
    if (db) sqlite3_close(db);
}

// ==================== INITIALIZATION ====================

bool SqliteHistorySink::create_table() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS recognition_history (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            source TEXT,
            recognized_faces TEXT,
            total_faces_detected INTEGER DEFAULT 0,
            total_faces_recognized INTEGER DEFAULT 0,
            processing_time REAL,
            gallery_version INTEGER,
            warnings TEXT,
            created_at TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_history_created ON recognition_history(created_at);
    )";
    return exec_sql(db, sql);
}

bool SqliteHistorySink::prepare_statements() {
    const char* sql = R"(
        INSERT INTO recognition_history
            (source, recognized_faces, total_faces_detected, total_faces_recognized,
             processing_time, gallery_version, warnings, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )";

    int rc = sqlite3_prepare_v2(db, sql, -1, &insert_stmt, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db));
        return false;
    }
    return true;
}

// ==================== APPEND ====================

void SqliteHistorySink::append(const RecognitionRun& run) {
    std::string faces = faces_to_json(run.per_face_results);
    std::string created_at = format_timestamp(run.timestamp);

    std::string warnings;
    for (size_t i = 0; i < run.warnings.size(); i++) {
        if (i > 0) warnings += "\n";
        warnings += run.warnings[i];
    }

    std::lock_guard<std::mutex> lock(db_mutex);

    sqlite3_reset(insert_stmt);
    sqlite3_clear_bindings(insert_stmt);
    sqlite3_bind_text(insert_stmt, 1, run.source.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt, 2, faces.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(insert_stmt, 3, run.total_detected);
    sqlite3_bind_int(insert_stmt, 4, run.total_recognized);
    sqlite3_bind_double(insert_stmt, 5, run.processing_duration_ms);
    sqlite3_bind_int64(insert_stmt, 6, static_cast<sqlite3_int64>(run.gallery_version));
    sqlite3_bind_text(insert_stmt, 7, warnings.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt, 8, created_at.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(insert_stmt);
    if (rc != SQLITE_DONE) {
        throw RecognitionError(ErrorCode::HistoryAppendFailure, sqlite3_errmsg(db));
    }
}

// ==================== QUERIES ====================

std::vector<HistoryRecord> SqliteHistorySink::recent(int limit) {
    std::lock_guard<std::mutex> lock(db_mutex);

    const char* sql = R"(
        SELECT id, source, recognized_faces, total_faces_detected, total_faces_recognized,
               processing_time, gallery_version, warnings, created_at
        FROM recognition_history
        ORDER BY id DESC
        LIMIT ?
    )";

    std::vector<HistoryRecord> records;
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("Failed to prepare query: {}", sqlite3_errmsg(db));
        return records;
    }

    sqlite3_bind_int(stmt, 1, limit);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        HistoryRecord r;
        r.id = sqlite3_column_int64(stmt, 0);
        r.source = column_text(stmt, 1);
        r.recognized_faces = column_text(stmt, 2);
        r.total_faces_detected = sqlite3_column_int(stmt, 3);
        r.total_faces_recognized = sqlite3_column_int(stmt, 4);
        r.processing_time_ms = sqlite3_column_double(stmt, 5);
        r.gallery_version = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
        r.warnings = column_text(stmt, 7);
        r.created_at = column_text(stmt, 8);
        records.push_back(std::move(r));
    }

    sqlite3_finalize(stmt);
    return records;
}

int SqliteHistorySink::count_total() {
    std::lock_guard<std::mutex> lock(db_mutex);

    const char* sql = "SELECT COUNT(*) FROM recognition_history";
    sqlite3_stmt* stmt;

    int count = 0;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            count = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }
    return count;
}

} // namespace facematch
