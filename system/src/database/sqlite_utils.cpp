// ============= src/database/sqlite_utils.cpp =============
#include "database/sqlite_utils.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>

namespace facematch {

sqlite3* open_database(const std::string& db_path) {
    std::filesystem::path p(db_path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            throw RecognitionError(ErrorCode::StorageFailure,
                "cannot create directory " + p.parent_path().string() + ": " + ec.message());
        }
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open(db_path.c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        throw RecognitionError(ErrorCode::StorageFailure,
                               "cannot open database " + db_path + ": " + msg);
    }

    // Los PRAGMA son optimizaciones: si fallan la base sigue siendo usable
    for (const char* pragma : {"PRAGMA journal_mode=WAL;",
                               "PRAGMA synchronous=NORMAL;",
                               "PRAGMA foreign_keys=ON;"}) {
        if (!exec_sql(db, pragma)) {
            spdlog::warn("{} failed on {}", pragma, db_path);
        }
    }

    return db;
}

bool exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);

    if (rc != SQLITE_OK) {
        spdlog::error("SQL error: {}", err ? err : sqlite3_errmsg(db));
        sqlite3_free(err);
        return false;
    }
    return true;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

} // namespace facematch
