// ============= src/database/face_store.cpp =============
#include "database/face_store.hpp"
#include "database/sqlite_utils.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <cstring>
#include <ctime>

namespace facematch {

namespace {

std::string now_string() {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);

    char timestamp[32];
    std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return timestamp;
}

} // namespace

const std::vector<std::string>& FaceStore::attribute_columns() {
    static const std::vector<std::string> columns = {
        "employee_id", "department", "position", "email", "phone"
    };
    return columns;
}

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

FaceStore::FaceStore(const std::string& db_path)
    : db(nullptr), db_path(db_path)
{
    spdlog::info("Inicializando Face Store");
    spdlog::info("   Path: {}", db_path);

    db = open_database(db_path);

    if (!create_tables()) {
        sqlite3_close(db);
        db = nullptr;
        throw RecognitionError(ErrorCode::StorageFailure,
                               "cannot create known_faces table in " + db_path);
    }

    spdlog::info("✓ Face Store ready ({} faces)", count());
}

FaceStore::~FaceStore() {
    if (db) {
        sqlite3_close(db);
    }
}

// ==================== INITIALIZATION ====================

bool FaceStore::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS known_faces (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL,
            employee_id TEXT UNIQUE,
            department TEXT,
            position TEXT,
            email TEXT,
            phone TEXT,
            descriptor_type INTEGER NOT NULL,
            descriptor BLOB NOT NULL,
            created_at TEXT NOT NULL,
            updated_at TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_known_faces_name ON known_faces(name);
    )";
    return exec_sql(db, sql);
}

// ==================== SERIALIZATION ====================

std::vector<unsigned char> FaceStore::serialize_descriptor(const std::vector<float>& values) {
    std::vector<unsigned char> blob(values.size() * sizeof(float));
    std::memcpy(blob.data(), values.data(), blob.size());
    return blob;
}

std::vector<float> FaceStore::deserialize_descriptor(const void* data, int size) {
    std::vector<float> values(static_cast<size_t>(size) / sizeof(float));
    if (!values.empty()) {
        std::memcpy(values.data(), data, values.size() * sizeof(float));
    }
    return values;
}

// ==================== ADD ====================

EntryId FaceStore::add(const std::string& label,
                       const Descriptor& descriptor,
                       const Attributes& attributes)
{
    if (label.empty()) {
        throw RecognitionError(ErrorCode::InvalidEntry, "label must not be empty");
    }
    if (descriptor.empty()) {
        throw RecognitionError(ErrorCode::InvalidEntry, "descriptor must not be empty");
    }

    auto blob = serialize_descriptor(descriptor.values);
    std::string timestamp = now_string();

    const char* sql = R"(
        INSERT INTO known_faces
            (name, employee_id, department, position, email, phone,
             descriptor_type, descriptor, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    std::lock_guard<std::mutex> lock(db_mutex);

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw RecognitionError(ErrorCode::StorageFailure, sqlite3_errmsg(db));
    }

    sqlite3_bind_text(stmt, 1, label.c_str(), -1, SQLITE_TRANSIENT);

    const auto& columns = attribute_columns();
    for (size_t i = 0; i < columns.size(); i++) {
        auto it = attributes.find(columns[i]);
        int col = static_cast<int>(i) + 2;
        if (it != attributes.end() && !it->second.empty()) {
            sqlite3_bind_text(stmt, col, it->second.c_str(), -1, SQLITE_TRANSIENT);
        } else {
            sqlite3_bind_null(stmt, col);
        }
    }

    sqlite3_bind_int(stmt, 7, static_cast<int>(descriptor.type));
    sqlite3_bind_blob(stmt, 8, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 9, timestamp.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 10, timestamp.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_CONSTRAINT) {
        auto it = attributes.find("employee_id");
        throw RecognitionError(ErrorCode::DuplicateEmployeeId,
            "employee_id '" + (it != attributes.end() ? it->second : std::string()) +
            "' already enrolled");
    }
    if (rc != SQLITE_DONE) {
        throw RecognitionError(ErrorCode::StorageFailure, sqlite3_errmsg(db));
    }

    EntryId id = sqlite3_last_insert_rowid(db);
    spdlog::info("✓ Added face: {} (ID={})", label, id);
    return id;
}

// ==================== REMOVE ====================

bool FaceStore::remove(EntryId id) {
    std::lock_guard<std::mutex> lock(db_mutex);

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, "DELETE FROM known_faces WHERE id = ?", -1, &stmt, nullptr) != SQLITE_OK) {
        throw RecognitionError(ErrorCode::StorageFailure, sqlite3_errmsg(db));
    }

    sqlite3_bind_int64(stmt, 1, id);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw RecognitionError(ErrorCode::StorageFailure, sqlite3_errmsg(db));
    }

    bool removed = sqlite3_changes(db) > 0;
    if (removed) {
        spdlog::info("✓ Deleted face ID={}", id);
    }
    return removed;
}

// ==================== UPDATE ====================

bool FaceStore::update_attributes(EntryId id, const Attributes& attributes) {
    std::string timestamp = now_string();

    const char* sql = R"(
        UPDATE known_faces
        SET employee_id = ?, department = ?, position = ?, email = ?, phone = ?,
            updated_at = ?
        WHERE id = ?
    )";

    std::lock_guard<std::mutex> lock(db_mutex);

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw RecognitionError(ErrorCode::StorageFailure, sqlite3_errmsg(db));
    }

    const auto& columns = attribute_columns();
    for (size_t i = 0; i < columns.size(); i++) {
        auto it = attributes.find(columns[i]);
        int col = static_cast<int>(i) + 1;
        if (it != attributes.end() && !it->second.empty()) {
            sqlite3_bind_text(stmt, col, it->second.c_str(), -1, SQLITE_TRANSIENT);
        } else {
            sqlite3_bind_null(stmt, col);
        }
    }

    sqlite3_bind_text(stmt, 6, timestamp.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 7, id);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_CONSTRAINT) {
        auto it = attributes.find("employee_id");
        throw RecognitionError(ErrorCode::DuplicateEmployeeId,
            "employee_id '" + (it != attributes.end() ? it->second : std::string()) +
            "' already enrolled");
    }
    if (rc != SQLITE_DONE) {
        throw RecognitionError(ErrorCode::StorageFailure, sqlite3_errmsg(db));
    }

    bool updated = sqlite3_changes(db) > 0;
    if (updated) {
        spdlog::info("✓ Updated attributes for face ID={}", id);
    }
    return updated;
}

// ==================== QUERIES ====================

Entry FaceStore::read_row(sqlite3_stmt* stmt) const {
    Entry e;
    e.id = sqlite3_column_int64(stmt, 0);
    e.label = column_text(stmt, 1);

    const auto& columns = attribute_columns();
    for (size_t i = 0; i < columns.size(); i++) {
        int col = static_cast<int>(i) + 2;
        if (sqlite3_column_type(stmt, col) != SQLITE_NULL) {
            e.attributes[columns[i]] = column_text(stmt, col);
        }
    }

    e.descriptor.type = static_cast<DescriptorType>(sqlite3_column_int(stmt, 7));
    e.descriptor.values = deserialize_descriptor(sqlite3_column_blob(stmt, 8),
                                                 sqlite3_column_bytes(stmt, 8));
    return e;
}

std::optional<Entry> FaceStore::get(EntryId id) const {
    std::lock_guard<std::mutex> lock(db_mutex);

    const char* sql = R"(
        SELECT id, name, employee_id, department, position, email, phone,
               descriptor_type, descriptor
        FROM known_faces WHERE id = ?
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw RecognitionError(ErrorCode::StorageFailure, sqlite3_errmsg(db));
    }

    sqlite3_bind_int64(stmt, 1, id);

    std::optional<Entry> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = read_row(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

std::vector<Entry> FaceStore::list_all() const {
    std::lock_guard<std::mutex> lock(db_mutex);

    const char* sql = R"(
        SELECT id, name, employee_id, department, position, email, phone,
               descriptor_type, descriptor
        FROM known_faces ORDER BY id
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw RecognitionError(ErrorCode::StorageFailure, sqlite3_errmsg(db));
    }

    std::vector<Entry> entries;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        entries.push_back(read_row(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw RecognitionError(ErrorCode::StorageFailure, sqlite3_errmsg(db));
    }
    return entries;
}

int FaceStore::count() const {
    std::lock_guard<std::mutex> lock(db_mutex);

    sqlite3_stmt* stmt;
    int count = 0;
    if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM known_faces", -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            count = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }
    return count;
}

} // namespace facematch
