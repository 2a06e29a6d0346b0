// ============= include/database/face_store.hpp =============
/*
 * Face Store - SQLite Backend
 *
 * Fuente autoritativa de las entries enroladas. La Gallery se
 * reconstruye completa desde list_all() en cada refresh.
 *
 * TABLA: known_faces
 * ├── id (INTEGER PRIMARY KEY AUTOINCREMENT)
 * ├── name (TEXT NOT NULL)
 * ├── employee_id (TEXT UNIQUE)
 * ├── department / position / email / phone (TEXT)
 * ├── descriptor_type (INTEGER) - DescriptorType
 * ├── descriptor (BLOB) - float32 crudos
 * ├── created_at / updated_at (TEXT)
 *
 * OPERACIONES:
 * - add():      Insertar entry (devuelve id)
 * - remove():   Eliminar por id
 * - update_attributes(): Reemplazar los atributos de una entry
 * - get():      Buscar por id
 * - list_all(): Todas las entries ordenadas por id
 */

#pragma once
#include "core/types.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace facematch {

class FaceStore {
private:
    sqlite3* db;
    std::string db_path;
    mutable std::mutex db_mutex;

    bool create_tables();

    static std::vector<unsigned char> serialize_descriptor(const std::vector<float>& values);
    static std::vector<float> deserialize_descriptor(const void* data, int size);

    Entry read_row(sqlite3_stmt* stmt) const;

public:
    // Lanza RecognitionError(StorageFailure)
    explicit FaceStore(const std::string& db_path);
    ~FaceStore();

    FaceStore(const FaceStore&) = delete;
    FaceStore& operator=(const FaceStore&) = delete;

    // Lanza InvalidEntry (label vacio), DuplicateEmployeeId o StorageFailure
    EntryId add(const std::string& label,
                const Descriptor& descriptor,
                const Attributes& attributes = {});

    bool remove(EntryId id);

    // Reemplaza todos los atributos (los ausentes quedan en NULL).
    // false si el id no existe. Lanza DuplicateEmployeeId o StorageFailure
    bool update_attributes(EntryId id, const Attributes& attributes);

    std::optional<Entry> get(EntryId id) const;
    std::vector<Entry> list_all() const;
    int count() const;

    // Atributos con columna propia; el resto se ignora
    static const std::vector<std::string>& attribute_columns();
};

} // namespace facematch
