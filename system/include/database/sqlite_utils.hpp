// ============= include/database/sqlite_utils.hpp =============
#pragma once
#include <string>
#include <sqlite3.h>

namespace facematch {

// Crea el directorio padre, abre la base y aplica WAL + synchronous=NORMAL.
// Lanza RecognitionError(StorageFailure).
sqlite3* open_database(const std::string& db_path);

// Ejecuta SQL sin resultados; false + log si falla
bool exec_sql(sqlite3* db, const char* sql);

// Texto de columna tolerante a NULL
std::string column_text(sqlite3_stmt* stmt, int col);

} // namespace facematch
