#pragma once
#include <string>

namespace sai {

// Version written to PRAGMA user_version once schema.sql is applied.
constexpr int kSchemaVersion = 1;

// Opens (creating if needed) the SQLite file, sets WAL/foreign-key pragmas
// and applies the schema file. Idempotent. Refuses a database stamped with a
// newer schema version. Throws IndexerError(Storage).
void initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace sai
