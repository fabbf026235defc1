// src/core/metadata/InitDb.cpp
#include "InitDb.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

#include "core/util/Errors.hpp"

namespace sai {

namespace {

struct DbCloser {
    void operator()(sqlite3* db) const { sqlite3_close(db); }
};
using DbHandle = std::unique_ptr<sqlite3, DbCloser>;

void execAll(sqlite3* db, const std::string& sql, const char* what) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw IndexerError(ErrorKind::Storage, std::string(what) + " failed: " + msg);
    }
}

int64_t queryInt(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw IndexerError(ErrorKind::Storage, std::string("prepare '") + sql + "' failed: " + sqlite3_errmsg(db));
    }
    int64_t v = 0;
    const int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) v = sqlite3_column_int64(st, 0);
    sqlite3_finalize(st);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        throw IndexerError(ErrorKind::Storage, std::string("query '") + sql + "' failed: " + sqlite3_errmsg(db));
    }
    return v;
}

std::string readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw IndexerError(ErrorKind::Storage, "Cannot open schema file: " + path);
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

} // namespace

void initDatabase(const std::string& dbPath, const std::string& schemaPath) {
    const auto parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(dbPath.c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    DbHandle db(raw);
    if (rc != SQLITE_OK) {
        throw IndexerError(ErrorKind::Storage, "Failed to open DB " + dbPath + ": " +
                           (raw ? sqlite3_errmsg(raw) : "out of memory"));
    }

    const int64_t found = queryInt(db.get(), "PRAGMA user_version;");
    if (found > kSchemaVersion) {
        throw IndexerError(ErrorKind::Storage, "database " + dbPath + " has schema version " +
                           std::to_string(found) + ", this build supports " + std::to_string(kSchemaVersion));
    }

    // WAL plus FULL sync: a checkpoint row is never durable before the rows it covers.
    execAll(db.get(), "PRAGMA journal_mode=WAL;", "journal_mode");
    execAll(db.get(), "PRAGMA synchronous=FULL;", "synchronous");
    execAll(db.get(), "PRAGMA foreign_keys=ON;", "foreign_keys");
    execAll(db.get(), "PRAGMA busy_timeout=5000;", "busy_timeout");

    execAll(db.get(), readFile(schemaPath), "apply schema");

    const int64_t tables = queryInt(db.get(),
        "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' "
        "AND name IN ('submissions', 'records', 'indexer_state');");
    if (tables != 3) {
        throw IndexerError(ErrorKind::Storage, "schema " + schemaPath + " did not create the index tables");
    }
    execAll(db.get(), "PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";", "user_version");

    if (found < kSchemaVersion) spdlog::info("initialized {} at schema version {}", dbPath, kSchemaVersion);
}

} // namespace sai
