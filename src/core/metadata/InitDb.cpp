// src/core/metadata/InitDb.cpp
#include "InitDb.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

#include "core/Errors.hpp"

namespace mmig {

namespace {

constexpr int kSchemaVersion = 1;

struct DbCloser {
    void operator()(sqlite3* db) const { sqlite3_close(db); }
};
using DbHandle = std::unique_ptr<sqlite3, DbCloser>;

void execAll(sqlite3* db, const std::string& sql, const char* what) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw StoreError(std::string(what) + ": " + msg);
    }
}

int userVersion(sqlite3* db) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "PRAGMA user_version;", -1, &st, nullptr) != SQLITE_OK)
        throw StoreError(std::string("reading schema version: ") + sqlite3_errmsg(db));
    int version = 0;
    if (sqlite3_step(st) == SQLITE_ROW) version = sqlite3_column_int(st, 0);
    sqlite3_finalize(st);
    return version;
}

std::string readSchema(const std::string& schemaPath) {
    std::ifstream in(schemaPath);
    if (!in) throw StoreError("Cannot open schema file: " + schemaPath);
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

} // namespace

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
    const auto parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(dbPath.c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    DbHandle db(raw);
    if (rc != SQLITE_OK)
        throw StoreError("Failed to open DB " + dbPath + ": " +
                         (raw ? sqlite3_errmsg(raw) : "out of memory"));

    const int found = userVersion(db.get());
    if (found > kSchemaVersion)
        throw StoreError(dbPath + " has schema version " + std::to_string(found) +
                         ", this build understands up to " + std::to_string(kSchemaVersion));

    // WAL lets the operator API read while workers write.
    // synchronous=FULL: a committed transition must survive power loss.
    execAll(db.get(), "PRAGMA journal_mode=WAL;", "enabling WAL");
    execAll(db.get(), "PRAGMA synchronous=FULL;", "setting synchronous");
    execAll(db.get(), "PRAGMA foreign_keys=ON;", "enabling foreign keys");
    execAll(db.get(), "PRAGMA busy_timeout=30000;", "setting busy timeout");

    execAll(db.get(), readSchema(schemaPath), "applying schema");
    execAll(db.get(), "PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";", "recording schema version");
    return true;
}

} // namespace mmig
