// src/core/db/InitDb.cpp
#include "InitDb.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace pjt {

void execAll(sqlite3* db, const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db);
    sqlite3_free(err);
    throw TransactionError("SQLite exec failed: " + msg);
  }
}

void applyPragmas(sqlite3* db, int busyTimeoutMs) {
  // busy_timeout first: the other pragmas may have to wait on a concurrent writer
  execAll(db, "PRAGMA busy_timeout=" + std::to_string(busyTimeoutMs) + ";");
  // concurrency + durability + integrity
  execAll(db, "PRAGMA journal_mode=WAL;");
  execAll(db, "PRAGMA synchronous=NORMAL;");
  execAll(db, "PRAGMA foreign_keys=ON;");
}

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
  const auto parent = std::filesystem::path(dbPath).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);

  std::ifstream in(schemaPath);
  if (!in) throw ConfigurationError("Cannot open schema file: " + schemaPath);
  std::ostringstream buf; buf << in.rdbuf();

  sqlite3* db = nullptr;
  int rc = sqlite3_open_v2(
    dbPath.c_str(),
    &db,
    SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
    nullptr
  );
  if (rc != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw ConnectionError("Failed to open DB " + dbPath + ": " + msg);
  }

  try {
    applyPragmas(db, 5000);
    execAll(db, buf.str());
    execAll(db, "PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";");
  } catch (...) {
    sqlite3_close(db);
    throw;
  }
  sqlite3_close(db);
  spdlog::info("Schema v{} applied to {}", kSchemaVersion, dbPath);
  return true;
}

} // namespace pjt
