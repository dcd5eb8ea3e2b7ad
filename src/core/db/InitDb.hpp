#pragma once
#include <string>

struct sqlite3;

namespace pjt {

// Runs every statement in `sql`. Throws TransactionError with SQLite's message.
void execAll(sqlite3* db, const std::string& sql);

// Per-connection settings: WAL, synchronous=NORMAL, foreign keys, busy timeout.
void applyPragmas(sqlite3* db, int busyTimeoutMs);

// Creates the database file (and parent directory) and applies the schema file.
// Idempotent: the schema only uses CREATE ... IF NOT EXISTS.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

constexpr int kSchemaVersion = 1;

} // namespace pjt
