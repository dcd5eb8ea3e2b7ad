#pragma once
#include <cstdint>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace pjt {

// Owns one prepared statement; finalized on destruction.
class Statement {
public:
  // Throws TransactionError when the SQL does not prepare.
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(Statement&& other) noexcept;
  Statement& operator=(Statement&&) = delete;
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return st_; }

  // true on SQLITE_ROW, false on SQLITE_DONE. Anything else throws
  // TransactionError("<what> failed: <sqlite message>").
  bool step(const char* what);

private:
  sqlite3* db_;
  sqlite3_stmt* st_;
};

// One pooled connection, lent to exactly one unit of work at a time.
class Session {
public:
  explicit Session(sqlite3* db) : db_(db) {}
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  sqlite3* handle() const { return db_; }

  void exec(const std::string& sql);
  Statement prepare(const char* sql) const { return Statement(db_, sql); }

  // Rows touched by the last INSERT/UPDATE/DELETE.
  int changes() const;
  int64_t lastInsertId() const;

private:
  sqlite3* db_;
};

} // namespace pjt
