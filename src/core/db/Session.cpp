#include "Session.hpp"

#include <sqlite3.h>

#include "InitDb.hpp"
#include "core/Errors.hpp"

namespace pjt {

Statement::Statement(sqlite3* db, const char* sql) : db_(db), st_(nullptr) {
  if (sqlite3_prepare_v2(db_, sql, -1, &st_, nullptr) != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db_);
    sqlite3_finalize(st_);
    st_ = nullptr;
    throw TransactionError("prepare failed: " + err);
  }
}

Statement::Statement(Statement&& other) noexcept : db_(other.db_), st_(other.st_) {
  other.st_ = nullptr;
}

Statement::~Statement() {
  if (st_) sqlite3_finalize(st_);
}

bool Statement::step(const char* what) {
  const int rc = sqlite3_step(st_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw TransactionError(std::string(what) + " failed: " + sqlite3_errmsg(db_));
}

void Session::exec(const std::string& sql) {
  execAll(db_, sql);
}

int Session::changes() const {
  return sqlite3_changes(db_);
}

int64_t Session::lastInsertId() const {
  return sqlite3_last_insert_rowid(db_);
}

} // namespace pjt
