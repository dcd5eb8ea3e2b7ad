#include "SessionManager.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include "InitDb.hpp"
#include "core/Errors.hpp"
#include "core/auth/CredentialProvider.hpp"

namespace pjt {

static std::string what_of(std::exception_ptr ep) {
  if (!ep) return "unknown error";
  try {
    std::rethrow_exception(ep);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}

std::unique_ptr<SessionManager> SessionManager::create(ConnectionConfig cfg,
                                                       std::shared_ptr<CredentialProvider> credentials) {
  validate(cfg);
  if (cfg.mode == ConnectionMode::ManagedIdentity && !credentials) {
    throw ConfigurationError("managed_identity connection requires a credential provider");
  }
  return std::make_unique<SessionManager>(Passkey{}, std::move(cfg), std::move(credentials));
}

SessionManager::SessionManager(Passkey, ConnectionConfig cfg, std::shared_ptr<CredentialProvider> credentials)
  : cfg_(std::move(cfg)), credentials_(std::move(credentials)) {
  if (cfg_.mode == ConnectionMode::ManagedIdentity) {
    refreshCredential();
  } else {
    target_ = resolve_connection_string(cfg_, "");
  }

  // Open one connection eagerly so a bad target fails here, not mid-run.
  sqlite3* first = openConnection();
  idle_.push_back(first);
  open_ = 1;
  spdlog::info("Successfully created database session pool ({}, mode={}, pool_size={})",
               descriptor(), to_string(cfg_.mode), cfg_.pool_size);
}

SessionManager::~SessionManager() {
  dispose();
}

std::string SessionManager::descriptor() const {
  return describe(cfg_);
}

std::string SessionManager::connectionString() const {
  std::lock_guard<std::mutex> lk(mu_);
  return target_;
}

void SessionManager::refreshCredential() {
  if (!credentials_) return;
  std::string tok = credentials_->token();  // renews if needed; AuthRenewalError is fatal here
  std::lock_guard<std::mutex> lk(mu_);
  if (tok != token_) {
    // Resolve eagerly so a malformed target surfaces before any session is lent.
    target_ = resolve_connection_string(cfg_, tok);
    token_ = std::move(tok);
    spdlog::debug("Connection target re-resolved for {}", descriptor());
  }
}

sqlite3* SessionManager::openConnection() {
  sqlite3* db = nullptr;
  int rc = sqlite3_open_v2(cfg_.database.c_str(), &db,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    spdlog::error("Error creating database connection to {}: {}", descriptor(), msg);
    throw ConnectionError("failed to open " + descriptor() + ": " + msg);
  }
  try {
    applyPragmas(db, cfg_.busy_timeout_ms);
  } catch (const std::exception& e) {
    sqlite3_close(db);
    throw ConnectionError(std::string("failed to configure connection: ") + e.what());
  }
  return db;
}

sqlite3* SessionManager::acquire() {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [&] { return disposed_ || !idle_.empty() || open_ < cfg_.pool_size; });
  if (disposed_) throw ConnectionError("session pool has been disposed");

  if (!idle_.empty()) {
    sqlite3* db = idle_.back();
    idle_.pop_back();
    return db;
  }

  ++open_;
  lk.unlock();
  try {
    return openConnection();
  } catch (...) {
    lk.lock();
    --open_;
    cv_.notify_one();
    throw;
  }
}

void SessionManager::release(sqlite3* db, bool broken) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!disposed_ && !broken) {
      idle_.push_back(db);
      cv_.notify_one();
      return;
    }
    --open_;
    cv_.notify_one();
  }
  if (broken) spdlog::warn("Discarding database connection after failed rollback");
  // close_v2: a broken connection may still have unfinalized statements; it
  // closes (dropping its open transaction) once they are finalized.
  sqlite3_close_v2(db);
}

void SessionManager::dispose() {
  std::vector<sqlite3*> toClose;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (disposed_) return;
    disposed_ = true;
    toClose.swap(idle_);
    open_ -= toClose.size();
    cv_.notify_all();
  }
  for (sqlite3* db : toClose) sqlite3_close(db);
  spdlog::info("Database session pool disposed ({} connections closed)", toClose.size());
}

bool SessionManager::disposed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return disposed_;
}

size_t SessionManager::openConnections() const {
  std::lock_guard<std::mutex> lk(mu_);
  return open_;
}

size_t SessionManager::idleConnections() const {
  std::lock_guard<std::mutex> lk(mu_);
  return idle_.size();
}

void SessionManager::begin(Session& s) {
  s.exec("BEGIN IMMEDIATE;");
}

void SessionManager::commit(Session& s) {
  s.exec("COMMIT;");
}

bool SessionManager::rollback(Session& s, std::exception_ptr cause) noexcept {
  spdlog::warn("Rolling back unit of work: {}", what_of(cause));
  if (sqlite3_get_autocommit(s.handle())) return true;  // SQLite already rolled back
  char* err = nullptr;
  if (sqlite3_exec(s.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    spdlog::error("Rollback failed: {}", err ? err : "unknown error");
    sqlite3_free(err);
    return false;
  }
  return true;
}

} // namespace pjt
