#pragma once
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "ConnectionConfig.hpp"
#include "Session.hpp"

namespace pjt {

class CredentialProvider;

// Owns the connection pool of one process and hands out units of work.
//
// unitOfWork(body): one session, BEGIN, body(session), COMMIT. If body throws,
// the transaction is rolled back and the same exception object is rethrown.
// The session goes back to the pool on every exit path. Writes that must be
// atomic together belong in one unitOfWork call; sessions are never shared
// between concurrent callers.
//
// dispose() is idempotent: the second and later calls are silent no-ops.
// Acquiring a unit of work after dispose() throws ConnectionError. The
// destructor disposes, so holding the manager in a scope (or unique_ptr)
// guarantees release on every exit path.
class SessionManager {
public:
  // Validates the config, resolves the connection target (fetching a token for
  // managed identity) and opens the first pooled connection.
  // Throws ConfigurationError, AuthRenewalError or ConnectionError. No retry.
  static std::unique_ptr<SessionManager> create(ConnectionConfig cfg,
                                                std::shared_ptr<CredentialProvider> credentials = nullptr);
  // Public for std::make_unique; only create() can produce a Passkey.
  class Passkey {
    friend class SessionManager;
    explicit Passkey() = default;
  };
  SessionManager(Passkey, ConnectionConfig cfg, std::shared_ptr<CredentialProvider> credentials);
  ~SessionManager();

  SessionManager(const SessionManager&) = delete;
  SessionManager& operator=(const SessionManager&) = delete;

  template <typename Fn>
  auto unitOfWork(Fn&& body) -> std::invoke_result_t<Fn&, Session&>;

  void dispose();
  bool disposed() const;

  const ConnectionConfig& config() const { return cfg_; }
  std::string descriptor() const;  // redacted

  // Connection target resolved with the current credential. Re-resolved
  // whenever the token changes. SQLite opens cfg.database and ignores the
  // credential; a server-backed connector would be handed this string.
  // Contains the secret: never log it.
  std::string connectionString() const;
  size_t openConnections() const;
  size_t idleConnections() const;

private:
  // Returns its connection to the pool (or closes it) on destruction.
  class Lease {
  public:
    Lease(SessionManager* owner, sqlite3* db) : owner_(owner), session_(db) {}
    ~Lease() { owner_->release(session_.handle(), broken_); }
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    Session& session() { return session_; }
    void markBroken() { broken_ = true; }

  private:
    SessionManager* owner_;
    Session session_;
    bool broken_ = false;
  };

  sqlite3* acquire();
  void release(sqlite3* db, bool broken);
  sqlite3* openConnection();
  void refreshCredential();

  void begin(Session& s);
  void commit(Session& s);
  // Never throws; returns false when the rollback itself failed.
  bool rollback(Session& s, std::exception_ptr cause) noexcept;

  ConnectionConfig cfg_;
  std::shared_ptr<CredentialProvider> credentials_;
  std::string token_;
  std::string target_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::vector<sqlite3*> idle_;
  size_t open_ = 0;
  bool disposed_ = false;
};

template <typename Fn>
auto SessionManager::unitOfWork(Fn&& body) -> std::invoke_result_t<Fn&, Session&> {
  using R = std::invoke_result_t<Fn&, Session&>;

  refreshCredential();
  Lease lease(this, acquire());
  Session& s = lease.session();
  begin(s);
  try {
    if constexpr (std::is_void_v<R>) {
      body(s);
      commit(s);
    } else {
      R result = body(s);
      commit(s);
      return result;
    }
  } catch (...) {
    if (!rollback(s, std::current_exception())) lease.markBroken();
    throw;
  }
}

} // namespace pjt
