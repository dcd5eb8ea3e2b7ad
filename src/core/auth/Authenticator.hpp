#pragma once
#include <chrono>
#include <string>

namespace pjt {

// Memory-only bearer credential. Never persisted, never logged.
struct Credential {
  std::string token;
  std::chrono::system_clock::time_point expires_at;
};

// Any source of short-lived bearer tokens usable in place of a password.
class Authenticator {
public:
  virtual ~Authenticator() = default;

  // Throws AuthError when the backend cannot issue a token for `identity`.
  virtual Credential acquire(const std::string& identity) = 0;
};

} // namespace pjt
