#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "Authenticator.hpp"

namespace pjt {

// Caches one credential and renews it before it expires.
//
// isValid(now) is true iff now < expiry - renewal margin. token() renews
// synchronously when the cached credential is not valid; callers sharing a
// provider serialize on one mutex, so concurrent callers that observe an
// invalid token wait for the single in-flight renewal instead of issuing
// their own.
class CredentialProvider {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  static constexpr std::chrono::minutes kDefaultRenewalMargin{5};

  CredentialProvider(std::shared_ptr<Authenticator> auth,
                     std::string identity,
                     std::chrono::seconds renewalMargin = kDefaultRenewalMargin,
                     Clock clock = [] { return std::chrono::system_clock::now(); });

  // Unconditional acquisition from the backend; replaces the cached credential.
  // Throws AuthError.
  Credential acquire();

  bool isValid(std::chrono::system_clock::time_point now) const;

  // Valid token, renewed first if needed. Renewal failure throws AuthRenewalError.
  std::string token();

  // Number of calls that reached the backend.
  size_t acquisitions() const;

private:
  Credential acquireLocked();
  bool isValidLocked(std::chrono::system_clock::time_point now) const;

  std::shared_ptr<Authenticator> auth_;
  std::string identity_;
  std::chrono::seconds margin_;
  Clock clock_;

  mutable std::mutex mu_;
  std::optional<Credential> cached_;
  size_t acquisitions_ = 0;
};

} // namespace pjt
