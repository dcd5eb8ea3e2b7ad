#include "CredentialProvider.hpp"

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/util/Time.hpp"

namespace pjt {

CredentialProvider::CredentialProvider(std::shared_ptr<Authenticator> auth,
                                       std::string identity,
                                       std::chrono::seconds renewalMargin,
                                       Clock clock)
  : auth_(std::move(auth)),
    identity_(std::move(identity)),
    margin_(renewalMargin),
    clock_(std::move(clock)) {
  if (!auth_) throw ConfigurationError("CredentialProvider requires an authenticator");
}

Credential CredentialProvider::acquire() {
  std::lock_guard<std::mutex> lk(mu_);
  return acquireLocked();
}

Credential CredentialProvider::acquireLocked() {
  ++acquisitions_;
  Credential c = auth_->acquire(identity_);
  if (c.token.empty()) throw AuthError("identity backend returned an empty token");
  spdlog::info("Database credential acquired for identity '{}', expires {}",
               identity_, format_timestamp(c.expires_at));
  cached_ = std::move(c);
  return *cached_;
}

bool CredentialProvider::isValid(std::chrono::system_clock::time_point now) const {
  std::lock_guard<std::mutex> lk(mu_);
  return isValidLocked(now);
}

bool CredentialProvider::isValidLocked(std::chrono::system_clock::time_point now) const {
  return cached_ && now < cached_->expires_at - margin_;
}

std::string CredentialProvider::token() {
  std::lock_guard<std::mutex> lk(mu_);
  if (isValidLocked(clock_())) return cached_->token;

  const bool renewal = cached_.has_value();
  try {
    Credential c = acquireLocked();
    if (renewal) spdlog::info("Token for database renewed.");
    return c.token;
  } catch (const std::exception& e) {
    cached_.reset();
    throw AuthRenewalError(std::string("credential renewal failed: ") + e.what());
  }
}

size_t CredentialProvider::acquisitions() const {
  std::lock_guard<std::mutex> lk(mu_);
  return acquisitions_;
}

} // namespace pjt
