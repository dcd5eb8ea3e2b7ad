#pragma once
#include <stdexcept>
#include <string>

namespace pjt {

struct Error : std::runtime_error {
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Reporting was required but credentials/config are missing. Raised before work starts.
struct ConfigurationError : Error {
  explicit ConfigurationError(const std::string& what) : Error(what) {}
};

// Engine/pool setup failure. Never retried here.
struct ConnectionError : Error {
  explicit ConnectionError(const std::string& what) : Error(what) {}
};

// Failure raised by the store inside a unit of work (BEGIN, statements, COMMIT).
struct TransactionError : Error {
  explicit TransactionError(const std::string& what) : Error(what) {}
};

// The identity backend refused or could not issue a token.
struct AuthError : Error {
  explicit AuthError(const std::string& what) : Error(what) {}
};

struct AuthRenewalError : Error {
  explicit AuthRenewalError(const std::string& what) : Error(what) {}
};

// Audit row could not be written. Logged, never propagated over the primary error.
struct RecordingError : Error {
  explicit RecordingError(const std::string& what) : Error(what) {}
};

// Exclusive claim policy only.
struct ClaimConflictError : Error {
  explicit ClaimConflictError(const std::string& what) : Error(what) {}
};

} // namespace pjt
