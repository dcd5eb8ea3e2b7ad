#pragma once
#include <cstddef>
#include <string>

namespace pjt {

enum class ConnectionMode {
  Static,           // host/database/user/password supplied up front
  ManagedIdentity,  // user/host/database + a token issued per identity
};

struct ConnectionConfig {
  ConnectionMode mode = ConnectionMode::Static;
  std::string host;
  std::string database;   // SQLite database file
  std::string user;
  std::string password;
  std::string client_id;  // managed identity only

  size_t pool_size = 4;
  int busy_timeout_ms = 5000;
  int auth_timeout_seconds = 10;
};

const char* to_string(ConnectionMode m);
ConnectionMode parse_connection_mode(const std::string& s);

// Throws ConfigurationError naming the first missing field.
void validate(const ConnectionConfig& cfg);

// Descriptor with the secret part (password or token) replaced. Safe to log.
std::string describe(const ConnectionConfig& cfg);

// Full descriptor including the live token for managed identity, e.g.
// "sqlite://user:<token>@host/path/to.db".
std::string resolve_connection_string(const ConnectionConfig& cfg, const std::string& token);

// database.json style file, keys named like the struct fields. Unknown keys are ignored.
ConnectionConfig load_connection_config_file(const std::string& path);

// PJT_DB_MODE, PJT_DB_HOST, PJT_DB_NAME, PJT_DB_USER, PJT_DB_PASSWORD,
// PJT_DB_CLIENT_ID, PJT_DB_POOL_SIZE, PJT_DB_BUSY_TIMEOUT_MS, PJT_AUTH_TIMEOUT.
ConnectionConfig load_connection_config_env();

} // namespace pjt
