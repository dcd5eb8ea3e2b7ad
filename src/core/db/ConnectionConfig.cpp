#include "ConnectionConfig.hpp"

#include <cstdint>
#include <fstream>
#include <limits>

#include <nlohmann/json.hpp>

#include "core/Errors.hpp"
#include "core/util/Env.hpp"

using nlohmann::json;

namespace pjt {

// ---------- helpers ----------

static long long env_int_or(const char* key, long long defval) {
  const std::string s = get_env_or(key, "");
  if (s.empty()) return defval;
  try {
    return std::stoll(s);
  } catch (const std::exception&) {
    throw ConfigurationError(std::string(key) + " is not an integer: " + s);
  }
}

static int to_int(long long v, const std::string& field) {
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
    throw ConfigurationError(field + " is out of range: " + std::to_string(v));
  }
  return static_cast<int>(v);
}

static void require(const std::string& v, const char* field, const char* mode) {
  if (v.empty()) {
    throw ConfigurationError(std::string("database config: '") + field +
                             "' is required for " + mode + " connections");
  }
}

// ---------- api ----------

const char* to_string(ConnectionMode m) {
  switch (m) {
    case ConnectionMode::Static:          return "static";
    case ConnectionMode::ManagedIdentity: return "managed_identity";
  }
  return "unknown";
}

ConnectionMode parse_connection_mode(const std::string& s) {
  if (s == "static" || s == "local") return ConnectionMode::Static;
  if (s == "managed_identity" || s == "managed") return ConnectionMode::ManagedIdentity;
  throw ConfigurationError("unknown database mode: " + s);
}

void validate(const ConnectionConfig& cfg) {
  const char* mode = to_string(cfg.mode);
  require(cfg.database, "database", mode);
  if (cfg.mode == ConnectionMode::ManagedIdentity) {
    require(cfg.user, "user", mode);
    require(cfg.host, "host", mode);
    require(cfg.client_id, "client_id", mode);
    if (!cfg.password.empty()) {
      throw ConfigurationError("database config: 'password' must not be set for managed_identity connections");
    }
  }
  if (cfg.pool_size == 0) throw ConfigurationError("database config: 'pool_size' must be positive");
  if (cfg.busy_timeout_ms < 0) throw ConfigurationError("database config: 'busy_timeout_ms' must not be negative");
  if (cfg.auth_timeout_seconds <= 0) throw ConfigurationError("database config: 'auth_timeout_seconds' must be positive");
}

static std::string build(const ConnectionConfig& cfg, const std::string& secret) {
  std::string s = "sqlite://";
  if (!cfg.user.empty()) {
    s += cfg.user;
    if (!secret.empty()) s += ":" + secret;
    s += "@";
  }
  s += cfg.host;
  s += "/";
  s += cfg.database;
  return s;
}

std::string describe(const ConnectionConfig& cfg) {
  const bool hasSecret = cfg.mode == ConnectionMode::ManagedIdentity || !cfg.password.empty();
  return build(cfg, hasSecret ? "***" : "");
}

std::string resolve_connection_string(const ConnectionConfig& cfg, const std::string& token) {
  if (cfg.mode == ConnectionMode::ManagedIdentity) {
    if (token.empty()) throw ConfigurationError("managed_identity connection needs a token");
    return build(cfg, token);
  }
  return build(cfg, cfg.password);
}

ConnectionConfig load_connection_config_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ConfigurationError("Cannot open database config: " + path);

  json j;
  try { j = json::parse(in); }
  catch (const json::exception& e) {
    throw ConfigurationError("invalid JSON in " + path + ": " + e.what());
  }
  if (!j.is_object()) throw ConfigurationError(path + ": expected a JSON object");

  auto get_s = [&](const char* k, const std::string& def = std::string()) {
    if (j.contains(k) && j[k].is_string()) return j[k].get<std::string>();
    return def;
  };
  auto get_i64 = [&](const char* k, int64_t def) {
    if (j.contains(k) && j[k].is_number_integer()) return j[k].get<int64_t>();
    return def;
  };

  ConnectionConfig cfg;
  cfg.mode      = parse_connection_mode(get_s("mode", "static"));
  cfg.host      = get_s("host");
  cfg.database  = get_s("database");
  cfg.user      = get_s("user");
  cfg.password  = get_s("password");
  cfg.client_id = get_s("client_id");
  const int64_t pool = get_i64("pool_size", 4);
  if (pool <= 0) throw ConfigurationError(path + ": 'pool_size' must be positive");
  cfg.pool_size            = static_cast<size_t>(pool);
  cfg.busy_timeout_ms      = to_int(get_i64("busy_timeout_ms", 5000), path + ": 'busy_timeout_ms'");
  cfg.auth_timeout_seconds = to_int(get_i64("auth_timeout_seconds", 10), path + ": 'auth_timeout_seconds'");
  validate(cfg);
  return cfg;
}

ConnectionConfig load_connection_config_env() {
  ConnectionConfig cfg;
  cfg.mode      = parse_connection_mode(get_env_or("PJT_DB_MODE", "static"));
  cfg.host      = get_env_or("PJT_DB_HOST", "");
  cfg.database  = get_env_or("PJT_DB_NAME", "data/pano-jobs.db");
  cfg.user      = get_env_or("PJT_DB_USER", "");
  cfg.password  = get_env_or("PJT_DB_PASSWORD", "");
  cfg.client_id = get_env_or("PJT_DB_CLIENT_ID", "");
  const long long pool = env_int_or("PJT_DB_POOL_SIZE", 4);
  if (pool <= 0) throw ConfigurationError("PJT_DB_POOL_SIZE must be positive");
  cfg.pool_size            = static_cast<size_t>(pool);
  cfg.busy_timeout_ms      = to_int(env_int_or("PJT_DB_BUSY_TIMEOUT_MS", 5000), "PJT_DB_BUSY_TIMEOUT_MS");
  cfg.auth_timeout_seconds = to_int(env_int_or("PJT_AUTH_TIMEOUT", 10), "PJT_AUTH_TIMEOUT");
  validate(cfg);
  return cfg;
}

} // namespace pjt
