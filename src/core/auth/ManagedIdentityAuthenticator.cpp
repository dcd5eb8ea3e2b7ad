#include "ManagedIdentityAuthenticator.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

using nlohmann::json;

namespace pjt {

ManagedIdentityAuthenticator::ManagedIdentityAuthenticator()
  : ManagedIdentityAuthenticator(Options{}) {}

ManagedIdentityAuthenticator::ManagedIdentityAuthenticator(Options opts)
  : opts_(std::move(opts)) {}

Credential ManagedIdentityAuthenticator::acquire(const std::string& identity) {
  httplib::Client cli(opts_.endpoint);
  cli.set_connection_timeout(opts_.timeoutSeconds, 0);
  cli.set_read_timeout(opts_.timeoutSeconds, 0);

  httplib::Params params{
    {"api-version", opts_.apiVersion},
    {"resource", opts_.resource},
  };
  if (!identity.empty()) params.emplace("client_id", identity);
  const httplib::Headers headers{{"Metadata", "true"}};

  auto res = cli.Get(opts_.path, params, headers);
  if (!res) {
    throw AuthError("token request to " + opts_.endpoint + " failed: " +
                    httplib::to_string(res.error()));
  }
  if (res->status != 200) {
    spdlog::error("Identity endpoint answered {}: {}", res->status, res->body);
    throw AuthError("token request rejected with HTTP " + std::to_string(res->status));
  }
  return parseTokenResponse(res->body);
}

Credential ManagedIdentityAuthenticator::parseTokenResponse(const std::string& body) {
  json j;
  try { j = json::parse(body); }
  catch (const json::exception& e) {
    throw AuthError(std::string("invalid JSON in token response: ") + e.what());
  }

  if (!j.contains("access_token") || !j["access_token"].is_string()) {
    throw AuthError("token response has no access_token");
  }

  // expires_on is epoch seconds, sent as a string by the metadata service.
  int64_t expiresOn = 0;
  const auto it = j.find("expires_on");
  if (it == j.end()) throw AuthError("token response has no expires_on");
  if (it->is_number_integer()) {
    expiresOn = it->get<int64_t>();
  } else if (it->is_string()) {
    try { expiresOn = std::stoll(it->get<std::string>()); }
    catch (const std::exception&) { throw AuthError("unparseable expires_on in token response"); }
  } else {
    throw AuthError("unparseable expires_on in token response");
  }

  Credential c;
  c.token = j["access_token"].get<std::string>();
  c.expires_at = std::chrono::system_clock::time_point(std::chrono::seconds(expiresOn));
  return c;
}

} // namespace pjt
