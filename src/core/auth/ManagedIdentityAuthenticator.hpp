#pragma once
#include <string>

#include "Authenticator.hpp"

namespace pjt {

// Token exchange against the instance metadata service (managed identity).
// `identity` passed to acquire() is the client id of the user-assigned identity.
class ManagedIdentityAuthenticator : public Authenticator {
public:
  struct Options {
    std::string endpoint = "http://169.254.169.254";
    std::string path     = "/metadata/identity/oauth2/token";
    std::string apiVersion = "2018-02-01";
    std::string resource = "https://ossrdbms-aad.database.windows.net";
    int timeoutSeconds = 10;
  };

  ManagedIdentityAuthenticator();
  explicit ManagedIdentityAuthenticator(Options opts);

  Credential acquire(const std::string& identity) override;

  // Parses the token endpoint's JSON body. Throws AuthError on malformed input.
  static Credential parseTokenResponse(const std::string& body);

private:
  Options opts_;
};

} // namespace pjt
