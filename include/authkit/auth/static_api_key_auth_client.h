#ifndef AUTHKIT_AUTH_STATIC_API_KEY_AUTH_CLIENT_H
#define AUTHKIT_AUTH_STATIC_API_KEY_AUTH_CLIENT_H

#include <memory>

#include "authkit/auth/auth_client.h"

namespace authkit {

// Pre-issued API key; login hands back the configured key without any I/O
class StaticApiKeyAuthClient : public AuthClient, public Loginable {
 public:
  StaticApiKeyAuthClient(const StaticApiKeyClientConfig& config,
                         AuthClientContext context);

  Loginable* as_loginable() override { return this; }

  std::shared_ptr<Credential> login(const LoginOptions& options) override;

  std::shared_ptr<Credential> credential_from_file(
      const optional<std::string>& path) override;
  std::shared_ptr<CredentialRequestAuthenticator> default_request_authenticator(
      std::shared_ptr<Credential> credential) override;

 private:
  StaticApiKeyClientConfig config_;
};

}  // namespace authkit

#endif  // AUTHKIT_AUTH_STATIC_API_KEY_AUTH_CLIENT_H
