#ifndef AUTHKIT_AUTH_PLANET_LEGACY_AUTH_CLIENT_H
#define AUTHKIT_AUTH_PLANET_LEGACY_AUTH_CLIENT_H

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "authkit/auth/api_client.h"
#include "authkit/auth/auth_client.h"

namespace authkit {

/**
 * @brief The legacy username/password login endpoint
 *
 * POST {"email": ..., "password": ...}; the reply is {"token": <JWT>} whose
 * "api_key" claim is the key to use.
 */
class LegacyAuthApiClient : public ApiClient {
 public:
  using ApiClient::ApiClient;

  // Returns the JWT from the "token" member
  std::string login(const std::string& username, const std::string& password);
};

/**
 * @brief Exchanges a username and password for a legacy API key
 *
 * A key set in the configuration is used as is and no login request is
 * made.
 */
class PlanetLegacyAuthClient : public AuthClient, public Loginable {
 public:
  PlanetLegacyAuthClient(const PlanetLegacyClientConfig& config,
                         AuthClientContext context);

  Loginable* as_loginable() override { return this; }

  std::shared_ptr<Credential> login(const LoginOptions& options) override;

  std::shared_ptr<Credential> credential_from_file(
      const optional<std::string>& path) override;
  std::shared_ptr<CredentialRequestAuthenticator> default_request_authenticator(
      std::shared_ptr<Credential> credential) override;

  const PlanetLegacyClientConfig& config() const { return config_; }

 private:
  PlanetLegacyClientConfig config_;
  LegacyAuthApiClient api_client_;
};

}  // namespace authkit

#endif  // AUTHKIT_AUTH_PLANET_LEGACY_AUTH_CLIENT_H
