#ifndef AUTHKIT_OIDC_OIDC_AUTH_CLIENT_H
#define AUTHKIT_OIDC_OIDC_AUTH_CLIENT_H

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "authkit/auth/auth_client.h"
#include "authkit/oidc/authorization_api_client.h"
#include "authkit/oidc/client_auth.h"
#include "authkit/oidc/device_authorization_api_client.h"
#include "authkit/oidc/discovery_api_client.h"
#include "authkit/oidc/introspection_api_client.h"
#include "authkit/oidc/jwks_client.h"
#include "authkit/oidc/revocation_api_client.h"
#include "authkit/oidc/token_api_client.h"
#include "authkit/oidc/token_validator.h"
#include "authkit/oidc/userinfo_api_client.h"

/**
 * @file oidc_auth_client.h
 * @brief Shared machinery of every OAuth2/OIDC client kind
 */

namespace authkit {
namespace oidc {

// Enricher matching a configured client authentication method
std::shared_ptr<ClientAuthEnricher> make_client_auth(
    const std::string& client_id, const ClientAuthConfig& config);

/**
 * @brief Endpoint clients, validation, revocation and userinfo
 *
 * Endpoint clients are created on first use. Their URIs come from the
 * configuration when set there, otherwise from the discovery document;
 * an endpoint found in neither raises ConfigError.
 */
class OidcAuthClient : public AuthClient, public TokenValidating {
 public:
  OidcAuthClient(const OidcServerConfig& server,
                 const ClientAuthConfig& client_auth,
                 AuthClientContext context);

  TokenValidating* as_token_validating() override { return this; }

  std::shared_ptr<Credential> credential_from_file(
      const optional<std::string>& path) override;

  /**
   * @brief Validate an access token against the issuer's keys
   *
   * Without required_audience the configured audience is used, which
   * must then be exactly one.
   * @throws ConfigError when no single audience can be determined
   * @throws ValidationError
   */
  nlohmann::json validate_access_token_local(
      const std::string& access_token,
      const std::string& required_audience = "",
      const std::vector<std::string>& scopes_anyof = {}) override;

  nlohmann::json validate_access_token_remote(
      const std::string& access_token) override;

  // Audience is the client_id
  nlohmann::json validate_id_token_local(const std::string& id_token,
                                         const std::string& nonce = "");
  nlohmann::json validate_id_token_remote(const std::string& id_token);
  nlohmann::json validate_refresh_token_remote(
      const std::string& refresh_token);

  void revoke_access_token(const std::string& access_token);
  void revoke_refresh_token(const std::string& refresh_token);

  nlohmann::json userinfo_from_access_token(const std::string& access_token);

  // scopes_supported from the discovery document
  std::vector<std::string> get_scopes();

  const nlohmann::json& oidc_discovery();

  // Configured issuer, else the one named by discovery
  std::string issuer();

  const OidcServerConfig& server_config() const { return server_; }
  const std::shared_ptr<ClientAuthEnricher>& client_auth() const {
    return client_auth_;
  }

  DiscoveryApiClient& discovery_client();
  TokenApiClient& token_client();
  AuthorizationApiClient& authorization_client();
  DeviceAuthorizationApiClient& device_authorization_client();
  IntrospectionApiClient& introspection_client();
  RevocationApiClient& revocation_client();
  UserinfoApiClient& userinfo_client();
  std::shared_ptr<JwksClient> jwks_client();
  TokenValidator& token_validator();

 protected:
  std::string resolve_endpoint(const optional<std::string>& configured,
                               const char* discovery_key);

  OidcServerConfig server_;

 private:
  std::shared_ptr<ClientAuthEnricher> client_auth_;
  std::unique_ptr<DiscoveryApiClient> discovery_client_;
  std::unique_ptr<TokenApiClient> token_client_;
  std::unique_ptr<AuthorizationApiClient> authorization_client_;
  std::unique_ptr<DeviceAuthorizationApiClient> device_authorization_client_;
  std::unique_ptr<IntrospectionApiClient> introspection_client_;
  std::unique_ptr<RevocationApiClient> revocation_client_;
  std::unique_ptr<UserinfoApiClient> userinfo_client_;
  std::shared_ptr<JwksClient> jwks_client_;
  std::unique_ptr<TokenValidator> token_validator_;
  optional<std::string> issuer_;
};

/**
 * @brief OIDC clients that can obtain and refresh tokens
 *
 * login() fills unset scopes, audiences, organization and project_id from
 * the configuration and hands over to the flow in oidc_flow_login().
 */
class OidcLoginClient : public OidcAuthClient,
                        public Loginable,
                        public Refreshable {
 public:
  using OidcAuthClient::OidcAuthClient;

  Loginable* as_loginable() override { return this; }
  Refreshable* as_refreshable() override { return this; }

  std::shared_ptr<Credential> login(const LoginOptions& options) override;

  /**
   * A response without a refresh_token keeps the one that was used, so
   * servers that do not rotate refresh tokens keep working.
   */
  std::shared_ptr<OidcCredential> refresh(
      const std::string& refresh_token,
      const std::vector<std::string>& requested_scopes = {},
      const util::FormData& extra = {}) override;

  // Refresh-or-relogin by default
  std::shared_ptr<CredentialRequestAuthenticator> default_request_authenticator(
      std::shared_ptr<Credential> credential) override;

  LoginOptions apply_config_fallback(LoginOptions options) const;

 protected:
  virtual std::shared_ptr<OidcCredential> oidc_flow_login(
      const LoginOptions& options) = 0;
};

}  // namespace oidc
}  // namespace authkit

#endif  // AUTHKIT_OIDC_OIDC_AUTH_CLIENT_H
