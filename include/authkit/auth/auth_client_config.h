#ifndef AUTHKIT_AUTH_AUTH_CLIENT_CONFIG_H
#define AUTHKIT_AUTH_AUTH_CLIENT_CONFIG_H

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "authkit/core/compat.h"

/**
 * @file auth_client_config.h
 * @brief Closed set of client configurations, one struct per client kind
 *
 * A configuration file is a JSON (or YAML) object selected by its
 * "client_type" member:
 *
 *   {
 *     "client_type": "oidc_device_code",
 *     "auth_server": "https://login.example.com/oauth2/default",
 *     "client_id": "0oa1b2c3",
 *     "scopes": ["openid", "offline_access"],
 *     "audiences": ["https://api.example.com/"]
 *   }
 */

namespace authkit {

constexpr const char kDefaultLegacyAuthEndpoint[] =
    "https://api.planet.com/v0/auth/login";

enum class ClientSecretAuthMethod { BASIC, POST };

// Public client: identifies itself with client_id only
struct PublicClientAuth {};

struct ClientSecretConfig {
  std::string client_secret;
  ClientSecretAuthMethod auth_method = ClientSecretAuthMethod::BASIC;
};

// Signed JWT assertion; the key comes from the literal PEM or the file
struct ClientPubkeyConfig {
  optional<std::string> client_privkey;
  optional<std::string> client_privkey_file;
  optional<std::string> client_privkey_password;
};

using ClientAuthConfig =
    variant<PublicClientAuth, ClientSecretConfig, ClientPubkeyConfig>;

/**
 * @brief Settings shared by every OIDC client kind
 *
 * Endpoint members override the values found through discovery.
 */
struct OidcServerConfig {
  std::string auth_server;
  std::string client_id;
  optional<std::string> issuer;
  std::vector<std::string> audiences;
  std::vector<std::string> scopes;
  optional<std::string> organization;
  optional<std::string> project_id;

  optional<std::string> authorization_endpoint;
  optional<std::string> device_authorization_endpoint;
  optional<std::string> token_endpoint;
  optional<std::string> introspection_endpoint;
  optional<std::string> revocation_endpoint;
  optional<std::string> userinfo_endpoint;
  optional<std::string> jwks_endpoint;

  optional<std::string> ca_bundle;
};

struct AuthCodeClientConfig {
  OidcServerConfig server;
  ClientAuthConfig client_auth;
  // Registered redirect; used as is for manual (prompted) completion
  optional<std::string> redirect_uri;
  // Loopback redirect used when a browser is opened; falls back to
  // redirect_uri
  optional<std::string> local_redirect_uri;
  optional<std::string> authorization_callback_acknowledgement;
  optional<std::string> authorization_callback_acknowledgement_file;
};

struct DeviceCodeClientConfig {
  OidcServerConfig server;
  ClientAuthConfig client_auth;
};

// client_auth is never PublicClientAuth
struct ClientCredentialsClientConfig {
  OidcServerConfig server;
  ClientAuthConfig client_auth;
};

struct ResourceOwnerClientConfig {
  OidcServerConfig server;
  ClientAuthConfig client_auth;
};

// Validates tokens for a resource server, never logs in
struct ClientValidatorConfig {
  OidcServerConfig server;
};

struct PlanetLegacyClientConfig {
  std::string legacy_auth_endpoint = kDefaultLegacyAuthEndpoint;
  optional<std::string> api_key;
};

struct StaticApiKeyClientConfig {
  std::string api_key;
  std::string bearer_token_prefix = "Bearer";
};

struct NoneClientConfig {};

class AuthClientConfig {
 public:
  using Variant = variant<AuthCodeClientConfig,
                          DeviceCodeClientConfig,
                          ClientCredentialsClientConfig,
                          ResourceOwnerClientConfig,
                          ClientValidatorConfig,
                          PlanetLegacyClientConfig,
                          StaticApiKeyClientConfig,
                          NoneClientConfig>;

  /**
   * @brief Wrap a client configuration after checking its invariants
   * @throws ConfigError
   */
  AuthClientConfig(Variant config);

  /**
   * @throws ConfigError for unknown client types, missing or mistyped
   *         fields
   */
  static AuthClientConfig from_json(const nlohmann::json& json);

  /**
   * @brief Read a configuration file
   *
   * ".yaml" and ".yml" files are parsed as YAML, ".sops.json" and
   * ".sops.yaml" files are decrypted with sops first, anything else is
   * JSON.
   */
  static AuthClientConfig from_file(const std::string& path);

  // Includes secrets; absent optional members are omitted
  nlohmann::json to_json() const;

  // Canonical underscore spelling, e.g. "oidc_auth_code_secret"
  std::string client_type() const;

  const Variant& value() const { return config_; }

  // nullptr for non-OIDC client kinds
  const OidcServerConfig* oidc_server() const;

  /**
   * @brief Check invariants
   *
   * OIDC kinds need auth_server and client_id and at most one audience;
   * client credentials need a confidential client; secrets, keys and API
   * keys must be present.
   * @throws ConfigError
   */
  void validate() const;

 private:
  Variant config_;
};

// "oidc-auth-code" -> "oidc_auth_code"
std::string normalize_client_type(const std::string& client_type);

}  // namespace authkit

#endif  // AUTHKIT_AUTH_AUTH_CLIENT_CONFIG_H
