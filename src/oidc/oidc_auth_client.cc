#include "authkit/oidc/oidc_auth_client.h"

#include <memory>

#include "authkit/auth/auth_error.h"
#include "authkit/oidc/oidc_request_authenticator.h"

#define AUTHKIT_LOG_COMPONENT "authkit.flow"
#include "authkit/logging/log_macros.h"

namespace authkit {
namespace oidc {

namespace {

struct ClientAuthFactory {
  const std::string& client_id;

  std::shared_ptr<ClientAuthEnricher> operator()(
      const PublicClientAuth&) const {
    return std::make_shared<NoClientAuth>(client_id);
  }
  std::shared_ptr<ClientAuthEnricher> operator()(
      const ClientSecretConfig& secret) const {
    if (secret.auth_method == ClientSecretAuthMethod::POST) {
      return std::make_shared<ClientSecretPostAuth>(client_id,
                                                    secret.client_secret);
    }
    return std::make_shared<ClientSecretBasicAuth>(client_id,
                                                   secret.client_secret);
  }
  std::shared_ptr<ClientAuthEnricher> operator()(
      const ClientPubkeyConfig& pubkey) const {
    return std::make_shared<PrivateKeyJwtAuth>(
        client_id, pubkey.client_privkey, pubkey.client_privkey_file,
        pubkey.client_privkey_password);
  }
};

// A configured CA bundle applies when the client builds its own transport
AuthClientContext with_ca_bundle(AuthClientContext context,
                                 const OidcServerConfig& server) {
  if (!context.http && server.ca_bundle) {
    CurlHttpTransport::Config transport_config;
    transport_config.ca_bundle_path = *server.ca_bundle;
    context.http = std::make_shared<HttpClient>(
        std::make_shared<CurlHttpTransport>(transport_config));
  }
  return context;
}

}  // namespace

std::shared_ptr<ClientAuthEnricher> make_client_auth(
    const std::string& client_id, const ClientAuthConfig& config) {
  return visit(ClientAuthFactory{client_id}, config);
}

OidcAuthClient::OidcAuthClient(const OidcServerConfig& server,
                               const ClientAuthConfig& client_auth,
                               AuthClientContext context)
    : AuthClient(with_ca_bundle(std::move(context), server)),
      server_(server),
      client_auth_(make_client_auth(server.client_id, client_auth)) {
  if (server_.auth_server.empty()) {
    throw ConfigError("is required", "auth_server");
  }
  if (server_.client_id.empty()) {
    throw ConfigError("is required", "client_id");
  }
}

std::string OidcAuthClient::resolve_endpoint(
    const optional<std::string>& configured, const char* discovery_key) {
  if (configured && !configured->empty()) {
    return *configured;
  }
  auto discovered = discovery_client().metadata_value(discovery_key);
  if (!discovered) {
    throw ConfigError(std::string("No ") + discovery_key +
                      " configured or published by " + server_.auth_server);
  }
  return *discovered;
}

DiscoveryApiClient& OidcAuthClient::discovery_client() {
  if (!discovery_client_) {
    discovery_client_ = std::make_unique<DiscoveryApiClient>(
        context_.http, server_.auth_server);
  }
  return *discovery_client_;
}

TokenApiClient& OidcAuthClient::token_client() {
  if (!token_client_) {
    token_client_ = std::make_unique<TokenApiClient>(
        context_.http,
        resolve_endpoint(server_.token_endpoint, "token_endpoint"),
        client_auth_);
  }
  return *token_client_;
}

AuthorizationApiClient& OidcAuthClient::authorization_client() {
  if (!authorization_client_) {
    authorization_client_ = std::make_unique<AuthorizationApiClient>(
        resolve_endpoint(server_.authorization_endpoint,
                         "authorization_endpoint"),
        server_.client_id);
  }
  return *authorization_client_;
}

DeviceAuthorizationApiClient& OidcAuthClient::device_authorization_client() {
  if (!device_authorization_client_) {
    device_authorization_client_ =
        std::make_unique<DeviceAuthorizationApiClient>(
            context_.http,
            resolve_endpoint(server_.device_authorization_endpoint,
                             "device_authorization_endpoint"),
            client_auth_);
  }
  return *device_authorization_client_;
}

IntrospectionApiClient& OidcAuthClient::introspection_client() {
  if (!introspection_client_) {
    introspection_client_ = std::make_unique<IntrospectionApiClient>(
        context_.http,
        resolve_endpoint(server_.introspection_endpoint,
                         "introspection_endpoint"),
        client_auth_);
  }
  return *introspection_client_;
}

RevocationApiClient& OidcAuthClient::revocation_client() {
  if (!revocation_client_) {
    revocation_client_ = std::make_unique<RevocationApiClient>(
        context_.http,
        resolve_endpoint(server_.revocation_endpoint, "revocation_endpoint"),
        client_auth_);
  }
  return *revocation_client_;
}

UserinfoApiClient& OidcAuthClient::userinfo_client() {
  if (!userinfo_client_) {
    userinfo_client_ = std::make_unique<UserinfoApiClient>(
        context_.http,
        resolve_endpoint(server_.userinfo_endpoint, "userinfo_endpoint"));
  }
  return *userinfo_client_;
}

std::shared_ptr<JwksClient> OidcAuthClient::jwks_client() {
  if (!jwks_client_) {
    JwksClientConfig jwks_config;
    jwks_config.jwks_uri = resolve_endpoint(server_.jwks_endpoint, "jwks_uri");
    jwks_client_ = std::make_shared<JwksClient>(context_.http, jwks_config);
  }
  return jwks_client_;
}

TokenValidator& OidcAuthClient::token_validator() {
  if (!token_validator_) {
    token_validator_ = std::make_unique<TokenValidator>(jwks_client());
  }
  return *token_validator_;
}

const nlohmann::json& OidcAuthClient::oidc_discovery() {
  return discovery_client().discovery();
}

std::string OidcAuthClient::issuer() {
  if (!issuer_) {
    if (server_.issuer && !server_.issuer->empty()) {
      issuer_ = *server_.issuer;
    } else {
      auto discovered = discovery_client().metadata_value("issuer");
      if (!discovered) {
        throw ConfigError("No issuer configured or published by " +
                              server_.auth_server,
                          "issuer");
      }
      issuer_ = *discovered;
    }
  }
  return *issuer_;
}

std::shared_ptr<Credential> OidcAuthClient::credential_from_file(
    const optional<std::string>& path) {
  return std::make_shared<OidcCredential>(nullopt, path);
}

nlohmann::json OidcAuthClient::validate_access_token_local(
    const std::string& access_token,
    const std::string& required_audience,
    const std::vector<std::string>& scopes_anyof) {
  std::string audience = required_audience;
  if (audience.empty()) {
    // One audience only: a token for several audiences must not pass
    // because it names any one of them
    if (server_.audiences.empty()) {
      throw ConfigError(
          "No audience given for token validation and none is configured",
          "audiences");
    }
    if (server_.audiences.size() != 1) {
      throw ConfigError(
          "Token validation against the configured audiences needs exactly "
          "one audience",
          "audiences");
    }
    audience = server_.audiences.front();
  }
  return token_validator().validate_token(access_token, issuer(), audience,
                                          scopes_anyof);
}

nlohmann::json OidcAuthClient::validate_access_token_remote(
    const std::string& access_token) {
  return introspection_client().validate_access_token(access_token);
}

nlohmann::json OidcAuthClient::validate_id_token_local(
    const std::string& id_token, const std::string& nonce) {
  return token_validator().validate_token(id_token, issuer(),
                                          server_.client_id, {}, nonce);
}

nlohmann::json OidcAuthClient::validate_id_token_remote(
    const std::string& id_token) {
  return introspection_client().validate_id_token(id_token);
}

nlohmann::json OidcAuthClient::validate_refresh_token_remote(
    const std::string& refresh_token) {
  return introspection_client().validate_refresh_token(refresh_token);
}

void OidcAuthClient::revoke_access_token(const std::string& access_token) {
  revocation_client().revoke_access_token(access_token);
}

void OidcAuthClient::revoke_refresh_token(const std::string& refresh_token) {
  revocation_client().revoke_refresh_token(refresh_token);
}

nlohmann::json OidcAuthClient::userinfo_from_access_token(
    const std::string& access_token) {
  return userinfo_client().userinfo_from_access_token(access_token);
}

std::vector<std::string> OidcAuthClient::get_scopes() {
  std::vector<std::string> scopes;
  const nlohmann::json& metadata = oidc_discovery();
  auto it = metadata.find("scopes_supported");
  if (it != metadata.end() && it->is_array()) {
    for (const auto& scope : *it) {
      if (scope.is_string()) {
        scopes.push_back(scope.get<std::string>());
      }
    }
  }
  return scopes;
}

LoginOptions OidcLoginClient::apply_config_fallback(
    LoginOptions options) const {
  if (options.requested_scopes.empty()) {
    options.requested_scopes = server_.scopes;
  }
  if (options.requested_audiences.empty()) {
    options.requested_audiences = server_.audiences;
  }
  auto fill = [&options](const char* key, const optional<std::string>& value) {
    auto it = options.extra.find(key);
    if (value && (it == options.extra.end() || it->second.empty())) {
      options.extra[key] = *value;
    }
  };
  fill("organization", server_.organization);
  fill("project_id", server_.project_id);
  return options;
}

std::shared_ptr<Credential> OidcLoginClient::login(
    const LoginOptions& options) {
  LoginOptions effective = apply_config_fallback(options);
  AUTHKIT_LOG(Info, "Logging in to {} as client {}", server_.auth_server,
              server_.client_id);
  return oidc_flow_login(effective);
}

std::shared_ptr<OidcCredential> OidcLoginClient::refresh(
    const std::string& refresh_token,
    const std::vector<std::string>& requested_scopes,
    const util::FormData& extra) {
  if (refresh_token.empty()) {
    throw FlowError("No refresh token available");
  }
  nlohmann::json response =
      token_client().get_token_from_refresh(refresh_token, requested_scopes,
                                            extra);
  if (!response.contains("refresh_token")) {
    response["refresh_token"] = refresh_token;
  }
  AUTHKIT_LOG(Debug, "Refreshed tokens from {}", server_.auth_server);
  return std::make_shared<OidcCredential>(response);
}

std::shared_ptr<CredentialRequestAuthenticator>
OidcLoginClient::default_request_authenticator(
    std::shared_ptr<Credential> credential) {
  return std::make_shared<RefreshOrReloginOidcTokenRequestAuthenticator>(
      as_oidc_credential(credential), shared_from_this());
}

}  // namespace oidc
}  // namespace authkit
