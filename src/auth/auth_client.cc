#include "authkit/auth/auth_client.h"

#include "authkit/auth/auth_error.h"
#include "authkit/auth/planet_legacy_auth_client.h"
#include "authkit/auth/static_api_key_auth_client.h"
#include "authkit/oidc/oidc_flows.h"

#define AUTHKIT_LOG_COMPONENT "authkit.config"
#include "authkit/logging/log_macros.h"

namespace authkit {

namespace {

struct ClientFactory {
  AuthClientContext context;

  std::shared_ptr<AuthClient> operator()(const AuthCodeClientConfig& c) const {
    return std::make_shared<oidc::AuthCodeAuthClient>(c, context);
  }
  std::shared_ptr<AuthClient> operator()(
      const DeviceCodeClientConfig& c) const {
    return std::make_shared<oidc::DeviceCodeAuthClient>(c, context);
  }
  std::shared_ptr<AuthClient> operator()(
      const ClientCredentialsClientConfig& c) const {
    return std::make_shared<oidc::ClientCredentialsAuthClient>(c, context);
  }
  std::shared_ptr<AuthClient> operator()(
      const ResourceOwnerClientConfig& c) const {
    return std::make_shared<oidc::ResourceOwnerAuthClient>(c, context);
  }
  std::shared_ptr<AuthClient> operator()(const ClientValidatorConfig& c) const {
    return std::make_shared<oidc::OidcClientValidatorAuthClient>(c, context);
  }
  std::shared_ptr<AuthClient> operator()(
      const PlanetLegacyClientConfig& c) const {
    return std::make_shared<PlanetLegacyAuthClient>(c, context);
  }
  std::shared_ptr<AuthClient> operator()(
      const StaticApiKeyClientConfig& c) const {
    return std::make_shared<StaticApiKeyAuthClient>(c, context);
  }
  std::shared_ptr<AuthClient> operator()(const NoneClientConfig& c) const {
    return std::make_shared<NoneAuthClient>(c, context);
  }
};

}  // namespace

AuthClient::AuthClient(AuthClientContext context)
    : context_(std::move(context)) {
  if (!context_.http) {
    context_.http = std::make_shared<HttpClient>();
  }
  if (!context_.interaction) {
    context_.interaction = std::make_shared<ConsoleUserInteraction>();
  }
}

std::shared_ptr<AuthClient> AuthClient::from_config(
    const AuthClientConfig& config, AuthClientContext context) {
  AUTHKIT_LOG(Debug, "Creating {} auth client", config.client_type());
  return visit(ClientFactory{std::move(context)}, config.value());
}

NoneAuthClient::NoneAuthClient(const NoneClientConfig& /*config*/,
                               AuthClientContext context)
    : AuthClient(std::move(context)) {}

std::shared_ptr<Credential> NoneAuthClient::credential_from_file(
    const optional<std::string>& path) {
  return std::make_shared<Credential>(nullopt, path);
}

std::shared_ptr<CredentialRequestAuthenticator>
NoneAuthClient::default_request_authenticator(
    std::shared_ptr<Credential> /*credential*/) {
  return std::make_shared<SimpleInMemoryRequestAuthenticator>();
}

}  // namespace authkit
