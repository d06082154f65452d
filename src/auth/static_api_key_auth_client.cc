#include "authkit/auth/static_api_key_auth_client.h"

#include "authkit/auth/auth_error.h"

namespace authkit {

StaticApiKeyAuthClient::StaticApiKeyAuthClient(
    const StaticApiKeyClientConfig& config, AuthClientContext context)
    : AuthClient(std::move(context)), config_(config) {
  if (config_.api_key.empty()) {
    throw ConfigError("is required", "api_key");
  }
}

std::shared_ptr<Credential> StaticApiKeyAuthClient::login(
    const LoginOptions& /*options*/) {
  return std::make_shared<StaticApiKeyCredential>(config_.api_key,
                                                  config_.bearer_token_prefix);
}

std::shared_ptr<Credential> StaticApiKeyAuthClient::credential_from_file(
    const optional<std::string>& path) {
  return std::make_shared<StaticApiKeyCredential>(nullopt, path);
}

std::shared_ptr<CredentialRequestAuthenticator>
StaticApiKeyAuthClient::default_request_authenticator(
    std::shared_ptr<Credential> credential) {
  std::shared_ptr<StaticApiKeyCredential> key;
  if (credential) {
    key = std::dynamic_pointer_cast<StaticApiKeyCredential>(credential);
    if (!key) {
      throw ConfigError(
          "Static API key authentication needs a StaticApiKeyCredential");
    }
  }
  return std::make_shared<StaticApiKeyRequestAuthenticator>(key);
}

}  // namespace authkit
