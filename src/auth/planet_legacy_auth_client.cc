#include "authkit/auth/planet_legacy_auth_client.h"

#include "authkit/auth/auth_error.h"
#include "authkit/oidc/jwt.h"

#define AUTHKIT_LOG_COMPONENT "authkit.flow.legacy"
#include "authkit/logging/log_macros.h"

namespace authkit {

std::string LegacyAuthApiClient::login(const std::string& username,
                                       const std::string& password) {
  nlohmann::json payload = {{"email", username}, {"password", password}};
  nlohmann::json response = checked_post_json_json(payload);
  auto token = response.find("token");
  if (token == response.end() || !token->is_string() ||
      token->get<std::string>().empty()) {
    throw PayloadError("Legacy login response carries no token");
  }
  return token->get<std::string>();
}

PlanetLegacyAuthClient::PlanetLegacyAuthClient(
    const PlanetLegacyClientConfig& config, AuthClientContext context)
    : AuthClient(std::move(context)),
      config_(config),
      api_client_(context_.http, config.legacy_auth_endpoint) {
  if (config_.legacy_auth_endpoint.empty()) {
    throw ConfigError("is required", "legacy_auth_endpoint");
  }
}

std::shared_ptr<Credential> PlanetLegacyAuthClient::login(
    const LoginOptions& options) {
  if (config_.api_key && !config_.api_key->empty()) {
    return std::make_shared<LegacyApiKeyCredential>(
        nlohmann::json{{"api_key", *config_.api_key}});
  }

  std::string username;
  std::string password;
  if (options.username) {
    username = *options.username;
  } else if (options.allow_tty_prompt) {
    username = interaction()->prompt("Email: ");
  } else {
    throw FlowError("No username given and prompting is not allowed");
  }
  if (options.password) {
    password = *options.password;
  } else if (options.allow_tty_prompt) {
    password = interaction()->prompt_secret("Password: ");
  } else {
    throw FlowError("No password given and prompting is not allowed");
  }

  AUTHKIT_LOG(Info, "Logging in to {}", config_.legacy_auth_endpoint);
  std::string token = api_client_.login(username, password);

  auto claims = oidc::TokenInspector::unverified_claims(token);
  if (!claims) {
    throw PayloadError("Legacy login returned an undecodable token");
  }
  auto api_key = claims->find("api_key");
  if (api_key == claims->end() || !api_key->is_string()) {
    throw PayloadError("Legacy login token carries no api_key claim");
  }
  return std::make_shared<LegacyApiKeyCredential>(
      nlohmann::json{{"api_key", api_key->get<std::string>()},
                     {"token", token}});
}

std::shared_ptr<Credential> PlanetLegacyAuthClient::credential_from_file(
    const optional<std::string>& path) {
  return std::make_shared<LegacyApiKeyCredential>(nullopt, path);
}

std::shared_ptr<CredentialRequestAuthenticator>
PlanetLegacyAuthClient::default_request_authenticator(
    std::shared_ptr<Credential> credential) {
  std::shared_ptr<LegacyApiKeyCredential> legacy;
  if (credential) {
    legacy = std::dynamic_pointer_cast<LegacyApiKeyCredential>(credential);
    if (!legacy) {
      throw ConfigError("Legacy API key authentication needs a "
                        "LegacyApiKeyCredential");
    }
  }
  return std::make_shared<LegacyApiKeyRequestAuthenticator>(legacy);
}

}  // namespace authkit
