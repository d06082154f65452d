#include "authkit/oidc/oidc_flows.h"

#include <fstream>
#include <sstream>

#include "authkit/auth/auth_error.h"
#include "authkit/oidc/jwt.h"
#include "authkit/oidc/oidc_request_authenticator.h"

#define AUTHKIT_LOG_COMPONENT "authkit.flow"
#include "authkit/logging/log_macros.h"

namespace authkit {
namespace oidc {

namespace {

std::string read_text_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw ConfigError("Cannot read " + path,
                      "authorization_callback_acknowledgement_file");
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

// The ID token came straight from the token endpoint over TLS; only the
// nonce binding to our request is checked here
void check_id_token_nonce(const nlohmann::json& token_response,
                          const std::string& expected_nonce) {
  auto it = token_response.find("id_token");
  if (it == token_response.end() || !it->is_string()) {
    return;
  }
  auto claims = TokenInspector::unverified_claims(it->get<std::string>());
  if (!claims) {
    throw FlowError("Token endpoint returned an undecodable ID token");
  }
  auto nonce = claims->find("nonce");
  if (nonce == claims->end()) {
    throw FlowError("ID token carries no nonce although one was requested");
  }
  if (!nonce->is_string() || nonce->get<std::string>() != expected_nonce) {
    throw FlowError("ID token nonce does not match the authorization request");
  }
}

// Missing, non-numeric and non-positive values all take the fallback
int64_t json_seconds(const nlohmann::json& object, const char* key,
                     int64_t fallback) {
  auto it = object.find(key);
  if (it != object.end() && it->is_number()) {
    int64_t value = it->get<int64_t>();
    if (value > 0) {
      return value;
    }
  }
  return fallback;
}

std::string json_string(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  if (it != object.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return std::string();
}

}  // namespace

// AuthCodeAuthClient

AuthCodeAuthClient::AuthCodeAuthClient(const AuthCodeClientConfig& config,
                                       AuthClientContext context)
    : OidcLoginClient(config.server, config.client_auth, std::move(context)),
      config_(config) {}

std::string AuthCodeAuthClient::acknowledgement_html() const {
  if (config_.authorization_callback_acknowledgement) {
    return *config_.authorization_callback_acknowledgement;
  }
  if (config_.authorization_callback_acknowledgement_file) {
    return read_text_file(*config_.authorization_callback_acknowledgement_file);
  }
  return "";
}

std::shared_ptr<OidcCredential> AuthCodeAuthClient::oidc_flow_login(
    const LoginOptions& options) {
  AuthorizationResult result;
  if (options.allow_open_browser) {
    const optional<std::string>& local =
        config_.local_redirect_uri ? config_.local_redirect_uri
                                   : config_.redirect_uri;
    if (!local) {
      throw ConfigError("is required to log in with a browser",
                        "local_redirect_uri");
    }
    result = authorization_client().authcode_with_browser(
        *local, options.requested_scopes, options.requested_audiences,
        options.extra, *interaction(), acknowledgement_html());
  } else if (options.allow_tty_prompt) {
    if (!config_.redirect_uri) {
      throw ConfigError("is required to log in without a browser",
                        "redirect_uri");
    }
    result = authorization_client().authcode_with_prompt(
        *config_.redirect_uri, options.requested_scopes,
        options.requested_audiences, options.extra, *interaction());
  } else {
    throw FlowError(
        "Authorization code login needs a browser or a terminal prompt, and "
        "neither is allowed");
  }

  AUTHKIT_LOG(Debug, "Authorization code received on {}", result.redirect_uri);
  nlohmann::json response = token_client().get_token_from_code(
      result.redirect_uri, result.code, result.code_verifier);
  check_id_token_nonce(response, result.nonce);
  return std::make_shared<OidcCredential>(response);
}

// DeviceCodeAuthClient

DeviceCodeAuthClient::DeviceCodeAuthClient(const DeviceCodeClientConfig& config,
                                           AuthClientContext context)
    : OidcLoginClient(config.server, config.client_auth, std::move(context)) {}

nlohmann::json DeviceCodeAuthClient::device_login_initiate(
    const LoginOptions& options) {
  LoginOptions effective = apply_config_fallback(options);
  return device_authorization_client().request_device_code(
      effective.requested_scopes, effective.requested_audiences,
      effective.extra);
}

std::shared_ptr<Credential> DeviceCodeAuthClient::device_login_complete(
    const nlohmann::json& initiated_login) {
  auto device_code = initiated_login.find("device_code");
  if (device_code == initiated_login.end() || !device_code->is_string()) {
    throw FlowError("Device login state carries no device_code");
  }
  int64_t expires_in =
      json_seconds(initiated_login, "expires_in",
                   DeviceAuthorizationApiClient::kDefaultExpiresIn);
  int64_t interval = json_seconds(initiated_login, "interval",
                                  DeviceAuthorizationApiClient::kDefaultInterval);

  nlohmann::json response = token_client().poll_for_token_from_device_code(
      device_code->get<std::string>(), std::chrono::seconds(expires_in),
      std::chrono::seconds(interval));
  return std::make_shared<OidcCredential>(response);
}

std::shared_ptr<OidcCredential> DeviceCodeAuthClient::oidc_flow_login(
    const LoginOptions& options) {
  if (!options.allow_open_browser && !options.allow_tty_prompt) {
    throw FlowError(
        "Device code login needs a browser or a terminal, and neither is "
        "allowed");
  }

  // Fallback already applied by login()
  nlohmann::json initiated = device_authorization_client().request_device_code(
      options.requested_scopes, options.requested_audiences, options.extra);

  AUTHKIT_LOG(Debug, "Device code issued, waiting up to {}s for approval",
              json_seconds(initiated, "expires_in",
                           DeviceAuthorizationApiClient::kDefaultExpiresIn));

  bool opened = false;
  if (options.allow_open_browser) {
    std::string url = json_string(initiated, "verification_uri_complete");
    if (url.empty()) {
      url = json_string(initiated, "verification_uri");
    }
    opened = interaction()->open_browser(url);
  }
  if (options.allow_tty_prompt || !opened) {
    interaction()->present_device_code(initiated, options.display_qr_code);
  }

  return std::static_pointer_cast<OidcCredential>(
      device_login_complete(initiated));
}

// ClientCredentialsAuthClient

ClientCredentialsAuthClient::ClientCredentialsAuthClient(
    const ClientCredentialsClientConfig& config, AuthClientContext context)
    : OidcLoginClient(config.server, config.client_auth, std::move(context)) {
  if (holds_alternative<PublicClientAuth>(config.client_auth)) {
    throw ConfigError("Client credentials need a client secret or key",
                      "client_secret");
  }
}

std::shared_ptr<OidcCredential> ClientCredentialsAuthClient::oidc_flow_login(
    const LoginOptions& options) {
  nlohmann::json response = token_client().get_token_from_client_credentials(
      options.requested_scopes, options.requested_audiences, options.extra);
  return std::make_shared<OidcCredential>(response);
}

// ResourceOwnerAuthClient

ResourceOwnerAuthClient::ResourceOwnerAuthClient(
    const ResourceOwnerClientConfig& config, AuthClientContext context)
    : OidcLoginClient(config.server, config.client_auth, std::move(context)) {}

std::shared_ptr<OidcCredential> ResourceOwnerAuthClient::oidc_flow_login(
    const LoginOptions& options) {
  std::string username;
  std::string password;
  if (options.username) {
    username = *options.username;
  } else if (options.allow_tty_prompt) {
    username = interaction()->prompt("Username: ");
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

  nlohmann::json response = token_client().get_token_from_password(
      username, password, options.requested_scopes,
      options.requested_audiences, options.extra);
  return std::make_shared<OidcCredential>(response);
}

std::shared_ptr<CredentialRequestAuthenticator>
ResourceOwnerAuthClient::default_request_authenticator(
    std::shared_ptr<Credential> credential) {
  return std::make_shared<RefreshingOidcTokenRequestAuthenticator>(
      as_oidc_credential(credential), shared_from_this());
}

// OidcClientValidatorAuthClient

OidcClientValidatorAuthClient::OidcClientValidatorAuthClient(
    const ClientValidatorConfig& config, AuthClientContext context)
    : OidcAuthClient(config.server, PublicClientAuth(), std::move(context)) {}

std::shared_ptr<CredentialRequestAuthenticator>
OidcClientValidatorAuthClient::default_request_authenticator(
    std::shared_ptr<Credential> credential) {
  return std::make_shared<ForbiddenRequestAuthenticator>(
      std::move(credential));
}

}  // namespace oidc
}  // namespace authkit
