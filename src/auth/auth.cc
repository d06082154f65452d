#include "authkit/auth/auth.h"

#include "authkit/auth/auth_error.h"

#define AUTHKIT_LOG_COMPONENT "authkit.auth"
#include "authkit/logging/log_macros.h"

namespace authkit {

Auth::Auth(std::shared_ptr<AuthClient> auth_client,
           std::shared_ptr<CredentialRequestAuthenticator> request_authenticator,
           optional<std::string> token_file_path,
           optional<std::string> profile_name)
    : auth_client_(std::move(auth_client)),
      request_authenticator_(std::move(request_authenticator)),
      token_file_path_(std::move(token_file_path)),
      profile_name_(std::move(profile_name)) {
  if (!auth_client_ || !request_authenticator_) {
    throw ConfigError("Auth needs an auth client and a request authenticator");
  }
}

std::shared_ptr<Credential> Auth::adopt(std::shared_ptr<Credential> credential) {
  credential->set_path(token_file_path_);
  credential->save();
  request_authenticator_->update_credential(credential);
  if (token_file_path_) {
    AUTHKIT_LOG(Debug, "Saved new credential to {}", *token_file_path_);
  }
  return credential;
}

std::shared_ptr<Credential> Auth::login(const LoginOptions& options) {
  Loginable* loginable = auth_client_->as_loginable();
  if (!loginable) {
    throw FlowError("The configured client cannot log in");
  }
  return adopt(loginable->login(options));
}

nlohmann::json Auth::device_login_initiate(const LoginOptions& options) {
  DeviceLoginable* device = auth_client_->as_device_loginable();
  if (!device) {
    throw FlowError("The configured client has no device login");
  }
  return device->device_login_initiate(options);
}

std::shared_ptr<Credential> Auth::device_login_complete(
    const nlohmann::json& initiated_login) {
  DeviceLoginable* device = auth_client_->as_device_loginable();
  if (!device) {
    throw FlowError("The configured client has no device login");
  }
  return adopt(device->device_login_complete(initiated_login));
}

Auth Auth::initialize_from_client(std::shared_ptr<AuthClient> auth_client,
                                  const optional<std::string>& token_file,
                                  const optional<std::string>& profile_name) {
  if (!auth_client) {
    throw ConfigError("No auth client given");
  }
  auto credential = auth_client->credential_from_file(token_file);
  auto authenticator = auth_client->default_request_authenticator(credential);
  return Auth(std::move(auth_client), std::move(authenticator), token_file,
              profile_name);
}

Auth Auth::initialize_from_config(const AuthClientConfig& config,
                                  const optional<std::string>& token_file,
                                  const optional<std::string>& profile_name,
                                  AuthClientContext context) {
  return initialize_from_client(
      AuthClient::from_config(config, std::move(context)), token_file,
      profile_name);
}

Auth Auth::initialize_from_config_json(
    const nlohmann::json& config,
    const optional<std::string>& token_file,
    const optional<std::string>& profile_name,
    AuthClientContext context) {
  return initialize_from_config(AuthClientConfig::from_json(config),
                                token_file, profile_name, std::move(context));
}

Auth Auth::initialize_from_config_file(
    const std::string& config_file,
    const optional<std::string>& token_file,
    const optional<std::string>& profile_name,
    AuthClientContext context) {
  return initialize_from_config(AuthClientConfig::from_file(config_file),
                                token_file, profile_name, std::move(context));
}

Auth Auth::initialize_from_profile(ConfigProvider& provider,
                                   const std::string& profile_name,
                                   const optional<std::string>& token_file,
                                   AuthClientContext context) {
  optional<AuthClientConfig> config = provider.client_config(profile_name);
  if (!config) {
    throw ConfigError("Unknown profile " + profile_name, "profile");
  }
  optional<std::string> effective_token_file =
      token_file ? token_file : provider.token_file(profile_name);
  AUTHKIT_LOG(Debug, "Initializing {} client for profile {}",
              config->client_type(), profile_name);
  return initialize_from_config(*config, effective_token_file,
                                optional<std::string>(profile_name),
                                std::move(context));
}

}  // namespace authkit
