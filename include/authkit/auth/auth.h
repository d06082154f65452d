#ifndef AUTHKIT_AUTH_AUTH_H
#define AUTHKIT_AUTH_AUTH_H

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "authkit/auth/auth_client.h"
#include "authkit/auth/auth_client_config.h"
#include "authkit/auth/credential.h"
#include "authkit/auth/request_authenticator.h"

/**
 * @file auth.h
 * @brief Top-level object pairing an auth client with its authenticator
 *
 * Typical use:
 *
 *   authkit::Auth auth = authkit::Auth::initialize_from_config_file(
 *       "/etc/myapp/auth.json", std::string("/var/lib/myapp/token.json"));
 *   authkit::LoginOptions options;
 *   options.allow_open_browser = true;
 *   auth.login(options);
 *
 *   authkit::AuthenticatingTransport transport(
 *       std::make_shared<authkit::CurlHttpTransport>(),
 *       auth.request_authenticator());
 */

namespace authkit {

/**
 * @brief Source of named client configurations
 *
 * Profile directories, built-in profiles and environment lookups live in
 * the application; it hands an implementation of this interface to
 * Auth::initialize_from_profile().
 */
class ConfigProvider {
 public:
  virtual ~ConfigProvider() = default;

  // nullopt for an unknown profile
  virtual optional<AuthClientConfig> client_config(
      const std::string& profile_name) = 0;

  // Where the profile keeps its tokens; nullopt keeps them in memory
  virtual optional<std::string> token_file(const std::string& profile_name) = 0;
};

class Auth {
 public:
  Auth(std::shared_ptr<AuthClient> auth_client,
       std::shared_ptr<CredentialRequestAuthenticator> request_authenticator,
       optional<std::string> token_file_path = nullopt,
       optional<std::string> profile_name = nullopt);

  const std::shared_ptr<AuthClient>& auth_client() const {
    return auth_client_;
  }
  const std::shared_ptr<CredentialRequestAuthenticator>&
  request_authenticator() const {
    return request_authenticator_;
  }
  const optional<std::string>& token_file_path() const {
    return token_file_path_;
  }
  const optional<std::string>& profile_name() const { return profile_name_; }

  /**
   * @brief Log in, save the credential to the token file and start using it
   * @throws FlowError when the client kind cannot log in
   */
  std::shared_ptr<Credential> login(const LoginOptions& options = LoginOptions());

  // @throws FlowError when the client kind has no device login
  nlohmann::json device_login_initiate(
      const LoginOptions& options = LoginOptions());

  // Same bookkeeping as login()
  std::shared_ptr<Credential> device_login_complete(
      const nlohmann::json& initiated_login);

  /**
   * @brief Pair a client with its default authenticator
   *
   * The authenticator reads its credential from token_file when it is set;
   * without it credentials only live in memory.
   */
  static Auth initialize_from_client(
      std::shared_ptr<AuthClient> auth_client,
      const optional<std::string>& token_file = nullopt,
      const optional<std::string>& profile_name = nullopt);

  static Auth initialize_from_config(
      const AuthClientConfig& config,
      const optional<std::string>& token_file = nullopt,
      const optional<std::string>& profile_name = nullopt,
      AuthClientContext context = AuthClientContext());

  static Auth initialize_from_config_json(
      const nlohmann::json& config,
      const optional<std::string>& token_file = nullopt,
      const optional<std::string>& profile_name = nullopt,
      AuthClientContext context = AuthClientContext());

  static Auth initialize_from_config_file(
      const std::string& config_file,
      const optional<std::string>& token_file = nullopt,
      const optional<std::string>& profile_name = nullopt,
      AuthClientContext context = AuthClientContext());

  /**
   * @brief Look a profile up through the application's provider
   * @param token_file Overrides the provider's token file when set
   * @throws ConfigError for an unknown profile
   */
  static Auth initialize_from_profile(
      ConfigProvider& provider,
      const std::string& profile_name,
      const optional<std::string>& token_file = nullopt,
      AuthClientContext context = AuthClientContext());

 private:
  std::shared_ptr<Credential> adopt(std::shared_ptr<Credential> credential);

  std::shared_ptr<AuthClient> auth_client_;
  std::shared_ptr<CredentialRequestAuthenticator> request_authenticator_;
  optional<std::string> token_file_path_;
  optional<std::string> profile_name_;
};

}  // namespace authkit

#endif  // AUTHKIT_AUTH_AUTH_H
