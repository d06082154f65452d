#ifndef AUTHKIT_AUTH_AUTH_CLIENT_H
#define AUTHKIT_AUTH_AUTH_CLIENT_H

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "authkit/auth/auth_client_config.h"
#include "authkit/auth/auth_util.h"
#include "authkit/auth/credential.h"
#include "authkit/auth/http_client.h"
#include "authkit/auth/request_authenticator.h"
#include "authkit/auth/user_interaction.h"

/**
 * @file auth_client.h
 * @brief Client kinds and the capabilities they offer
 *
 * Which operations a client supports depends on its kind: a token
 * validator cannot log in, an API key cannot be refreshed. Callers ask for
 * a capability with as_loginable(), as_refreshable(), ... and get nullptr
 * when the client does not have it.
 */

namespace authkit {

struct LoginOptions {
  bool allow_open_browser = false;
  bool allow_tty_prompt = false;
  // Empty lists fall back to the configured values
  std::vector<std::string> requested_scopes;
  std::vector<std::string> requested_audiences;
  util::FormData extra;
  // Resource owner and legacy logins; prompted for when absent
  optional<std::string> username;
  optional<std::string> password;
  bool display_qr_code = false;
};

class Loginable {
 public:
  virtual ~Loginable() = default;

  /**
   * @brief Obtain a new credential, interactively if the options allow
   * @throws FlowError, ProtocolError, TransportError, ConfigError
   */
  virtual std::shared_ptr<Credential> login(const LoginOptions& options) = 0;
};

class Refreshable {
 public:
  virtual ~Refreshable() = default;

  /**
   * @brief Exchange a refresh token for a new token set
   *
   * Configured default scopes are not applied; an empty scope list keeps
   * whatever the refresh token grants.
   */
  virtual std::shared_ptr<OidcCredential> refresh(
      const std::string& refresh_token,
      const std::vector<std::string>& requested_scopes,
      const util::FormData& extra) = 0;
};

// Device login split in two so applications can present the code their way
class DeviceLoginable {
 public:
  virtual ~DeviceLoginable() = default;

  // Device authorization response, to be shown to the user
  virtual nlohmann::json device_login_initiate(const LoginOptions& options) = 0;

  // Polls until the user approves the request returned by initiate
  virtual std::shared_ptr<Credential> device_login_complete(
      const nlohmann::json& initiated_login) = 0;
};

class TokenValidating {
 public:
  virtual ~TokenValidating() = default;

  // Signature and claims checked against the issuer's published keys
  virtual nlohmann::json validate_access_token_local(
      const std::string& access_token,
      const std::string& required_audience,
      const std::vector<std::string>& scopes_anyof) = 0;

  // Introspection at the authorization server
  virtual nlohmann::json validate_access_token_remote(
      const std::string& access_token) = 0;
};

/**
 * @brief Collaborators shared by the clients an application creates
 *
 * Null members are replaced with defaults: a libcurl HttpClient and a
 * ConsoleUserInteraction.
 */
struct AuthClientContext {
  std::shared_ptr<HttpClient> http;
  std::shared_ptr<UserInteraction> interaction;
};

/**
 * @brief Base of every client kind
 *
 * Clients hand themselves to the request authenticators they create, so
 * they must be owned by a std::shared_ptr; from_config() does that.
 */
class AuthClient : public std::enable_shared_from_this<AuthClient> {
 public:
  explicit AuthClient(AuthClientContext context);
  virtual ~AuthClient() = default;

  AuthClient(const AuthClient&) = delete;
  AuthClient& operator=(const AuthClient&) = delete;

  virtual Loginable* as_loginable() { return nullptr; }
  virtual Refreshable* as_refreshable() { return nullptr; }
  virtual DeviceLoginable* as_device_loginable() { return nullptr; }
  virtual TokenValidating* as_token_validating() { return nullptr; }

  // Credential of the type this client produces, bound to path, not loaded
  virtual std::shared_ptr<Credential> credential_from_file(
      const optional<std::string>& path) = 0;

  /**
   * @brief The authenticator that suits this client kind
   * @param credential A credential of the type credential_from_file()
   *        returns, or nullptr
   * @throws ConfigError for a credential of the wrong type
   */
  virtual std::shared_ptr<CredentialRequestAuthenticator>
  default_request_authenticator(std::shared_ptr<Credential> credential) = 0;

  const std::shared_ptr<HttpClient>& http() const { return context_.http; }
  const std::shared_ptr<UserInteraction>& interaction() const {
    return context_.interaction;
  }

  /**
   * @brief Create the client matching a configuration
   * @throws ConfigError
   */
  static std::shared_ptr<AuthClient> from_config(
      const AuthClientConfig& config,
      AuthClientContext context = AuthClientContext());

 protected:
  AuthClientContext context_;
};

/**
 * @brief Unauthenticated access; requests go out without credentials
 */
class NoneAuthClient : public AuthClient {
 public:
  NoneAuthClient(const NoneClientConfig& config, AuthClientContext context);

  std::shared_ptr<Credential> credential_from_file(
      const optional<std::string>& path) override;
  std::shared_ptr<CredentialRequestAuthenticator> default_request_authenticator(
      std::shared_ptr<Credential> credential) override;
};

}  // namespace authkit

#endif  // AUTHKIT_AUTH_AUTH_CLIENT_H
