#ifndef AUTHKIT_OIDC_OIDC_FLOWS_H
#define AUTHKIT_OIDC_OIDC_FLOWS_H

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "authkit/oidc/oidc_auth_client.h"

/**
 * @file oidc_flows.h
 * @brief One client per OAuth2 grant, plus the validate-only client
 */

namespace authkit {
namespace oidc {

/**
 * @brief Authorization code grant with PKCE
 *
 * With allow_open_browser the authorization URL is opened and the redirect
 * caught on a loopback listener at local_redirect_uri (or redirect_uri).
 * Otherwise, with allow_tty_prompt, the URL is printed and the user pastes
 * back where the browser landed. A nonce in the returned ID token that does
 * not match the request ends the flow.
 */
class AuthCodeAuthClient : public OidcLoginClient {
 public:
  AuthCodeAuthClient(const AuthCodeClientConfig& config,
                     AuthClientContext context);

  const AuthCodeClientConfig& config() const { return config_; }

 protected:
  std::shared_ptr<OidcCredential> oidc_flow_login(
      const LoginOptions& options) override;

 private:
  std::string acknowledgement_html() const;

  AuthCodeClientConfig config_;
};

/**
 * @brief Device authorization grant (RFC 8628)
 *
 * login() runs both halves; applications that present the code themselves
 * call device_login_initiate() and device_login_complete().
 */
class DeviceCodeAuthClient : public OidcLoginClient, public DeviceLoginable {
 public:
  DeviceCodeAuthClient(const DeviceCodeClientConfig& config,
                       AuthClientContext context);

  DeviceLoginable* as_device_loginable() override { return this; }

  nlohmann::json device_login_initiate(const LoginOptions& options) override;
  std::shared_ptr<Credential> device_login_complete(
      const nlohmann::json& initiated_login) override;

 protected:
  std::shared_ptr<OidcCredential> oidc_flow_login(
      const LoginOptions& options) override;
};

// No user involved; login can be repeated whenever the token runs out
class ClientCredentialsAuthClient : public OidcLoginClient {
 public:
  ClientCredentialsAuthClient(const ClientCredentialsClientConfig& config,
                              AuthClientContext context);

 protected:
  std::shared_ptr<OidcCredential> oidc_flow_login(
      const LoginOptions& options) override;
};

/**
 * @brief Resource owner password grant
 *
 * Only for servers that offer nothing better. Username and password come
 * from the login options or are prompted for.
 */
class ResourceOwnerAuthClient : public OidcLoginClient {
 public:
  ResourceOwnerAuthClient(const ResourceOwnerClientConfig& config,
                          AuthClientContext context);

  // Refresh only: a password login is never started at request time
  std::shared_ptr<CredentialRequestAuthenticator> default_request_authenticator(
      std::shared_ptr<Credential> credential) override;

 protected:
  std::shared_ptr<OidcCredential> oidc_flow_login(
      const LoginOptions& options) override;
};

// Token validation for resource servers; never obtains tokens
class OidcClientValidatorAuthClient : public OidcAuthClient {
 public:
  OidcClientValidatorAuthClient(const ClientValidatorConfig& config,
                                AuthClientContext context);

  std::shared_ptr<CredentialRequestAuthenticator> default_request_authenticator(
      std::shared_ptr<Credential> credential) override;
};

}  // namespace oidc
}  // namespace authkit

#endif  // AUTHKIT_OIDC_OIDC_FLOWS_H
