#ifndef AUTHKIT_OIDC_OIDC_REQUEST_AUTHENTICATOR_H
#define AUTHKIT_OIDC_OIDC_REQUEST_AUTHENTICATOR_H

#include <cstdint>
#include <memory>

#include "authkit/auth/auth_client.h"
#include "authkit/auth/credential.h"
#include "authkit/auth/request_authenticator.h"

/**
 * @file oidc_request_authenticator.h
 * @brief Bearer token authenticators that renew their token before it runs
 * out
 *
 * Before each request, once the token has passed 3/4 of its lifetime:
 *  1. the credential file is reloaded, since another process sharing it
 *     may already have renewed the token;
 *  2. if the reloaded token is still due, it is renewed online, saved back
 *     to the same file and swapped in.
 * Failures in either step are logged and the request goes out with the
 * token at hand; the API being called decides whether it is still good.
 */

namespace authkit {
namespace oidc {

/**
 * @brief Downcast for the authenticators below
 * @return nullptr for nullptr
 * @throws ConfigError when credential is not an OidcCredential
 */
std::shared_ptr<OidcCredential> as_oidc_credential(
    const std::shared_ptr<Credential>& credential);

/**
 * @brief Renews with the refresh token only
 *
 * Without a refresh token the renewal fails and the old token is kept;
 * this variant never starts a login.
 */
class RefreshingOidcTokenRequestAuthenticator
    : public CredentialRequestAuthenticator {
 public:
  // Without an auth client, tokens are reloaded from disk but not renewed
  explicit RefreshingOidcTokenRequestAuthenticator(
      std::shared_ptr<OidcCredential> credential,
      std::shared_ptr<AuthClient> auth_client = nullptr);

  void pre_request_hook() override;

  // Schedules an immediate reload on the next request
  void update_credential(std::shared_ptr<Credential> credential) override;

  // Epoch seconds after which the token is renewed; 0 means now
  int64_t refresh_at() const { return refresh_at_; }

  std::shared_ptr<OidcCredential> oidc_credential() const;

 protected:
  // Reload from disk if changed, then derive token body and refresh_at
  void load();

  void refresh();

  // New credential from the server
  virtual std::shared_ptr<OidcCredential> renew();

  std::shared_ptr<AuthClient> auth_client_;
  int64_t refresh_at_;
};

/**
 * @brief Renews with the refresh token, or logs in again when there is none
 *
 * Suits flows whose login needs no user, such as client credentials, and
 * interactive flows whose applications accept a login prompt at request
 * time.
 */
class RefreshOrReloginOidcTokenRequestAuthenticator
    : public RefreshingOidcTokenRequestAuthenticator {
 public:
  using RefreshingOidcTokenRequestAuthenticator::
      RefreshingOidcTokenRequestAuthenticator;

 protected:
  std::shared_ptr<OidcCredential> renew() override;
};

}  // namespace oidc
}  // namespace authkit

#endif  // AUTHKIT_OIDC_OIDC_REQUEST_AUTHENTICATOR_H
