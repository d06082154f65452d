#include "authkit/oidc/oidc_request_authenticator.h"

#include "authkit/auth/auth_error.h"
#include "authkit/auth/auth_util.h"
#include "authkit/oidc/jwt.h"

#define AUTHKIT_LOG_COMPONENT "authkit.authenticator.oidc"
#include "authkit/logging/log_macros.h"

namespace authkit {
namespace oidc {

std::shared_ptr<OidcCredential> as_oidc_credential(
    const std::shared_ptr<Credential>& credential) {
  if (!credential) {
    return nullptr;
  }
  auto oidc = std::dynamic_pointer_cast<OidcCredential>(credential);
  if (!oidc) {
    throw ConfigError("OIDC token authenticators require an OidcCredential");
  }
  return oidc;
}

RefreshingOidcTokenRequestAuthenticator::
    RefreshingOidcTokenRequestAuthenticator(
        std::shared_ptr<OidcCredential> credential,
        std::shared_ptr<AuthClient> auth_client)
    : CredentialRequestAuthenticator(std::move(credential)),
      auth_client_(std::move(auth_client)),
      refresh_at_(0) {}

std::shared_ptr<OidcCredential>
RefreshingOidcTokenRequestAuthenticator::oidc_credential() const {
  return std::static_pointer_cast<OidcCredential>(credential_);
}

void RefreshingOidcTokenRequestAuthenticator::update_credential(
    std::shared_ptr<Credential> credential) {
  auto oidc = as_oidc_credential(credential);
  CredentialRequestAuthenticator::update_credential(std::move(oidc));
  refresh_at_ = 0;
}

void RefreshingOidcTokenRequestAuthenticator::load() {
  auto credential = oidc_credential();
  if (!credential) {
    throw FlowError("No credential to authenticate with");
  }
  credential->lazy_reload();

  auto token = credential->access_token();
  if (!token) {
    throw DataIntegrityError("Credential holds no access token",
                             credential->path().value_or(""));
  }
  token_body_ = *token;

  // Our own token: inspected for timing only, never trusted on this basis
  auto claims = TokenInspector::unverified_claims(*token);
  if (!claims) {
    throw DataIntegrityError("Access token is not a JWT, cannot schedule "
                             "its renewal",
                             credential->path().value_or(""));
  }
  refresh_at_ = TokenInspector::refresh_at(*claims);
}

std::shared_ptr<OidcCredential>
RefreshingOidcTokenRequestAuthenticator::renew() {
  Refreshable* refreshable = auth_client_->as_refreshable();
  if (!refreshable) {
    throw FlowError("Auth client cannot refresh tokens");
  }
  auto credential = oidc_credential();
  auto refresh_token = credential ? credential->refresh_token() : nullopt;
  if (!refresh_token || refresh_token->empty()) {
    throw FlowError("No refresh token available");
  }
  return refreshable->refresh(*refresh_token, {}, {});
}

void RefreshingOidcTokenRequestAuthenticator::refresh() {
  if (!auth_client_) {
    return;
  }
  std::shared_ptr<OidcCredential> fresh = renew();
  if (credential_) {
    fresh->set_path(credential_->path());
  }
  fresh->save();
  credential_ = fresh;
  load();
  AUTHKIT_LOG(Info, "Access token renewed, next renewal at {}", refresh_at_);
}

void RefreshingOidcTokenRequestAuthenticator::pre_request_hook() {
  if (util::epoch_seconds() > refresh_at_) {
    try {
      load();
    } catch (const std::exception& e) {
      AUTHKIT_LOG(Warning,
                  "Error loading auth token, continuing with the old one: {}",
                  e.what());
    }
  }
  if (util::epoch_seconds() > refresh_at_) {
    try {
      refresh();
    } catch (const std::exception& e) {
      AUTHKIT_LOG(Warning,
                  "Error refreshing auth token, continuing with the old one: "
                  "{}",
                  e.what());
    }
  }
}

std::shared_ptr<OidcCredential>
RefreshOrReloginOidcTokenRequestAuthenticator::renew() {
  auto credential = oidc_credential();
  auto refresh_token = credential ? credential->refresh_token() : nullopt;
  if (refresh_token && !refresh_token->empty()) {
    return RefreshingOidcTokenRequestAuthenticator::renew();
  }

  Loginable* loginable = auth_client_->as_loginable();
  if (!loginable) {
    throw FlowError("No refresh token available and the auth client cannot "
                    "log in");
  }
  AUTHKIT_LOG(Info, "No refresh token available, logging in again");
  auto fresh = std::dynamic_pointer_cast<OidcCredential>(
      loginable->login(LoginOptions()));
  if (!fresh) {
    throw FlowError("Login did not produce OIDC tokens");
  }
  return fresh;
}

}  // namespace oidc
}  // namespace authkit
