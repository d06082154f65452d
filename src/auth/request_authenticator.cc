#include "authkit/auth/request_authenticator.h"

#include "authkit/auth/auth_error.h"

#define AUTHKIT_LOG_COMPONENT "authkit.authenticator"
#include "authkit/logging/log_macros.h"

namespace authkit {

RequestAuthenticator::RequestAuthenticator(std::string token_body,
                                           std::string token_prefix,
                                           std::string auth_header)
    : token_body_(std::move(token_body)),
      token_prefix_(std::move(token_prefix)),
      auth_header_(std::move(auth_header)) {}

std::string RequestAuthenticator::auth_header_value() const {
  if (token_prefix_.empty()) {
    return token_body_;
  }
  return token_prefix_ + " " + token_body_;
}

void RequestAuthenticator::authenticate(HttpRequest& request) {
  pre_request_hook();
  if (!token_body_.empty()) {
    request.headers[auth_header_] = auth_header_value();
  }
  if (!request.has_header(kAppHeaderName)) {
    request.headers[kAppHeaderName] = kAppHeaderValue;
  }
}

CredentialRequestAuthenticator::CredentialRequestAuthenticator(
    std::shared_ptr<Credential> credential,
    std::string token_prefix,
    std::string auth_header)
    : RequestAuthenticator("", std::move(token_prefix), std::move(auth_header)),
      credential_(std::move(credential)) {}

void CredentialRequestAuthenticator::update_credential(
    std::shared_ptr<Credential> credential) {
  credential_ = std::move(credential);
  token_body_.clear();
}

SimpleInMemoryRequestAuthenticator::SimpleInMemoryRequestAuthenticator(
    std::string token_body, std::string token_prefix, std::string auth_header)
    : CredentialRequestAuthenticator(nullptr, std::move(token_prefix),
                                     std::move(auth_header)) {
  token_body_ = std::move(token_body);
}

void SimpleInMemoryRequestAuthenticator::update_credential(
    std::shared_ptr<Credential> /*credential*/) {
  AUTHKIT_LOG(Warning,
              "SimpleInMemoryRequestAuthenticator ignores update_credential()");
}

void ForbiddenRequestAuthenticator::pre_request_hook() {
  throw FlowError(
      "Authenticated requests are not permitted with this client "
      "configuration");
}

StaticApiKeyRequestAuthenticator::StaticApiKeyRequestAuthenticator(
    std::shared_ptr<StaticApiKeyCredential> credential)
    : CredentialRequestAuthenticator(std::move(credential)) {}

void StaticApiKeyRequestAuthenticator::pre_request_hook() {
  if (!credential_) {
    throw FlowError("No API key credential is set");
  }
  credential_->lazy_reload();
  auto* key = static_cast<StaticApiKeyCredential*>(credential_.get());
  token_body_ = key->api_key().value_or("");
  token_prefix_ = key->bearer_token_prefix().value_or("");
}

void StaticApiKeyRequestAuthenticator::update_credential(
    std::shared_ptr<Credential> credential) {
  if (credential &&
      !std::dynamic_pointer_cast<StaticApiKeyCredential>(credential)) {
    throw ConfigError(
        "StaticApiKeyRequestAuthenticator requires a StaticApiKeyCredential");
  }
  CredentialRequestAuthenticator::update_credential(std::move(credential));
}

LegacyApiKeyRequestAuthenticator::LegacyApiKeyRequestAuthenticator(
    std::shared_ptr<LegacyApiKeyCredential> credential)
    : CredentialRequestAuthenticator(std::move(credential), kTokenPrefix) {}

void LegacyApiKeyRequestAuthenticator::pre_request_hook() {
  if (!credential_) {
    throw FlowError("No API key credential is set");
  }
  credential_->lazy_load();
  auto* key = static_cast<LegacyApiKeyCredential*>(credential_.get());
  token_body_ = key->api_key().value_or("");
}

void LegacyApiKeyRequestAuthenticator::update_credential(
    std::shared_ptr<Credential> credential) {
  if (credential &&
      !std::dynamic_pointer_cast<LegacyApiKeyCredential>(credential)) {
    throw ConfigError(
        "LegacyApiKeyRequestAuthenticator requires a LegacyApiKeyCredential");
  }
  CredentialRequestAuthenticator::update_credential(std::move(credential));
}

AuthenticatingTransport::AuthenticatingTransport(
    std::shared_ptr<HttpTransport> inner,
    std::shared_ptr<RequestAuthenticator> authenticator)
    : inner_(std::move(inner)), authenticator_(std::move(authenticator)) {}

HttpResponse AuthenticatingTransport::send(const HttpRequest& request) {
  HttpRequest authenticated = request;
  authenticator_->authenticate(authenticated);
  return inner_->send(authenticated);
}

}  // namespace authkit
