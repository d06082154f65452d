#ifndef AUTHKIT_AUTH_REQUEST_AUTHENTICATOR_H
#define AUTHKIT_AUTH_REQUEST_AUTHENTICATOR_H

#include <memory>
#include <string>

#include "authkit/auth/credential.h"
#include "authkit/auth/http_client.h"

/**
 * @file request_authenticator.h
 * @brief Stamps outgoing requests with "<header>: <prefix> <token>"
 */

namespace authkit {

/**
 * @brief Per-request auth decorator
 *
 * authenticate() runs pre_request_hook() first, which may reload or renew
 * the token (including network I/O), then writes the auth header. No
 * header is written while the token body is empty.
 *
 * Instances are not thread safe.
 */
class RequestAuthenticator {
 public:
  explicit RequestAuthenticator(std::string token_body = "",
                                std::string token_prefix = "Bearer",
                                std::string auth_header = "Authorization");
  virtual ~RequestAuthenticator() = default;

  virtual void pre_request_hook() = 0;

  void authenticate(HttpRequest& request);

  // "<prefix> <body>", or just the body when there is no prefix
  std::string auth_header_value() const;

  const std::string& token_body() const { return token_body_; }
  const std::string& token_prefix() const { return token_prefix_; }
  const std::string& auth_header() const { return auth_header_; }

 protected:
  std::string token_body_;
  std::string token_prefix_;
  std::string auth_header_;
};

class CredentialRequestAuthenticator : public RequestAuthenticator {
 public:
  explicit CredentialRequestAuthenticator(
      std::shared_ptr<Credential> credential = nullptr,
      std::string token_prefix = "Bearer",
      std::string auth_header = "Authorization");

  /**
   * @brief Swap in a new credential
   *
   * The token body is cleared and derived again on the next request.
   */
  virtual void update_credential(std::shared_ptr<Credential> credential);

  const std::shared_ptr<Credential>& credential() const { return credential_; }

 protected:
  std::shared_ptr<Credential> credential_;
};

// Fixed token, no credential behind it
class SimpleInMemoryRequestAuthenticator : public CredentialRequestAuthenticator {
 public:
  explicit SimpleInMemoryRequestAuthenticator(
      std::string token_body = "",
      std::string token_prefix = "Bearer",
      std::string auth_header = "Authorization");

  void pre_request_hook() override {}

  // Ignored with a warning
  void update_credential(std::shared_ptr<Credential> credential) override;
};

/**
 * @brief For clients that must never make authenticated requests
 *
 * @throws FlowError on every request
 */
class ForbiddenRequestAuthenticator : public CredentialRequestAuthenticator {
 public:
  using CredentialRequestAuthenticator::CredentialRequestAuthenticator;

  void pre_request_hook() override;
};

// Prefix and key come from the credential, reloaded when the file changes
class StaticApiKeyRequestAuthenticator : public CredentialRequestAuthenticator {
 public:
  explicit StaticApiKeyRequestAuthenticator(
      std::shared_ptr<StaticApiKeyCredential> credential);

  void pre_request_hook() override;

  // @throws ConfigError unless credential is a StaticApiKeyCredential
  void update_credential(std::shared_ptr<Credential> credential) override;
};

// "Authorization: api-key <key>"
class LegacyApiKeyRequestAuthenticator : public CredentialRequestAuthenticator {
 public:
  static constexpr const char* kTokenPrefix = "api-key";

  explicit LegacyApiKeyRequestAuthenticator(
      std::shared_ptr<LegacyApiKeyCredential> credential);

  void pre_request_hook() override;

  // @throws ConfigError unless credential is a LegacyApiKeyCredential
  void update_credential(std::shared_ptr<Credential> credential) override;
};

/**
 * @brief Transport decorator that authenticates every request it sends
 */
class AuthenticatingTransport : public HttpTransport {
 public:
  AuthenticatingTransport(std::shared_ptr<HttpTransport> inner,
                          std::shared_ptr<RequestAuthenticator> authenticator);

  HttpResponse send(const HttpRequest& request) override;

 private:
  std::shared_ptr<HttpTransport> inner_;
  std::shared_ptr<RequestAuthenticator> authenticator_;
};

}  // namespace authkit

#endif  // AUTHKIT_AUTH_REQUEST_AUTHENTICATOR_H
