#ifndef AUTHKIT_OIDC_CLIENT_AUTH_H
#define AUTHKIT_OIDC_CLIENT_AUTH_H

#include <memory>
#include <mutex>
#include <string>

#include "authkit/auth/auth_util.h"
#include "authkit/auth/http_client.h"
#include "authkit/core/compat.h"

/**
 * @file client_auth.h
 * @brief Client authentication for token, introspection and revocation calls
 *
 * How a client proves its identity depends on how it is registered with
 * the authorization server; see RFC 6749 section 2.3 and RFC 7523.
 */

namespace authkit {
namespace oidc {

class JwtSigner;

/**
 * @brief Adds client authentication to an outgoing form request
 */
class ClientAuthEnricher {
 public:
  explicit ClientAuthEnricher(std::string client_id)
      : client_id_(std::move(client_id)) {}
  virtual ~ClientAuthEnricher() = default;

  /**
   * @param fields Form body, modified in place
   * @param headers Request headers, modified in place
   * @param endpoint URI the request goes to (audience of JWT assertions)
   */
  virtual void enrich(util::FormData& fields,
                      HttpHeaders& headers,
                      const std::string& endpoint) = 0;

  const std::string& client_id() const { return client_id_; }

 protected:
  std::string client_id_;
};

// Public clients only identify themselves
class NoClientAuth : public ClientAuthEnricher {
 public:
  using ClientAuthEnricher::ClientAuthEnricher;

  void enrich(util::FormData& fields,
              HttpHeaders& headers,
              const std::string& endpoint) override;
};

// client_secret_basic
class ClientSecretBasicAuth : public ClientAuthEnricher {
 public:
  ClientSecretBasicAuth(std::string client_id, std::string client_secret);

  void enrich(util::FormData& fields,
              HttpHeaders& headers,
              const std::string& endpoint) override;

 private:
  std::string client_secret_;
};

// client_secret_post
class ClientSecretPostAuth : public ClientAuthEnricher {
 public:
  ClientSecretPostAuth(std::string client_id, std::string client_secret);

  void enrich(util::FormData& fields,
              HttpHeaders& headers,
              const std::string& endpoint) override;

 private:
  std::string client_secret_;
};

/**
 * @brief private_key_jwt: a short lived assertion signed with the client's
 * private key
 *
 * The key is read on first use from the PEM literal if one is given,
 * otherwise from the PEM file.
 */
class PrivateKeyJwtAuth : public ClientAuthEnricher {
 public:
  static constexpr const char* kAssertionType =
      "urn:ietf:params:oauth:client-assertion-type:jwt-bearer";
  static constexpr int64_t kAssertionLifetime = 300;

  PrivateKeyJwtAuth(std::string client_id,
                    optional<std::string> private_key_pem,
                    optional<std::string> private_key_file,
                    optional<std::string> private_key_password);
  ~PrivateKeyJwtAuth() override;

  void enrich(util::FormData& fields,
              HttpHeaders& headers,
              const std::string& endpoint) override;

  // Signed assertion for the given audience
  std::string make_assertion(const std::string& audience);

 private:
  JwtSigner& signer();

  optional<std::string> private_key_pem_;
  optional<std::string> private_key_file_;
  optional<std::string> private_key_password_;
  std::mutex mutex_;
  std::unique_ptr<JwtSigner> signer_;
};

}  // namespace oidc
}  // namespace authkit

#endif  // AUTHKIT_OIDC_CLIENT_AUTH_H
