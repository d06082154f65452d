#include "authkit/oidc/client_auth.h"

#include <memory>

#include "authkit/auth/auth_error.h"
#include "authkit/oidc/jwt.h"

namespace authkit {
namespace oidc {

void NoClientAuth::enrich(util::FormData& fields,
                          HttpHeaders& /*headers*/,
                          const std::string& /*endpoint*/) {
  fields["client_id"] = client_id_;
}

ClientSecretBasicAuth::ClientSecretBasicAuth(std::string client_id,
                                             std::string client_secret)
    : ClientAuthEnricher(std::move(client_id)),
      client_secret_(std::move(client_secret)) {}

void ClientSecretBasicAuth::enrich(util::FormData& /*fields*/,
                                   HttpHeaders& headers,
                                   const std::string& /*endpoint*/) {
  // RFC 6749 2.3.1: both halves are form-urlencoded before base64
  const std::string credentials =
      util::url_encode(client_id_) + ":" + util::url_encode(client_secret_);
  headers["Authorization"] = "Basic " + util::base64_encode(credentials);
}

ClientSecretPostAuth::ClientSecretPostAuth(std::string client_id,
                                           std::string client_secret)
    : ClientAuthEnricher(std::move(client_id)),
      client_secret_(std::move(client_secret)) {}

void ClientSecretPostAuth::enrich(util::FormData& fields,
                                  HttpHeaders& /*headers*/,
                                  const std::string& /*endpoint*/) {
  fields["client_id"] = client_id_;
  fields["client_secret"] = client_secret_;
}

PrivateKeyJwtAuth::PrivateKeyJwtAuth(
    std::string client_id,
    optional<std::string> private_key_pem,
    optional<std::string> private_key_file,
    optional<std::string> private_key_password)
    : ClientAuthEnricher(std::move(client_id)),
      private_key_pem_(std::move(private_key_pem)),
      private_key_file_(std::move(private_key_file)),
      private_key_password_(std::move(private_key_password)) {
  if (!private_key_pem_ && !private_key_file_) {
    throw ConfigError("A private key or private key file is required",
                      "client_privkey");
  }
}

PrivateKeyJwtAuth::~PrivateKeyJwtAuth() = default;

JwtSigner& PrivateKeyJwtAuth::signer() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!signer_) {
    const std::string password = private_key_password_.value_or("");
    if (private_key_pem_) {
      signer_ = std::make_unique<JwtSigner>(
          JwtSigner::from_pem(*private_key_pem_, password));
    } else {
      signer_ = std::make_unique<JwtSigner>(
          JwtSigner::from_pem_file(*private_key_file_, password));
    }
  }
  return *signer_;
}

std::string PrivateKeyJwtAuth::make_assertion(const std::string& audience) {
  const int64_t now = util::epoch_seconds();
  nlohmann::json claims = {{"iss", client_id_},
                           {"sub", client_id_},
                           {"aud", audience},
                           {"jti", util::random_urlsafe_string(16)},
                           {"iat", now},
                           {"exp", now + kAssertionLifetime}};
  return signer().sign(claims);
}

void PrivateKeyJwtAuth::enrich(util::FormData& fields,
                               HttpHeaders& /*headers*/,
                               const std::string& endpoint) {
  fields["client_id"] = client_id_;
  fields["client_assertion_type"] = kAssertionType;
  fields["client_assertion"] = make_assertion(endpoint);
}

}  // namespace oidc
}  // namespace authkit
