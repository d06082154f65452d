#include "authkit/oidc/revocation_api_client.h"

#include "authkit/auth/auth_error.h"

#define AUTHKIT_LOG_COMPONENT "authkit.token"
#include "authkit/logging/log_macros.h"

namespace authkit {
namespace oidc {

RevocationApiClient::RevocationApiClient(
    std::shared_ptr<HttpClient> http,
    const std::string& endpoint_uri,
    std::shared_ptr<ClientAuthEnricher> client_auth)
    : ApiClient(std::move(http), endpoint_uri),
      client_auth_(std::move(client_auth)) {}

void RevocationApiClient::revoke(const std::string& token,
                                 const std::string& token_type_hint) {
  if (token.empty()) {
    throw ValidationError(ValidationErrorKind::MALFORMED_ARGUMENT,
                          "No token provided for revocation");
  }
  util::FormData fields{{"token", token}, {"token_type_hint", token_type_hint}};
  HttpHeaders headers;
  if (client_auth_) {
    client_auth_->enrich(fields, headers, endpoint_uri_);
  }
  // 200 with an empty body is the normal answer
  checked_post_form(fields, headers);
  AUTHKIT_LOG(Info, "Revoked {} at {}", token_type_hint, endpoint_uri_);
}

void RevocationApiClient::revoke_access_token(const std::string& token) {
  revoke(token, "access_token");
}

void RevocationApiClient::revoke_refresh_token(const std::string& token) {
  revoke(token, "refresh_token");
}

}  // namespace oidc
}  // namespace authkit
