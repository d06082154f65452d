#ifndef AUTHKIT_OIDC_REVOCATION_API_CLIENT_H
#define AUTHKIT_OIDC_REVOCATION_API_CLIENT_H

#include <memory>
#include <string>

#include "authkit/auth/api_client.h"
#include "authkit/oidc/client_auth.h"

/**
 * @file revocation_api_client.h
 * @brief Token revocation endpoint (RFC 7009)
 */

namespace authkit {
namespace oidc {

class RevocationApiClient : public ApiClient {
 public:
  RevocationApiClient(std::shared_ptr<HttpClient> http,
                      const std::string& endpoint_uri,
                      std::shared_ptr<ClientAuthEnricher> client_auth);

  void revoke_access_token(const std::string& token);
  void revoke_refresh_token(const std::string& token);

 private:
  void revoke(const std::string& token, const std::string& token_type_hint);

  std::shared_ptr<ClientAuthEnricher> client_auth_;
};

}  // namespace oidc
}  // namespace authkit

#endif  // AUTHKIT_OIDC_REVOCATION_API_CLIENT_H
