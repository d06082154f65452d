#ifndef AUTHKIT_OIDC_INTROSPECTION_API_CLIENT_H
#define AUTHKIT_OIDC_INTROSPECTION_API_CLIENT_H

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "authkit/auth/api_client.h"
#include "authkit/oidc/client_auth.h"

/**
 * @file introspection_api_client.h
 * @brief Token introspection endpoint (RFC 7662)
 */

namespace authkit {
namespace oidc {

class IntrospectionApiClient : public ApiClient {
 public:
  IntrospectionApiClient(std::shared_ptr<HttpClient> http,
                         const std::string& endpoint_uri,
                         std::shared_ptr<ClientAuthEnricher> client_auth);

  /**
   * @return The introspection response of an active token
   * @throws ValidationError(INACTIVE_TOKEN) unless "active" is true
   */
  nlohmann::json validate_access_token(const std::string& token);
  nlohmann::json validate_id_token(const std::string& token);
  nlohmann::json validate_refresh_token(const std::string& token);

 private:
  nlohmann::json introspect(const std::string& token,
                            const std::string& token_type_hint);

  std::shared_ptr<ClientAuthEnricher> client_auth_;
};

}  // namespace oidc
}  // namespace authkit

#endif  // AUTHKIT_OIDC_INTROSPECTION_API_CLIENT_H
