#ifndef AUTHKIT_OIDC_DEVICE_AUTHORIZATION_API_CLIENT_H
#define AUTHKIT_OIDC_DEVICE_AUTHORIZATION_API_CLIENT_H

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "authkit/auth/api_client.h"
#include "authkit/oidc/client_auth.h"

/**
 * @file device_authorization_api_client.h
 * @brief Device authorization endpoint (RFC 8628 section 3.1)
 */

namespace authkit {
namespace oidc {

class DeviceAuthorizationApiClient : public ApiClient {
 public:
  static constexpr int kDefaultInterval = 5;
  static constexpr int kDefaultExpiresIn = 600;

  DeviceAuthorizationApiClient(std::shared_ptr<HttpClient> http,
                               const std::string& endpoint_uri,
                               std::shared_ptr<ClientAuthEnricher> client_auth);

  /**
   * @brief Ask for a device code / user code pair
   *
   * The returned object always carries "interval" and "expires_in", the
   * RFC defaults filled in when the server omits them.
   * @throws PayloadError when device_code, user_code or verification_uri
   *         is missing
   */
  nlohmann::json request_device_code(
      const std::vector<std::string>& requested_scopes,
      const std::vector<std::string>& requested_audiences,
      const util::FormData& extra = {});

 private:
  std::shared_ptr<ClientAuthEnricher> client_auth_;
};

}  // namespace oidc
}  // namespace authkit

#endif  // AUTHKIT_OIDC_DEVICE_AUTHORIZATION_API_CLIENT_H
