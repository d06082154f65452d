#ifndef AUTHKIT_OIDC_DISCOVERY_API_CLIENT_H
#define AUTHKIT_OIDC_DISCOVERY_API_CLIENT_H

#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "authkit/auth/api_client.h"
#include "authkit/core/compat.h"

/**
 * @file discovery_api_client.h
 * @brief OpenID Provider metadata (RFC 8414 / OIDC Discovery 1.0)
 */

namespace authkit {
namespace oidc {

class DiscoveryApiClient : public ApiClient {
 public:
  // auth_server is the issuer base URL; the well-known path is appended
  DiscoveryApiClient(std::shared_ptr<HttpClient> http,
                     const std::string& auth_server);

  static std::string discovery_uri(const std::string& auth_server);

  /**
   * @brief Provider metadata, fetched on first use and then cached
   * @throws ProtocolError, TransportError, PayloadError
   */
  const nlohmann::json& discovery();

  // Metadata string member, nullopt when absent
  optional<std::string> metadata_value(const std::string& key);

 private:
  std::mutex mutex_;
  optional<nlohmann::json> cached_;
};

}  // namespace oidc
}  // namespace authkit

#endif  // AUTHKIT_OIDC_DISCOVERY_API_CLIENT_H
