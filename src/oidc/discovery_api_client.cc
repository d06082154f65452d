#include "authkit/oidc/discovery_api_client.h"

#include "authkit/auth/auth_error.h"

#define AUTHKIT_LOG_COMPONENT "authkit.discovery"
#include "authkit/logging/log_macros.h"

namespace authkit {
namespace oidc {

DiscoveryApiClient::DiscoveryApiClient(std::shared_ptr<HttpClient> http,
                                       const std::string& auth_server)
    : ApiClient(std::move(http), discovery_uri(auth_server)) {}

std::string DiscoveryApiClient::discovery_uri(const std::string& auth_server) {
  std::string base = auth_server;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/.well-known/openid-configuration";
}

const nlohmann::json& DiscoveryApiClient::discovery() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!cached_) {
    AUTHKIT_LOG(Debug, "Fetching provider metadata from {}", endpoint_uri_);
    nlohmann::json metadata = checked_get_json();
    if (!metadata.is_object()) {
      throw PayloadError("Discovery document is not a JSON object");
    }
    cached_ = std::move(metadata);
  }
  return *cached_;
}

optional<std::string> DiscoveryApiClient::metadata_value(
    const std::string& key) {
  const nlohmann::json& metadata = discovery();
  auto it = metadata.find(key);
  if (it == metadata.end() || !it->is_string() ||
      it->get<std::string>().empty()) {
    return nullopt;
  }
  return it->get<std::string>();
}

}  // namespace oidc
}  // namespace authkit
