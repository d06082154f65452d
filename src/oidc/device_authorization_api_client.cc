#include "authkit/oidc/device_authorization_api_client.h"

#include "authkit/auth/auth_error.h"
#include "authkit/oidc/token_api_client.h"

#define AUTHKIT_LOG_COMPONENT "authkit.flow.device"
#include "authkit/logging/log_macros.h"

namespace authkit {
namespace oidc {

DeviceAuthorizationApiClient::DeviceAuthorizationApiClient(
    std::shared_ptr<HttpClient> http,
    const std::string& endpoint_uri,
    std::shared_ptr<ClientAuthEnricher> client_auth)
    : ApiClient(std::move(http), endpoint_uri),
      client_auth_(std::move(client_auth)) {}

nlohmann::json DeviceAuthorizationApiClient::request_device_code(
    const std::vector<std::string>& requested_scopes,
    const std::vector<std::string>& requested_audiences,
    const util::FormData& extra) {
  util::FormData fields;
  HttpHeaders headers;
  add_scopes_and_audiences(fields, requested_scopes, requested_audiences);
  merge_extra(fields, extra);
  if (client_auth_) {
    client_auth_->enrich(fields, headers, endpoint_uri_);
  }

  nlohmann::json response = checked_post_form_json(fields, headers);
  if (!response.is_object()) {
    throw PayloadError("Device authorization response is not an object");
  }
  for (const char* required : {"device_code", "user_code", "verification_uri"}) {
    auto it = response.find(required);
    if (it == response.end() || !it->is_string()) {
      throw PayloadError(std::string("Device authorization response has no ") +
                         required);
    }
  }
  // RFC 8628 defaults; a non-positive value would turn polling into a busy loop
  auto positive = [&response](const char* key) {
    auto it = response.find(key);
    return it != response.end() && it->is_number() && it->get<double>() > 0;
  };
  if (!positive("interval")) {
    response["interval"] = kDefaultInterval;
  }
  if (!positive("expires_in")) {
    response["expires_in"] = kDefaultExpiresIn;
  }
  AUTHKIT_LOG(Debug, "Device code issued, polling every {}s for {}s",
              response["interval"].get<int>(),
              response["expires_in"].get<int>());
  return response;
}

}  // namespace oidc
}  // namespace authkit
