#include "authkit/oidc/userinfo_api_client.h"

#include "authkit/auth/auth_error.h"

namespace authkit {
namespace oidc {

UserinfoApiClient::UserinfoApiClient(std::shared_ptr<HttpClient> http,
                                     const std::string& endpoint_uri)
    : ApiClient(std::move(http), endpoint_uri) {}

nlohmann::json UserinfoApiClient::userinfo_from_access_token(
    const std::string& access_token) {
  if (access_token.empty()) {
    throw ValidationError(ValidationErrorKind::MALFORMED_ARGUMENT,
                          "No access token provided for userinfo");
  }
  return checked_get_json({{"Authorization", "Bearer " + access_token}});
}

}  // namespace oidc
}  // namespace authkit
