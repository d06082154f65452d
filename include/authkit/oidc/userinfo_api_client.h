#ifndef AUTHKIT_OIDC_USERINFO_API_CLIENT_H
#define AUTHKIT_OIDC_USERINFO_API_CLIENT_H

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "authkit/auth/api_client.h"

/**
 * @file userinfo_api_client.h
 * @brief OIDC UserInfo endpoint
 */

namespace authkit {
namespace oidc {

class UserinfoApiClient : public ApiClient {
 public:
  UserinfoApiClient(std::shared_ptr<HttpClient> http,
                    const std::string& endpoint_uri);

  nlohmann::json userinfo_from_access_token(const std::string& access_token);
};

}  // namespace oidc
}  // namespace authkit

#endif  // AUTHKIT_OIDC_USERINFO_API_CLIENT_H
