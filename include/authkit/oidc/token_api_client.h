#ifndef AUTHKIT_OIDC_TOKEN_API_CLIENT_H
#define AUTHKIT_OIDC_TOKEN_API_CLIENT_H

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "authkit/auth/api_client.h"
#include "authkit/oidc/client_auth.h"

/**
 * @file token_api_client.h
 * @brief Token endpoint: every grant type this toolkit drives
 */

namespace authkit {
namespace oidc {

constexpr const char kDeviceCodeGrantType[] =
    "urn:ietf:params:oauth:grant-type:device_code";

class TokenApiClient : public ApiClient {
 public:
  using SleepFunction = std::function<void(std::chrono::seconds)>;

  TokenApiClient(std::shared_ptr<HttpClient> http,
                 const std::string& token_uri,
                 std::shared_ptr<ClientAuthEnricher> client_auth);

  // authorization_code grant with the PKCE verifier
  nlohmann::json get_token_from_code(const std::string& redirect_uri,
                                     const std::string& code,
                                     const std::string& code_verifier,
                                     const util::FormData& extra = {});

  // An empty scope list lets the server keep the refresh token's scopes
  nlohmann::json get_token_from_refresh(
      const std::string& refresh_token,
      const std::vector<std::string>& requested_scopes = {},
      const util::FormData& extra = {});

  nlohmann::json get_token_from_client_credentials(
      const std::vector<std::string>& requested_scopes,
      const std::vector<std::string>& requested_audiences,
      const util::FormData& extra = {});

  nlohmann::json get_token_from_password(
      const std::string& username,
      const std::string& password,
      const std::vector<std::string>& requested_scopes,
      const std::vector<std::string>& requested_audiences,
      const util::FormData& extra = {});

  /**
   * @brief Poll for the outcome of a device authorization (RFC 8628 3.4)
   *
   * Sleeps interval before every poll. "authorization_pending" keeps
   * polling and "slow_down" adds 5 seconds to the interval; any other
   * server error is raised as ProtocolError. A non-positive interval is
   * replaced by 5 seconds.
   * @param expires_in Lifetime of the device code; polling stops after it
   * @throws FlowError when the device code expires before approval
   */
  nlohmann::json poll_for_token_from_device_code(
      const std::string& device_code,
      std::chrono::seconds expires_in,
      std::chrono::seconds interval,
      const util::FormData& extra = {});

  void set_sleep_function(SleepFunction sleep) { sleep_ = std::move(sleep); }

  const std::shared_ptr<ClientAuthEnricher>& client_auth() const {
    return client_auth_;
  }

 private:
  nlohmann::json request_token(util::FormData fields);

  std::shared_ptr<ClientAuthEnricher> client_auth_;
  SleepFunction sleep_;
};

// Scopes and audiences go out space separated (RFC 6749 3.3, RFC 8707)
void add_scopes_and_audiences(util::FormData& fields,
                              const std::vector<std::string>& scopes,
                              const std::vector<std::string>& audiences);

// Adds every extra field that is not already set
void merge_extra(util::FormData& fields, const util::FormData& extra);

}  // namespace oidc
}  // namespace authkit

#endif  // AUTHKIT_OIDC_TOKEN_API_CLIENT_H
