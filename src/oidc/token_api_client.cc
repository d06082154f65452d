#include "authkit/oidc/token_api_client.h"

#include <thread>

#include "authkit/auth/auth_error.h"

#define AUTHKIT_LOG_COMPONENT "authkit.token"
#include "authkit/logging/log_macros.h"

namespace authkit {
namespace oidc {

namespace {

constexpr std::chrono::seconds kSlowDownIncrement(5);
constexpr std::chrono::seconds kDefaultPollInterval(5);

void check_token_response(const nlohmann::json& response) {
  if (!response.is_object()) {
    throw PayloadError("Token response is not a JSON object");
  }
  auto it = response.find("access_token");
  if (it == response.end() || !it->is_string() ||
      it->get<std::string>().empty()) {
    throw PayloadError("Token response carries no access_token");
  }
}

}  // namespace

void add_scopes_and_audiences(util::FormData& fields,
                              const std::vector<std::string>& scopes,
                              const std::vector<std::string>& audiences) {
  if (!scopes.empty()) {
    fields["scope"] = util::join(scopes, " ");
  }
  if (!audiences.empty()) {
    fields["audience"] = util::join(audiences, " ");
  }
}

void merge_extra(util::FormData& fields, const util::FormData& extra) {
  for (const auto& entry : extra) {
    fields.insert(entry);
  }
}

TokenApiClient::TokenApiClient(std::shared_ptr<HttpClient> http,
                               const std::string& token_uri,
                               std::shared_ptr<ClientAuthEnricher> client_auth)
    : ApiClient(std::move(http), token_uri),
      client_auth_(std::move(client_auth)),
      sleep_([](std::chrono::seconds duration) {
        std::this_thread::sleep_for(duration);
      }) {
  if (!client_auth_) {
    throw ConfigError("Token client requires a client authentication method");
  }
}

nlohmann::json TokenApiClient::request_token(util::FormData fields) {
  HttpHeaders headers;
  client_auth_->enrich(fields, headers, endpoint_uri_);
  auto grant = fields["grant_type"];
  AUTHKIT_LOG(Debug, "Requesting {} token from {}", grant, endpoint_uri_);
  nlohmann::json response = checked_post_form_json(fields, headers);
  check_token_response(response);
  return response;
}

nlohmann::json TokenApiClient::get_token_from_code(
    const std::string& redirect_uri,
    const std::string& code,
    const std::string& code_verifier,
    const util::FormData& extra) {
  util::FormData fields{{"grant_type", "authorization_code"},
                        {"code", code},
                        {"redirect_uri", redirect_uri},
                        {"code_verifier", code_verifier}};
  merge_extra(fields, extra);
  return request_token(std::move(fields));
}

nlohmann::json TokenApiClient::get_token_from_refresh(
    const std::string& refresh_token,
    const std::vector<std::string>& requested_scopes,
    const util::FormData& extra) {
  util::FormData fields{{"grant_type", "refresh_token"},
                        {"refresh_token", refresh_token}};
  add_scopes_and_audiences(fields, requested_scopes, {});
  merge_extra(fields, extra);
  return request_token(std::move(fields));
}

nlohmann::json TokenApiClient::get_token_from_client_credentials(
    const std::vector<std::string>& requested_scopes,
    const std::vector<std::string>& requested_audiences,
    const util::FormData& extra) {
  util::FormData fields{{"grant_type", "client_credentials"}};
  add_scopes_and_audiences(fields, requested_scopes, requested_audiences);
  merge_extra(fields, extra);
  return request_token(std::move(fields));
}

nlohmann::json TokenApiClient::get_token_from_password(
    const std::string& username,
    const std::string& password,
    const std::vector<std::string>& requested_scopes,
    const std::vector<std::string>& requested_audiences,
    const util::FormData& extra) {
  util::FormData fields{{"grant_type", "password"},
                        {"username", username},
                        {"password", password}};
  add_scopes_and_audiences(fields, requested_scopes, requested_audiences);
  merge_extra(fields, extra);
  return request_token(std::move(fields));
}

nlohmann::json TokenApiClient::poll_for_token_from_device_code(
    const std::string& device_code,
    std::chrono::seconds expires_in,
    std::chrono::seconds interval,
    const util::FormData& extra) {
  util::FormData fields{{"grant_type", kDeviceCodeGrantType},
                        {"device_code", device_code}};
  merge_extra(fields, extra);

  if (interval <= std::chrono::seconds(0)) {
    AUTHKIT_LOG(Warning, "Ignoring device poll interval of {}s, using {}s",
                interval.count(), kDefaultPollInterval.count());
    interval = kDefaultPollInterval;
  }

  std::chrono::seconds waited(0);
  int polls = 0;
  while (waited + interval <= expires_in) {
    sleep_(interval);
    waited += interval;
    ++polls;
    try {
      return request_token(fields);
    } catch (const ProtocolError& e) {
      if (e.error_code() == "authorization_pending") {
        AUTHKIT_LOG(Debug, "Device authorization pending after {} polls",
                    polls);
        continue;
      }
      if (e.error_code() == "slow_down") {
        interval += kSlowDownIncrement;
        AUTHKIT_LOG(Info, "Server asked to slow down, polling every {}s",
                    interval.count());
        continue;
      }
      throw;
    }
  }
  throw FlowError("Device code expired after " +
                  std::to_string(waited.count()) +
                  " seconds without user approval");
}

}  // namespace oidc
}  // namespace authkit
