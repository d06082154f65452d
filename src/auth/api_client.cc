#include "authkit/auth/api_client.h"

#include "authkit/auth/auth_error.h"

#define AUTHKIT_LOG_COMPONENT "authkit.http"
#include "authkit/logging/log_macros.h"

namespace authkit {

namespace {

bool is_json_content(const HttpResponse& response) {
  auto content_type = response.header("Content-Type");
  if (!content_type) {
    return false;
  }
  auto parsed = util::parse_content_type(*content_type);
  return parsed.content_type == "application/json" ||
         (parsed.content_type.size() > 5 &&
          parsed.content_type.compare(parsed.content_type.size() - 5, 5,
                                      "+json") == 0);
}

std::string string_field(const nlohmann::json& payload, const char* key) {
  auto it = payload.find(key);
  if (it != payload.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return "";
}

void raise_for_error_payload(const HttpResponse& response) {
  if (!is_json_content(response) || response.body.empty()) {
    return;
  }
  nlohmann::json payload =
      nlohmann::json::parse(response.body, nullptr, false);
  if (!payload.is_object()) {
    return;
  }
  if (payload.contains("error")) {
    const auto& error = payload["error"];
    std::string code = error.is_string() ? error.get<std::string>()
                                         : error.dump();
    AUTHKIT_LOG(Debug, "Server returned error '{}' (HTTP {})", code,
                response.status_code);
    throw ProtocolError(code, string_field(payload, "error_description"),
                        response.status_code);
  }
  if (payload.contains("errorCode")) {
    const auto& error = payload["errorCode"];
    std::string code = error.is_string() ? error.get<std::string>()
                                         : error.dump();
    throw ProtocolError(code, string_field(payload, "errorSummary"),
                        response.status_code);
  }
}

}  // namespace

ApiClient::ApiClient(std::shared_ptr<HttpClient> http, std::string endpoint_uri)
    : http_(std::move(http)), endpoint_uri_(std::move(endpoint_uri)) {}

void ApiClient::check_response(const HttpResponse& response) {
  if (response.status_code < 0) {
    throw TransportError("HTTP request failed: " + response.error);
  }
  raise_for_error_payload(response);
  if (!response.ok()) {
    throw TransportError(
        "HTTP error " + std::to_string(response.status_code), response.status_code);
  }
}

nlohmann::json ApiClient::checked_json(const HttpResponse& response) {
  check_response(response);
  if (response.body.empty()) {
    throw PayloadError("Expected JSON payload, response body is empty",
                       response.status_code);
  }
  if (!is_json_content(response)) {
    throw PayloadError("Expected JSON payload, got content type '" +
                           response.header("Content-Type").value_or("") + "'",
                       response.status_code);
  }
  nlohmann::json payload =
      nlohmann::json::parse(response.body, nullptr, false);
  if (payload.is_discarded()) {
    throw PayloadError("Response body is not valid JSON",
                       response.status_code);
  }
  return payload;
}

nlohmann::json ApiClient::checked_get_json(const HttpHeaders& headers) {
  return checked_json(http_->get(endpoint_uri_, headers));
}

nlohmann::json ApiClient::checked_post_form_json(const util::FormData& fields,
                                                 const HttpHeaders& headers) {
  return checked_json(http_->post_form(endpoint_uri_, fields, headers));
}

void ApiClient::checked_post_form(const util::FormData& fields,
                                  const HttpHeaders& headers) {
  check_response(http_->post_form(endpoint_uri_, fields, headers));
}

nlohmann::json ApiClient::checked_post_json_json(const nlohmann::json& payload,
                                                 const HttpHeaders& headers) {
  return checked_json(http_->post_json(endpoint_uri_, payload, headers));
}

}  // namespace authkit
