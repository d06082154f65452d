#include "authkit/oidc/introspection_api_client.h"

#include "authkit/auth/auth_error.h"

namespace authkit {
namespace oidc {

IntrospectionApiClient::IntrospectionApiClient(
    std::shared_ptr<HttpClient> http,
    const std::string& endpoint_uri,
    std::shared_ptr<ClientAuthEnricher> client_auth)
    : ApiClient(std::move(http), endpoint_uri),
      client_auth_(std::move(client_auth)) {}

nlohmann::json IntrospectionApiClient::introspect(
    const std::string& token, const std::string& token_type_hint) {
  if (token.empty()) {
    throw ValidationError(ValidationErrorKind::MALFORMED_ARGUMENT,
                          "No token provided for introspection");
  }
  util::FormData fields{{"token", token}, {"token_type_hint", token_type_hint}};
  HttpHeaders headers;
  if (client_auth_) {
    client_auth_->enrich(fields, headers, endpoint_uri_);
  }
  nlohmann::json response = checked_post_form_json(fields, headers);
  auto active = response.find("active");
  if (!response.is_object() || active == response.end() ||
      !active->is_boolean() || !active->get<bool>()) {
    throw ValidationError(ValidationErrorKind::INACTIVE_TOKEN,
                          "Authorization server reports the " +
                              token_type_hint + " as inactive");
  }
  return response;
}

nlohmann::json IntrospectionApiClient::validate_access_token(
    const std::string& token) {
  return introspect(token, "access_token");
}

nlohmann::json IntrospectionApiClient::validate_id_token(
    const std::string& token) {
  return introspect(token, "id_token");
}

nlohmann::json IntrospectionApiClient::validate_refresh_token(
    const std::string& token) {
  return introspect(token, "refresh_token");
}

}  // namespace oidc
}  // namespace authkit
