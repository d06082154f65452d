#include "authkit/auth/credential.h"

#include "authkit/oidc/jwt.h"

namespace authkit {

namespace {

bool has_string(const nlohmann::json& data, const char* key) {
  auto it = data.find(key);
  return it != data.end() && it->is_string();
}

}  // namespace

Credential::Credential(optional<nlohmann::json> data,
                       optional<std::string> file_path)
    : FileBackedJsonObject(std::move(file_path)) {
  if (data) {
    set_data(data);
  }
}

OidcCredential::OidcCredential(optional<nlohmann::json> data,
                               optional<std::string> file_path)
    : Credential(nullopt, std::move(file_path)) {
  if (data) {
    set_data(data);
  }
}

void OidcCredential::check_data(const optional<nlohmann::json>& data) const {
  Credential::check_data(data);
  if (!has_string(*data, "access_token") ||
      data->at("access_token").get<std::string>().empty()) {
    raise_invalid("'access_token' not found in OIDC credential");
  }
}

optional<std::string> OidcCredential::access_token() const {
  return string_member("access_token");
}

optional<std::string> OidcCredential::refresh_token() const {
  return string_member("refresh_token");
}

optional<std::string> OidcCredential::id_token() const {
  return string_member("id_token");
}

optional<std::string> OidcCredential::token_type() const {
  return string_member("token_type");
}

optional<std::string> OidcCredential::scope() const {
  return string_member("scope");
}

optional<int64_t> OidcCredential::expiry_time() const {
  auto token = access_token();
  if (!token) {
    return nullopt;
  }
  auto claims = oidc::TokenInspector::unverified_claims(*token);
  if (!claims) {
    return nullopt;
  }
  return oidc::numeric_claim(*claims, "exp");
}

StaticApiKeyCredential::StaticApiKeyCredential(optional<nlohmann::json> data,
                                               optional<std::string> file_path)
    : Credential(nullopt, std::move(file_path)) {
  if (data) {
    set_data(data);
  }
}

StaticApiKeyCredential::StaticApiKeyCredential(
    const std::string& api_key, const std::string& bearer_token_prefix)
    : Credential(nullopt, nullopt) {
  set_data(nlohmann::json{{"api_key", api_key},
                          {"bearer_token_prefix", bearer_token_prefix}});
}

void StaticApiKeyCredential::check_data(
    const optional<nlohmann::json>& data) const {
  Credential::check_data(data);
  if (!has_string(*data, "api_key")) {
    raise_invalid("'api_key' not found in API key credential");
  }
  if (!has_string(*data, "bearer_token_prefix")) {
    raise_invalid("'bearer_token_prefix' not found in API key credential");
  }
}

optional<std::string> StaticApiKeyCredential::api_key() const {
  return string_member("api_key");
}

optional<std::string> StaticApiKeyCredential::bearer_token_prefix() const {
  return string_member("bearer_token_prefix");
}

LegacyApiKeyCredential::LegacyApiKeyCredential(optional<nlohmann::json> data,
                                               optional<std::string> file_path)
    : Credential(nullopt, std::move(file_path)) {
  if (data) {
    set_data(data);
  }
}

void LegacyApiKeyCredential::check_data(
    const optional<nlohmann::json>& data) const {
  Credential::check_data(data);
  if (!has_string(*data, "api_key") ||
      data->at("api_key").get<std::string>().empty()) {
    raise_invalid("'api_key' not found in legacy credential");
  }
}

optional<std::string> LegacyApiKeyCredential::api_key() const {
  return string_member("api_key");
}

optional<std::string> LegacyApiKeyCredential::legacy_jwt() const {
  return string_member("token");
}

}  // namespace authkit
