#ifndef AUTHKIT_AUTH_CREDENTIAL_H
#define AUTHKIT_AUTH_CREDENTIAL_H

#include <cstdint>
#include <string>

#include "authkit/auth/file_backed_json.h"

/**
 * @file credential.h
 * @brief Credentials produced by auth clients and consumed by request
 * authenticators
 */

namespace authkit {

// Generic credential document; any JSON object is valid
class Credential : public FileBackedJsonObject {
 public:
  explicit Credential(optional<nlohmann::json> data = nullopt,
                      optional<std::string> file_path = nullopt);
};

/**
 * @brief Token set returned by an OAuth2/OIDC token endpoint
 *
 * access_token is required; refresh_token, id_token, token_type, scope and
 * expires_in are kept as the server sent them.
 */
class OidcCredential : public Credential {
 public:
  explicit OidcCredential(optional<nlohmann::json> data = nullopt,
                          optional<std::string> file_path = nullopt);

  void check_data(const optional<nlohmann::json>& data) const override;

  optional<std::string> access_token() const;
  optional<std::string> refresh_token() const;
  optional<std::string> id_token() const;
  optional<std::string> token_type() const;
  optional<std::string> scope() const;

  // "exp" of the access token, read without signature verification
  optional<int64_t> expiry_time() const;
};

/**
 * @brief An API key presented as "<prefix> <key>"
 */
class StaticApiKeyCredential : public Credential {
 public:
  explicit StaticApiKeyCredential(optional<nlohmann::json> data = nullopt,
                                  optional<std::string> file_path = nullopt);

  // In-memory credential holding the given key
  StaticApiKeyCredential(const std::string& api_key,
                         const std::string& bearer_token_prefix);

  void check_data(const optional<nlohmann::json>& data) const override;

  optional<std::string> api_key() const;
  optional<std::string> bearer_token_prefix() const;
};

// Key issued by the legacy login endpoint, with the JWT it came in
class LegacyApiKeyCredential : public Credential {
 public:
  explicit LegacyApiKeyCredential(optional<nlohmann::json> data = nullopt,
                                  optional<std::string> file_path = nullopt);

  void check_data(const optional<nlohmann::json>& data) const override;

  optional<std::string> api_key() const;
  optional<std::string> legacy_jwt() const;
};

}  // namespace authkit

#endif  // AUTHKIT_AUTH_CREDENTIAL_H
