#ifndef AUTHKIT_OIDC_MULTI_VALIDATOR_H
#define AUTHKIT_OIDC_MULTI_VALIDATOR_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "authkit/auth/auth_client.h"
#include "authkit/oidc/jwks_client.h"
#include "authkit/oidc/token_validator.h"

/**
 * @file multi_validator.h
 * @brief Resource-server side validation of tokens from several issuers
 */

namespace authkit {
namespace oidc {

class OidcAuthClient;

struct TrustEntry {
  std::string issuer;
  std::string audience;
  std::shared_ptr<JwksClient> jwks_client;
};

/**
 * @brief Validates bearer tokens from a fixed set of trusted issuers
 *
 * The token's unverified "iss" selects the trust entry by exact string
 * match; the token is then validated against that entry's keys and
 * audience. A token from any other issuer fails with UNTRUSTED_ISSUER
 * before any key is fetched.
 *
 * Not thread safe.
 */
class OidcMultiIssuerValidator {
 public:
  /**
   * @throws ConfigError for an empty issuer or audience, a missing JWKS
   *         client, or an issuer listed twice
   */
  explicit OidcMultiIssuerValidator(
      const std::vector<TrustEntry>& trusted,
      bool log_result = true,
      const TokenValidatorConfig& validator_config = TokenValidatorConfig());

  /**
   * @brief Trust the servers named by client validator configurations
   *
   * The issuer is the configured "issuer", else auth_server. Each config
   * needs exactly one audience. Keys are located through the configured
   * jwks_endpoint or discovery, on first use.
   * @throws ConfigError
   */
  static OidcMultiIssuerValidator from_configs(
      const std::vector<ClientValidatorConfig>& configs,
      AuthClientContext context = AuthClientContext(),
      bool log_result = true);

  /**
   * @brief Validate an access token and return its claims
   * @param scopes_anyof When non-empty, the token must hold at least one
   * @throws ValidationError
   */
  nlohmann::json validate_access_token(
      const std::string& token,
      const std::vector<std::string>& scopes_anyof = {});

  std::vector<std::string> trusted_issuers() const;

 private:
  struct Entry {
    std::string audience;
    std::shared_ptr<JwksClient> jwks_client;
    // Source of jwks_client when built from a configuration
    std::shared_ptr<OidcAuthClient> auth_client;
    std::unique_ptr<TokenValidator> validator;
  };

  OidcMultiIssuerValidator(bool log_result,
                           const TokenValidatorConfig& validator_config);

  void add_entry(const std::string& issuer, Entry entry);
  TokenValidator& validator_for(Entry& entry);

  std::map<std::string, Entry> entries_;
  bool log_result_;
  TokenValidatorConfig validator_config_;
};

}  // namespace oidc
}  // namespace authkit

#endif  // AUTHKIT_OIDC_MULTI_VALIDATOR_H
