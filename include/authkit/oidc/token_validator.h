#ifndef AUTHKIT_OIDC_TOKEN_VALIDATOR_H
#define AUTHKIT_OIDC_TOKEN_VALIDATOR_H

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "authkit/oidc/jwks_client.h"

/**
 * @file token_validator.h
 * @brief Signature and claim validation of JWTs against an issuer's JWKS
 */

namespace authkit {
namespace oidc {

/**
 * @brief Token validation configuration
 */
struct TokenValidatorConfig {
  std::chrono::seconds clock_skew;  // Allowed skew for exp and nbf
  std::vector<std::string> allowed_algorithms;

  TokenValidatorConfig();
};

/**
 * @brief Validates tokens issued by one authorization server
 *
 * Stateless apart from the JWKS client's key cache. Every failure is a
 * ValidationError whose kind() names the first check that failed; checks
 * run in this order: arguments, header algorithm, signing key, signature,
 * issuer, audience, expiry, not-before, scope.
 */
class TokenValidator {
 public:
  explicit TokenValidator(std::shared_ptr<JwksClient> jwks_client,
                          const TokenValidatorConfig& config =
                              TokenValidatorConfig());

  /**
   * @brief Validate a token and return its claims
   * @param token Compact JWS
   * @param issuer Exact expected "iss"
   * @param audience Audience that must appear in "aud"
   * @param required_scopes When non-empty, the token must hold at least one
   * @param nonce When non-empty, must equal the "nonce" claim (ID tokens)
   * @throws ValidationError
   */
  nlohmann::json validate_token(const std::string& token,
                                const std::string& issuer,
                                const std::string& audience,
                                const std::vector<std::string>& required_scopes =
                                    {},
                                const std::string& nonce = "") const;

  const std::shared_ptr<JwksClient>& jwks_client() const {
    return jwks_client_;
  }

  // Scopes from "scope" (space separated) or "scp" (array)
  static std::vector<std::string> token_scopes(const nlohmann::json& claims);

 private:
  std::shared_ptr<JwksClient> jwks_client_;
  TokenValidatorConfig config_;
};

}  // namespace oidc
}  // namespace authkit

#endif  // AUTHKIT_OIDC_TOKEN_VALIDATOR_H
