#include "authkit/oidc/token_validator.h"

#include <algorithm>

#include "authkit/auth/auth_error.h"
#include "authkit/auth/auth_util.h"
#include "authkit/oidc/jwt.h"

#define AUTHKIT_LOG_COMPONENT "authkit.validator"
#include "authkit/logging/log_macros.h"

namespace authkit {
namespace oidc {

namespace {

bool audience_matches(const nlohmann::json& claims,
                      const std::string& audience) {
  auto it = claims.find("aud");
  if (it == claims.end()) {
    return false;
  }
  if (it->is_string()) {
    return it->get<std::string>() == audience;
  }
  if (it->is_array()) {
    for (const auto& entry : *it) {
      if (entry.is_string() && entry.get<std::string>() == audience) {
        return true;
      }
    }
  }
  return false;
}

std::string string_claim(const nlohmann::json& object, const char* name) {
  auto it = object.find(name);
  if (it != object.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return "";
}

}  // namespace

TokenValidatorConfig::TokenValidatorConfig()
    : clock_skew(60),
      allowed_algorithms{"RS256", "RS384", "RS512",
                         "ES256", "ES384", "ES512"} {}

TokenValidator::TokenValidator(std::shared_ptr<JwksClient> jwks_client,
                               const TokenValidatorConfig& config)
    : jwks_client_(std::move(jwks_client)), config_(config) {}

std::vector<std::string> TokenValidator::token_scopes(
    const nlohmann::json& claims) {
  std::vector<std::string> scopes;
  auto scope = claims.find("scope");
  if (scope != claims.end() && scope->is_string()) {
    scopes = util::split_whitespace(scope->get<std::string>());
  }
  auto scp = claims.find("scp");
  if (scp != claims.end()) {
    if (scp->is_array()) {
      for (const auto& entry : *scp) {
        if (entry.is_string()) {
          scopes.push_back(entry.get<std::string>());
        }
      }
    } else if (scp->is_string()) {
      auto split = util::split_whitespace(scp->get<std::string>());
      scopes.insert(scopes.end(), split.begin(), split.end());
    }
  }
  return scopes;
}

nlohmann::json TokenValidator::validate_token(
    const std::string& token,
    const std::string& issuer,
    const std::string& audience,
    const std::vector<std::string>& required_scopes,
    const std::string& nonce) const {
  if (token.empty()) {
    throw ValidationError(ValidationErrorKind::MALFORMED_ARGUMENT,
                          "No token provided");
  }
  if (issuer.empty()) {
    throw ValidationError(ValidationErrorKind::MALFORMED_ARGUMENT,
                          "No expected issuer provided");
  }
  if (audience.empty()) {
    throw ValidationError(ValidationErrorKind::MALFORMED_ARGUMENT,
                          "No expected audience provided");
  }
  if (!jwks_client_) {
    throw ValidationError(ValidationErrorKind::MALFORMED_ARGUMENT,
                          "No JWKS source configured");
  }

  JwtParts parts = split_jwt(token);
  auto decoded = TokenInspector::inspect(token);
  if (!decoded) {
    throw ValidationError(ValidationErrorKind::MALFORMED_TOKEN,
                          "Token header or payload is not a JSON object");
  }
  const nlohmann::json& header = decoded->header;
  const nlohmann::json& claims = decoded->claims;

  const std::string alg = string_claim(header, "alg");
  if (std::find(config_.allowed_algorithms.begin(),
                config_.allowed_algorithms.end(),
                alg) == config_.allowed_algorithms.end()) {
    throw ValidationError(ValidationErrorKind::INVALID_ALGORITHM,
                          "Algorithm '" + alg + "' is not accepted");
  }

  const std::string kid = string_claim(header, "kid");
  if (kid.empty()) {
    throw ValidationError(ValidationErrorKind::UNKNOWN_SIGNING_KEY,
                          "Token header carries no key id");
  }
  auto key = jwks_client_->get_key(kid);
  if (!key) {
    throw ValidationError(ValidationErrorKind::UNKNOWN_SIGNING_KEY,
                          "Signing key '" + kid + "' is not published by " +
                              jwks_client_->endpoint_uri());
  }

  std::string signature;
  try {
    signature = util::base64url_decode(parts.signature_b64);
  } catch (const std::invalid_argument&) {
    throw ValidationError(ValidationErrorKind::MALFORMED_TOKEN,
                          "Signature is not valid base64url");
  }
  if (!verify_jws_signature(alg, *key, parts.signing_input(), signature)) {
    throw ValidationError(ValidationErrorKind::INVALID_SIGNATURE,
                          "Signature verification failed");
  }

  const std::string token_issuer = string_claim(claims, "iss");
  if (token_issuer != issuer) {
    throw ValidationError(ValidationErrorKind::WRONG_ISSUER,
                          "Issuer '" + token_issuer + "' does not match '" +
                              issuer + "'");
  }

  if (!audience_matches(claims, audience)) {
    throw ValidationError(ValidationErrorKind::WRONG_AUDIENCE,
                          "Token is not issued for audience '" + audience +
                              "'");
  }

  const int64_t now = util::epoch_seconds();
  const int64_t skew = config_.clock_skew.count();
  auto exp = numeric_claim(claims, "exp");
  if (!exp) {
    throw ValidationError(ValidationErrorKind::MALFORMED_TOKEN,
                          "Token has no exp claim");
  }
  if (now > *exp + skew) {
    throw ValidationError(ValidationErrorKind::EXPIRED, "Token has expired");
  }
  auto nbf = numeric_claim(claims, "nbf");
  if (nbf && now + skew < *nbf) {
    throw ValidationError(ValidationErrorKind::NOT_YET_VALID,
                          "Token is not valid yet");
  }

  if (!nonce.empty() && string_claim(claims, "nonce") != nonce) {
    throw ValidationError(ValidationErrorKind::MALFORMED_TOKEN,
                          "Token nonce does not match the request");
  }

  if (!required_scopes.empty()) {
    auto held = token_scopes(claims);
    bool any = std::any_of(
        required_scopes.begin(), required_scopes.end(),
        [&held](const std::string& scope) {
          return std::find(held.begin(), held.end(), scope) != held.end();
        });
    if (!any) {
      throw ValidationError(ValidationErrorKind::MISSING_REQUIRED_SCOPE,
                            "Token holds none of the scopes [" +
                                util::join(required_scopes, ", ") + "]");
    }
  }

  AUTHKIT_LOG(Debug, "Validated token from {} for {} (sub={})", issuer,
              audience, string_claim(claims, "sub"));
  return claims;
}

}  // namespace oidc
}  // namespace authkit
