#include "authkit/oidc/multi_validator.h"

#include "authkit/auth/auth_error.h"
#include "authkit/oidc/jwt.h"
#include "authkit/oidc/oidc_flows.h"

#define AUTHKIT_LOG_COMPONENT "authkit.validator"
#include "authkit/logging/log_macros.h"

namespace authkit {
namespace oidc {

OidcMultiIssuerValidator::OidcMultiIssuerValidator(
    bool log_result, const TokenValidatorConfig& validator_config)
    : log_result_(log_result), validator_config_(validator_config) {}

OidcMultiIssuerValidator::OidcMultiIssuerValidator(
    const std::vector<TrustEntry>& trusted,
    bool log_result,
    const TokenValidatorConfig& validator_config)
    : OidcMultiIssuerValidator(log_result, validator_config) {
  for (const auto& trust : trusted) {
    if (!trust.jwks_client) {
      throw ConfigError("Trust entry for " + trust.issuer +
                        " has no JWKS client");
    }
    Entry entry;
    entry.audience = trust.audience;
    entry.jwks_client = trust.jwks_client;
    add_entry(trust.issuer, std::move(entry));
  }
}

OidcMultiIssuerValidator OidcMultiIssuerValidator::from_configs(
    const std::vector<ClientValidatorConfig>& configs,
    AuthClientContext context,
    bool log_result) {
  OidcMultiIssuerValidator validator(log_result, TokenValidatorConfig());
  for (const auto& config : configs) {
    const OidcServerConfig& server = config.server;
    if (server.audiences.size() != 1) {
      throw ConfigError("Each trusted issuer needs exactly one audience",
                        "audiences");
    }
    std::string issuer = server.issuer && !server.issuer->empty()
                             ? *server.issuer
                             : server.auth_server;
    Entry entry;
    entry.audience = server.audiences.front();
    entry.auth_client =
        std::make_shared<OidcClientValidatorAuthClient>(config, context);
    validator.add_entry(issuer, std::move(entry));
  }
  return validator;
}

void OidcMultiIssuerValidator::add_entry(const std::string& issuer,
                                         Entry entry) {
  if (issuer.empty()) {
    throw ConfigError("Trusted issuer must not be empty", "issuer");
  }
  if (entry.audience.empty()) {
    throw ConfigError("Trusted issuer " + issuer + " has no audience",
                      "audiences");
  }
  if (entries_.count(issuer) != 0) {
    throw ConfigError("Issuer " + issuer + " is trusted more than once",
                      "issuer");
  }
  entries_.emplace(issuer, std::move(entry));
}

namespace {

// "sub" is only logged, so any JSON type is rendered rather than rejected
std::string subject_of(const nlohmann::json& claims) {
  auto it = claims.find("sub");
  if (it == claims.end()) {
    return "<no subject>";
  }
  return it->is_string() ? it->get<std::string>() : it->dump();
}

}  // namespace

TokenValidator& OidcMultiIssuerValidator::validator_for(Entry& entry) {
  if (!entry.validator) {
    if (!entry.jwks_client) {
      entry.jwks_client = entry.auth_client->jwks_client();
    }
    entry.validator =
        std::make_unique<TokenValidator>(entry.jwks_client, validator_config_);
  }
  return *entry.validator;
}

std::vector<std::string> OidcMultiIssuerValidator::trusted_issuers() const {
  std::vector<std::string> issuers;
  for (const auto& entry : entries_) {
    issuers.push_back(entry.first);
  }
  return issuers;
}

nlohmann::json OidcMultiIssuerValidator::validate_access_token(
    const std::string& token, const std::vector<std::string>& scopes_anyof) {
  if (token.empty()) {
    throw ValidationError(ValidationErrorKind::MALFORMED_ARGUMENT,
                          "No token given");
  }
  // Routing only; nothing from these claims is trusted
  auto unverified = TokenInspector::unverified_claims(token);
  if (!unverified) {
    throw ValidationError(ValidationErrorKind::MALFORMED_TOKEN,
                          "Token is not a decodable JWT");
  }
  auto iss = unverified->find("iss");
  if (iss == unverified->end() || !iss->is_string()) {
    throw ValidationError(ValidationErrorKind::MALFORMED_TOKEN,
                          "Token has no issuer");
  }
  const std::string issuer = iss->get<std::string>();

  auto it = entries_.find(issuer);
  if (it == entries_.end()) {
    if (log_result_) {
      AUTHKIT_LOG(Warning, "Rejected token from untrusted issuer {}", issuer);
    }
    throw ValidationError(ValidationErrorKind::UNTRUSTED_ISSUER,
                          "Issuer " + issuer + " is not trusted");
  }

  try {
    nlohmann::json claims = validator_for(it->second).validate_token(
        token, issuer, it->second.audience, scopes_anyof);
    if (log_result_) {
      AUTHKIT_LOG(Info, "Accepted token for {} from {}", subject_of(claims),
                  issuer);
    }
    return claims;
  } catch (const ValidationError& e) {
    if (log_result_) {
      AUTHKIT_LOG(Warning, "Rejected token from {}: {} ({})", issuer,
                  e.what(), validation_error_kind_to_string(e.kind()));
    }
    throw;
  }
}

}  // namespace oidc
}  // namespace authkit
