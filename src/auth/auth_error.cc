#include "authkit/auth/auth_error.h"

namespace authkit {

namespace {

std::string format_protocol_error(const std::string& error_code,
                                  const std::string& description,
                                  int http_status) {
  std::string message = "Authorization server error";
  if (http_status > 0) {
    message += " (HTTP " + std::to_string(http_status) + ")";
  }
  message += ": " + error_code;
  if (!description.empty()) {
    message += " - " + description;
  }
  return message;
}

}  // namespace

ProtocolError::ProtocolError(const std::string& error_code,
                             const std::string& description,
                             int http_status)
    : AuthException(format_protocol_error(error_code, description, http_status)),
      error_code_(error_code),
      description_(description),
      http_status_(http_status) {}

const char* validation_error_kind_to_string(ValidationErrorKind kind) {
  switch (kind) {
    case ValidationErrorKind::EXPIRED: return "expired";
    case ValidationErrorKind::NOT_YET_VALID: return "not_yet_valid";
    case ValidationErrorKind::UNKNOWN_SIGNING_KEY: return "unknown_signing_key";
    case ValidationErrorKind::INVALID_ALGORITHM: return "invalid_algorithm";
    case ValidationErrorKind::INVALID_SIGNATURE: return "invalid_signature";
    case ValidationErrorKind::WRONG_ISSUER: return "wrong_issuer";
    case ValidationErrorKind::WRONG_AUDIENCE: return "wrong_audience";
    case ValidationErrorKind::MISSING_REQUIRED_SCOPE:
      return "missing_required_scope";
    case ValidationErrorKind::MALFORMED_ARGUMENT: return "malformed_argument";
    case ValidationErrorKind::MALFORMED_TOKEN: return "malformed_token";
    case ValidationErrorKind::UNTRUSTED_ISSUER: return "untrusted_issuer";
    case ValidationErrorKind::INACTIVE_TOKEN: return "inactive_token";
  }
  return "unknown";
}

ValidationError::ValidationError(ValidationErrorKind kind,
                                 const std::string& message)
    : AuthException(std::string("Token validation failed [") +
                    validation_error_kind_to_string(kind) + "]: " + message),
      kind_(kind) {}

DataIntegrityError::DataIntegrityError(const std::string& message,
                                       const std::string& file_path)
    : AuthException(file_path.empty() ? message
                                      : message + " (" + file_path + ")"),
      file_path_(file_path) {}

}  // namespace authkit
