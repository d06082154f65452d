#ifndef AUTHKIT_AUTH_AUTH_ERROR_H
#define AUTHKIT_AUTH_AUTH_ERROR_H

#include <stdexcept>
#include <string>

/**
 * @file auth_error.h
 * @brief Exception taxonomy for the authentication toolkit
 *
 * Every error raised by authkit derives from AuthException. Callers that
 * need to react to a specific failure catch the concrete type:
 *  - ConfigError: configuration missing or malformed, never retried
 *  - ProtocolError: the authorization server answered with an error payload
 *  - TransportError: network failure or unexpected HTTP status
 *  - ValidationError: a token failed validation, see ValidationErrorKind
 *  - DataIntegrityError: persisted data failed its validity contract
 *  - FlowError: a grant flow ended without producing a credential
 */

namespace authkit {

class AuthException : public std::runtime_error {
 public:
  explicit AuthException(const std::string& message)
      : std::runtime_error(message) {}
};

class ConfigError : public AuthException {
 public:
  explicit ConfigError(const std::string& message,
                       const std::string& field = "")
      : AuthException(field.empty()
                          ? "Configuration error: " + message
                          : "Configuration error at field '" + field +
                                "': " + message),
        field_(field) {}

  const std::string& field() const { return field_; }

 private:
  std::string field_;
};

/**
 * @brief OAuth/OIDC error payload returned by a server
 *
 * error_code() carries the raw code ("invalid_grant",
 * "authorization_pending", ...) so callers can branch on it.
 */
class ProtocolError : public AuthException {
 public:
  ProtocolError(const std::string& error_code,
                const std::string& description,
                int http_status = 0);

  const std::string& error_code() const { return error_code_; }
  const std::string& error_description() const { return description_; }
  int http_status() const { return http_status_; }

 private:
  std::string error_code_;
  std::string description_;
  int http_status_;
};

class TransportError : public AuthException {
 public:
  explicit TransportError(const std::string& message, int http_status = -1)
      : AuthException(message), http_status_(http_status) {}

  // -1 when no HTTP response was received
  int http_status() const { return http_status_; }

 private:
  int http_status_;
};

// Response arrived but its body is not what the endpoint promises
class PayloadError : public TransportError {
 public:
  explicit PayloadError(const std::string& message, int http_status = -1)
      : TransportError(message, http_status) {}
};

enum class ValidationErrorKind {
  EXPIRED,
  NOT_YET_VALID,
  UNKNOWN_SIGNING_KEY,
  INVALID_ALGORITHM,
  INVALID_SIGNATURE,
  WRONG_ISSUER,
  WRONG_AUDIENCE,
  MISSING_REQUIRED_SCOPE,
  MALFORMED_ARGUMENT,
  MALFORMED_TOKEN,
  UNTRUSTED_ISSUER,
  INACTIVE_TOKEN
};

const char* validation_error_kind_to_string(ValidationErrorKind kind);

class ValidationError : public AuthException {
 public:
  ValidationError(ValidationErrorKind kind, const std::string& message);

  ValidationErrorKind kind() const { return kind_; }

 private:
  ValidationErrorKind kind_;
};

class DataIntegrityError : public AuthException {
 public:
  explicit DataIntegrityError(const std::string& message,
                              const std::string& file_path = "");

  const std::string& file_path() const { return file_path_; }

 private:
  std::string file_path_;
};

// The backing file does not exist
class CredentialMissingError : public DataIntegrityError {
 public:
  explicit CredentialMissingError(const std::string& file_path)
      : DataIntegrityError("File not found", file_path) {}
};

class FlowError : public AuthException {
 public:
  explicit FlowError(const std::string& message) : AuthException(message) {}
};

}  // namespace authkit

#endif  // AUTHKIT_AUTH_AUTH_ERROR_H
