#ifndef AUTHKIT_AUTH_AUTH_UTIL_H
#define AUTHKIT_AUTH_AUTH_UTIL_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "authkit/core/compat.h"

/**
 * @file auth_util.h
 * @brief Encoding, hashing and small parsing helpers shared by the toolkit
 */

namespace authkit {
namespace util {

// Ordered field map used for form bodies and query strings
using FormData = std::map<std::string, std::string>;

struct ContentType {
  std::string content_type;  // Lower-cased media type, e.g. "application/json"
  optional<std::string> charset;
};

/**
 * @brief Split a Content-Type header into media type and charset
 *
 * "Application/JSON; charset=UTF-8" -> {"application/json", "utf-8"}.
 * An empty header yields an empty content_type.
 */
ContentType parse_content_type(const std::string& header_value);

std::string base64_encode(const std::string& data);

// URL-safe alphabet, no padding
std::string base64url_encode(const std::string& data);

/**
 * @brief Decode URL-safe base64, padding optional
 * @throws std::invalid_argument on characters outside the alphabet
 */
std::string base64url_decode(const std::string& input);

// RFC 3986 percent-encoding
std::string url_encode(const std::string& value);
std::string url_decode(const std::string& value);

// application/x-www-form-urlencoded body
std::string form_encode(const FormData& fields);

// "a=1&b=2" -> {a:1, b:2}; a leading '?' is ignored
FormData parse_query_string(const std::string& query);

std::string join(const std::vector<std::string>& parts,
                 const std::string& separator);
std::vector<std::string> split_whitespace(const std::string& value);

// Cryptographically random bytes, base64url encoded
std::string random_urlsafe_string(size_t num_bytes);

// Raw SHA-256 digest
std::string sha256(const std::string& data);

int64_t epoch_seconds();

struct ProcessResult {
  int exit_status;  // -1 when the child did not exit normally
  std::string output;
};

/**
 * @brief Run a program found on PATH and capture its stdout
 * @throws AuthException when the program cannot be started
 */
ProcessResult run_process(const std::vector<std::string>& args);

}  // namespace util
}  // namespace authkit

#endif  // AUTHKIT_AUTH_AUTH_UTIL_H
