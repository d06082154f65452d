#ifndef AUTHKIT_OIDC_JWT_H
#define AUTHKIT_OIDC_JWT_H

#include <cstdint>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "authkit/core/compat.h"
#include "authkit/oidc/jwks_client.h"

/**
 * @file jwt.h
 * @brief JWT decoding, signing and signature verification
 *
 * Two separate entry points exist on purpose:
 *  - TokenInspector decodes a token WITHOUT checking its signature. It is
 *    for looking at tokens this process obtained for itself (refresh
 *    timing, display) and must never be used to decide whether to trust a
 *    token.
 *  - TokenValidator (token_validator.h) verifies signature and claims.
 */

typedef struct evp_pkey_st EVP_PKEY;

namespace authkit {
namespace oidc {

struct JwtParts {
  std::string header_b64;
  std::string payload_b64;
  std::string signature_b64;

  std::string signing_input() const { return header_b64 + "." + payload_b64; }
};

/**
 * @brief Split a compact JWS into its three segments
 * @throws ValidationError(MALFORMED_TOKEN)
 */
JwtParts split_jwt(const std::string& token);

struct UnverifiedJwt {
  nlohmann::json header;
  nlohmann::json claims;
};

class TokenInspector {
 public:
  // nullopt if the token is not a decodable JWT
  static optional<UnverifiedJwt> inspect(const std::string& token);

  static optional<nlohmann::json> unverified_claims(const std::string& token);

  /**
   * @brief Point in a token's life at which it should be renewed
   *
   * iat + 3/4 of the lifetime, in whole seconds. Missing or non-numeric
   * iat/exp count as 0.
   */
  static int64_t refresh_at(const nlohmann::json& claims);
};

// Integer claim or nullopt
optional<int64_t> numeric_claim(const nlohmann::json& claims,
                                const std::string& name);

/**
 * @brief Verify a JWS signature with a JWK
 *
 * Supports RS256/384/512 and ES256/384/512.
 * @throws ValidationError(INVALID_ALGORITHM) for unsupported or mismatched
 *         algorithms
 * @return false when the signature does not match
 */
bool verify_jws_signature(const std::string& alg,
                          const JsonWebKey& key,
                          const std::string& signing_input,
                          const std::string& signature);

/**
 * @brief Signs claim sets with a private key (RS256 for RSA keys, ES256,
 * ES384 or ES512 for EC keys depending on the curve)
 */
class JwtSigner {
 public:
  /**
   * @brief Load a PEM private key
   * @param password Passphrase for encrypted PEM, empty if none
   * @throws ConfigError when the key cannot be parsed
   */
  static JwtSigner from_pem(const std::string& pem,
                            const std::string& password = "");
  static JwtSigner from_pem_file(const std::string& path,
                                 const std::string& password = "");

  ~JwtSigner();
  JwtSigner(JwtSigner&& other) noexcept;
  JwtSigner& operator=(JwtSigner&& other) noexcept;
  JwtSigner(const JwtSigner&) = delete;
  JwtSigner& operator=(const JwtSigner&) = delete;

  const std::string& algorithm() const { return alg_; }

  std::string sign(const nlohmann::json& claims,
                   const std::string& kid = "") const;

 private:
  JwtSigner(EVP_PKEY* key, std::string alg);

  EVP_PKEY* key_;
  std::string alg_;
};

}  // namespace oidc
}  // namespace authkit

#endif  // AUTHKIT_OIDC_JWT_H
