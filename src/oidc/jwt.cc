#include "authkit/oidc/jwt.h"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>
#include <openssl/pem.h>

#include "authkit/auth/auth_error.h"
#include "authkit/auth/auth_util.h"

namespace authkit {
namespace oidc {

namespace {

using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ParamBldPtr = std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using ParamPtr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;
using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;

struct AlgorithmInfo {
  const char* name;
  JsonWebKey::KeyType key_type;
  const EVP_MD* (*digest)();
  const char* curve;       // JWK "crv" for EC algorithms
  const char* group_name;  // OpenSSL group name for EC algorithms
  size_t coordinate_size;  // Bytes per r/s value for EC algorithms
};

const AlgorithmInfo kAlgorithms[] = {
    {"RS256", JsonWebKey::KeyType::RSA, &EVP_sha256, nullptr, nullptr, 0},
    {"RS384", JsonWebKey::KeyType::RSA, &EVP_sha384, nullptr, nullptr, 0},
    {"RS512", JsonWebKey::KeyType::RSA, &EVP_sha512, nullptr, nullptr, 0},
    {"ES256", JsonWebKey::KeyType::EC, &EVP_sha256, "P-256", "prime256v1", 32},
    {"ES384", JsonWebKey::KeyType::EC, &EVP_sha384, "P-384", "secp384r1", 48},
    {"ES512", JsonWebKey::KeyType::EC, &EVP_sha512, "P-521", "secp521r1", 66},
};

const AlgorithmInfo* find_algorithm(const std::string& alg) {
  for (const auto& info : kAlgorithms) {
    if (alg == info.name) {
      return &info;
    }
  }
  return nullptr;
}

std::string openssl_error() {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return "unknown OpenSSL error";
  }
  char buffer[256];
  ERR_error_string_n(code, buffer, sizeof(buffer));
  ERR_clear_error();
  return buffer;
}

const unsigned char* bytes(const std::string& data) {
  return reinterpret_cast<const unsigned char*>(data.data());
}

std::string left_pad(const std::string& value, size_t size) {
  if (value.size() >= size) {
    return value;
  }
  return std::string(size - value.size(), '\0') + value;
}

PkeyPtr pkey_from_params(const char* type, OSSL_PARAM_BLD* builder) {
  ParamPtr params(OSSL_PARAM_BLD_to_param(builder), &OSSL_PARAM_free);
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, type, nullptr),
                 &EVP_PKEY_CTX_free);
  if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) <= 0) {
    throw ValidationError(ValidationErrorKind::UNKNOWN_SIGNING_KEY,
                          "Cannot import key: " + openssl_error());
  }
  EVP_PKEY* pkey = nullptr;
  if (EVP_PKEY_fromdata(ctx.get(), &pkey, EVP_PKEY_PUBLIC_KEY, params.get()) <=
      0) {
    throw ValidationError(ValidationErrorKind::UNKNOWN_SIGNING_KEY,
                          "Cannot import key: " + openssl_error());
  }
  return PkeyPtr(pkey, &EVP_PKEY_free);
}

PkeyPtr jwk_to_pkey(const JsonWebKey& key, const AlgorithmInfo& alg) {
  ParamBldPtr builder(OSSL_PARAM_BLD_new(), &OSSL_PARAM_BLD_free);
  if (!builder) {
    throw AuthException("OSSL_PARAM_BLD_new failed");
  }

  try {
    if (alg.key_type == JsonWebKey::KeyType::RSA) {
      std::string n = util::base64url_decode(key.n);
      std::string e = util::base64url_decode(key.e);
      BignumPtr bn_n(BN_bin2bn(bytes(n), static_cast<int>(n.size()), nullptr),
                     &BN_free);
      BignumPtr bn_e(BN_bin2bn(bytes(e), static_cast<int>(e.size()), nullptr),
                     &BN_free);
      if (!bn_n || !bn_e ||
          !OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_RSA_N,
                                  bn_n.get()) ||
          !OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_RSA_E,
                                  bn_e.get())) {
        throw ValidationError(ValidationErrorKind::UNKNOWN_SIGNING_KEY,
                              "Invalid RSA key parameters");
      }
      return pkey_from_params("RSA", builder.get());
    }

    std::string point = "\x04" +
                        left_pad(util::base64url_decode(key.x),
                                 alg.coordinate_size) +
                        left_pad(util::base64url_decode(key.y),
                                 alg.coordinate_size);
    if (!OSSL_PARAM_BLD_push_utf8_string(builder.get(),
                                         OSSL_PKEY_PARAM_GROUP_NAME,
                                         alg.group_name, 0) ||
        !OSSL_PARAM_BLD_push_octet_string(builder.get(),
                                          OSSL_PKEY_PARAM_PUB_KEY,
                                          point.data(), point.size())) {
      throw ValidationError(ValidationErrorKind::UNKNOWN_SIGNING_KEY,
                            "Invalid EC key parameters");
    }
    return pkey_from_params("EC", builder.get());
  } catch (const std::invalid_argument&) {
    throw ValidationError(ValidationErrorKind::UNKNOWN_SIGNING_KEY,
                          "Key '" + key.kid + "' is not valid base64url");
  }
}

// JOSE ECDSA signatures are r||s; OpenSSL wants DER
std::string raw_to_der_signature(const std::string& raw, size_t coordinate) {
  if (raw.size() != coordinate * 2) {
    return "";
  }
  BIGNUM* r = BN_bin2bn(bytes(raw), static_cast<int>(coordinate), nullptr);
  BIGNUM* s = BN_bin2bn(bytes(raw) + coordinate, static_cast<int>(coordinate),
                        nullptr);
  EcdsaSigPtr sig(ECDSA_SIG_new(), &ECDSA_SIG_free);
  if (!r || !s || !sig || ECDSA_SIG_set0(sig.get(), r, s) != 1) {
    BN_free(r);
    BN_free(s);
    return "";
  }
  unsigned char* der = nullptr;
  int der_len = i2d_ECDSA_SIG(sig.get(), &der);
  if (der_len <= 0) {
    return "";
  }
  std::string result(reinterpret_cast<char*>(der), static_cast<size_t>(der_len));
  OPENSSL_free(der);
  return result;
}

std::string der_to_raw_signature(const std::string& der, size_t coordinate) {
  const unsigned char* cursor = bytes(der);
  EcdsaSigPtr sig(d2i_ECDSA_SIG(nullptr, &cursor, static_cast<long>(der.size())),
                  &ECDSA_SIG_free);
  if (!sig) {
    throw AuthException("Cannot decode ECDSA signature: " + openssl_error());
  }
  const BIGNUM* r = nullptr;
  const BIGNUM* s = nullptr;
  ECDSA_SIG_get0(sig.get(), &r, &s);

  std::string raw(coordinate * 2, '\0');
  auto* out = reinterpret_cast<unsigned char*>(&raw[0]);
  if (BN_bn2binpad(r, out, static_cast<int>(coordinate)) < 0 ||
      BN_bn2binpad(s, out + coordinate, static_cast<int>(coordinate)) < 0) {
    throw AuthException("Cannot encode ECDSA signature");
  }
  return raw;
}

optional<nlohmann::json> decode_segment(const std::string& segment) {
  try {
    auto decoded = nlohmann::json::parse(util::base64url_decode(segment),
                                         nullptr, false);
    if (decoded.is_discarded() || !decoded.is_object()) {
      return nullopt;
    }
    return decoded;
  } catch (const std::invalid_argument&) {
    return nullopt;
  }
}

int password_callback(char* buf, int size, int /*rwflag*/, void* userdata) {
  const auto* password = static_cast<const std::string*>(userdata);
  if (!password || password->empty()) {
    return 0;
  }
  int len = std::min(size, static_cast<int>(password->size()));
  std::memcpy(buf, password->data(), static_cast<size_t>(len));
  return len;
}

}  // namespace

JwtParts split_jwt(const std::string& token) {
  auto first = token.find('.');
  auto second =
      first == std::string::npos ? std::string::npos : token.find('.', first + 1);
  if (first == std::string::npos || second == std::string::npos ||
      token.find('.', second + 1) != std::string::npos) {
    throw ValidationError(ValidationErrorKind::MALFORMED_TOKEN,
                          "Token is not a three part JWS");
  }
  JwtParts parts;
  parts.header_b64 = token.substr(0, first);
  parts.payload_b64 = token.substr(first + 1, second - first - 1);
  parts.signature_b64 = token.substr(second + 1);
  if (parts.header_b64.empty() || parts.payload_b64.empty()) {
    throw ValidationError(ValidationErrorKind::MALFORMED_TOKEN,
                          "Token has an empty header or payload");
  }
  return parts;
}

optional<UnverifiedJwt> TokenInspector::inspect(const std::string& token) {
  JwtParts parts;
  try {
    parts = split_jwt(token);
  } catch (const ValidationError&) {
    return nullopt;
  }
  auto header = decode_segment(parts.header_b64);
  auto claims = decode_segment(parts.payload_b64);
  if (!header || !claims) {
    return nullopt;
  }
  return UnverifiedJwt{std::move(*header), std::move(*claims)};
}

optional<nlohmann::json> TokenInspector::unverified_claims(
    const std::string& token) {
  auto decoded = inspect(token);
  if (!decoded) {
    return nullopt;
  }
  return decoded->claims;
}

int64_t TokenInspector::refresh_at(const nlohmann::json& claims) {
  int64_t iat = numeric_claim(claims, "iat").value_or(0);
  int64_t exp = numeric_claim(claims, "exp").value_or(0);
  return iat + (3 * (exp - iat)) / 4;
}

optional<int64_t> numeric_claim(const nlohmann::json& claims,
                                const std::string& name) {
  if (!claims.is_object()) {
    return nullopt;
  }
  auto it = claims.find(name);
  if (it == claims.end()) {
    return nullopt;
  }
  if (it->is_number_integer()) {
    return it->get<int64_t>();
  }
  if (it->is_number_float()) {
    return static_cast<int64_t>(it->get<double>());
  }
  return nullopt;
}

bool verify_jws_signature(const std::string& alg,
                          const JsonWebKey& key,
                          const std::string& signing_input,
                          const std::string& signature) {
  const AlgorithmInfo* info = find_algorithm(alg);
  if (!info) {
    throw ValidationError(ValidationErrorKind::INVALID_ALGORITHM,
                          "Unsupported algorithm '" + alg + "'");
  }
  if (key.get_key_type() != info->key_type) {
    throw ValidationError(ValidationErrorKind::INVALID_ALGORITHM,
                          "Algorithm " + alg + " does not match key type " +
                              key.kty);
  }
  if (!key.alg.empty() && key.alg != alg) {
    throw ValidationError(ValidationErrorKind::INVALID_ALGORITHM,
                          "Key '" + key.kid + "' is restricted to " + key.alg);
  }
  if (info->curve && key.crv != info->curve) {
    throw ValidationError(ValidationErrorKind::INVALID_ALGORITHM,
                          "Algorithm " + alg + " requires curve " +
                              info->curve);
  }

  PkeyPtr pkey = jwk_to_pkey(key, *info);

  std::string sig = signature;
  if (info->key_type == JsonWebKey::KeyType::EC) {
    sig = raw_to_der_signature(signature, info->coordinate_size);
    if (sig.empty()) {
      return false;
    }
  }

  MdCtxPtr md_ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!md_ctx ||
      EVP_DigestVerifyInit(md_ctx.get(), nullptr, info->digest(), nullptr,
                           pkey.get()) != 1) {
    throw AuthException("EVP_DigestVerifyInit failed: " + openssl_error());
  }
  int rc = EVP_DigestVerify(md_ctx.get(), bytes(sig), sig.size(),
                            bytes(signing_input), signing_input.size());
  ERR_clear_error();
  return rc == 1;
}

JwtSigner::JwtSigner(EVP_PKEY* key, std::string alg)
    : key_(key), alg_(std::move(alg)) {}

JwtSigner::~JwtSigner() {
  if (key_) {
    EVP_PKEY_free(key_);
  }
}

JwtSigner::JwtSigner(JwtSigner&& other) noexcept
    : key_(other.key_), alg_(std::move(other.alg_)) {
  other.key_ = nullptr;
}

JwtSigner& JwtSigner::operator=(JwtSigner&& other) noexcept {
  if (this != &other) {
    if (key_) {
      EVP_PKEY_free(key_);
    }
    key_ = other.key_;
    alg_ = std::move(other.alg_);
    other.key_ = nullptr;
  }
  return *this;
}

JwtSigner JwtSigner::from_pem(const std::string& pem,
                              const std::string& password) {
  BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())),
             &BIO_free);
  if (!bio) {
    throw ConfigError("Cannot allocate buffer for private key");
  }
  std::string pass = password;
  PkeyPtr pkey(PEM_read_bio_PrivateKey(bio.get(), nullptr, &password_callback,
                                       &pass),
               &EVP_PKEY_free);
  if (!pkey) {
    throw ConfigError("Cannot load private key: " + openssl_error());
  }

  std::string alg;
  if (EVP_PKEY_get_base_id(pkey.get()) == EVP_PKEY_RSA) {
    alg = "RS256";
  } else if (EVP_PKEY_get_base_id(pkey.get()) == EVP_PKEY_EC) {
    char group[64] = {0};
    size_t group_len = 0;
    if (EVP_PKEY_get_utf8_string_param(pkey.get(), OSSL_PKEY_PARAM_GROUP_NAME,
                                       group, sizeof(group), &group_len) != 1) {
      throw ConfigError("Cannot determine EC curve of private key");
    }
    for (const auto& info : kAlgorithms) {
      if (info.group_name && std::strcmp(info.group_name, group) == 0) {
        alg = info.name;
      }
    }
    if (alg.empty()) {
      throw ConfigError(std::string("Unsupported EC curve ") + group);
    }
  } else {
    throw ConfigError("Private key must be RSA or EC");
  }
  return JwtSigner(pkey.release(), alg);
}

JwtSigner JwtSigner::from_pem_file(const std::string& path,
                                   const std::string& password) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("Cannot read private key file " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return from_pem(buffer.str(), password);
}

std::string JwtSigner::sign(const nlohmann::json& claims,
                            const std::string& kid) const {
  const AlgorithmInfo* info = find_algorithm(alg_);
  if (!key_ || !info) {
    throw AuthException("Signer has no usable key");
  }

  nlohmann::json header = {{"alg", alg_}, {"typ", "JWT"}};
  if (!kid.empty()) {
    header["kid"] = kid;
  }
  const std::string signing_input = util::base64url_encode(header.dump()) +
                                    "." +
                                    util::base64url_encode(claims.dump());

  MdCtxPtr md_ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!md_ctx || EVP_DigestSignInit(md_ctx.get(), nullptr, info->digest(),
                                    nullptr, key_) != 1) {
    throw AuthException("EVP_DigestSignInit failed: " + openssl_error());
  }
  size_t sig_len = 0;
  if (EVP_DigestSign(md_ctx.get(), nullptr, &sig_len, bytes(signing_input),
                     signing_input.size()) != 1) {
    throw AuthException("EVP_DigestSign failed: " + openssl_error());
  }
  std::string signature(sig_len, '\0');
  if (EVP_DigestSign(md_ctx.get(),
                     reinterpret_cast<unsigned char*>(&signature[0]), &sig_len,
                     bytes(signing_input), signing_input.size()) != 1) {
    throw AuthException("EVP_DigestSign failed: " + openssl_error());
  }
  signature.resize(sig_len);

  if (info->key_type == JsonWebKey::KeyType::EC) {
    signature = der_to_raw_signature(signature, info->coordinate_size);
  }
  return signing_input + "." + util::base64url_encode(signature);
}

}  // namespace oidc
}  // namespace authkit
