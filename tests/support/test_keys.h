#pragma once

#include <cstring>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <nlohmann/json.hpp>

#include "authkit/auth/auth_util.h"
#include "authkit/oidc/jwt.h"

namespace authkit {
namespace test {

// Key pair generated at test time, with its PEM and public JWK forms
class TestKey {
 public:
  static const TestKey& rsa(const std::string& kid) {
    return cached(kid, "RSA");
  }

  static const TestKey& ec(const std::string& kid) { return cached(kid, "EC"); }

  const std::string& kid() const { return kid_; }

  // Unencrypted PKCS#8 PEM, or AES-256-CBC encrypted with a password
  std::string private_pem(const std::string& password = "") const {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()),
                                                   BIO_free);
    int ok;
    if (password.empty()) {
      ok = PEM_write_bio_PrivateKey(bio.get(), key_.get(), nullptr, nullptr, 0,
                                    nullptr, nullptr);
    } else {
      ok = PEM_write_bio_PrivateKey(
          bio.get(), key_.get(), EVP_aes_256_cbc(),
          reinterpret_cast<const unsigned char*>(password.data()),
          static_cast<int>(password.size()), nullptr, nullptr);
    }
    if (ok != 1) {
      throw std::runtime_error("PEM export failed");
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(len));
  }

  nlohmann::json public_jwk() const {
    if (type_ == "RSA") {
      return {{"kid", kid_},
              {"kty", "RSA"},
              {"use", "sig"},
              {"alg", "RS256"},
              {"n", bn_param(OSSL_PKEY_PARAM_RSA_N, 0)},
              {"e", bn_param(OSSL_PKEY_PARAM_RSA_E, 0)}};
    }
    return {{"kid", kid_},
            {"kty", "EC"},
            {"use", "sig"},
            {"alg", "ES256"},
            {"crv", "P-256"},
            {"x", bn_param(OSSL_PKEY_PARAM_EC_PUB_X, 32)},
            {"y", bn_param(OSSL_PKEY_PARAM_EC_PUB_Y, 32)}};
  }

  std::string sign(const nlohmann::json& claims) const {
    return oidc::JwtSigner::from_pem(private_pem()).sign(claims, kid_);
  }

 private:
  TestKey(std::string kid, std::string type)
      : kid_(std::move(kid)), type_(std::move(type)), key_(nullptr, EVP_PKEY_free) {
    EVP_PKEY* key = type_ == "RSA" ? EVP_RSA_gen(2048) : EVP_EC_gen("P-256");
    if (!key) {
      throw std::runtime_error("Key generation failed");
    }
    key_.reset(key);
  }

  static const TestKey& cached(const std::string& kid,
                               const std::string& type) {
    static std::map<std::string, std::unique_ptr<TestKey>> keys;
    auto& slot = keys[type + ":" + kid];
    if (!slot) {
      slot.reset(new TestKey(kid, type));
    }
    return *slot;
  }

  std::string bn_param(const char* name, int pad_to) const {
    BIGNUM* bn = nullptr;
    if (EVP_PKEY_get_bn_param(key_.get(), name, &bn) != 1) {
      throw std::runtime_error(std::string("Missing key parameter ") + name);
    }
    int len = pad_to > 0 ? pad_to : BN_num_bytes(bn);
    std::vector<unsigned char> bytes(static_cast<size_t>(len));
    BN_bn2binpad(bn, bytes.data(), len);
    BN_free(bn);
    return util::base64url_encode(
        std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
  }

  std::string kid_;
  std::string type_;
  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_;
};

}  // namespace test
}  // namespace authkit
