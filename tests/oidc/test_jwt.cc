#include <gtest/gtest.h>

#include "authkit/auth/auth_error.h"
#include "authkit/auth/auth_util.h"
#include "authkit/oidc/jwt.h"
#include "support/temp_dir.h"
#include "support/test_keys.h"

namespace authkit {
namespace oidc {
namespace {

using test::TempDir;
using test::TestKey;

JsonWebKey to_jwk(const nlohmann::json& json) {
  nlohmann::json document = {{"keys", nlohmann::json::array({json})}};
  auto parsed = JwksClient::parse_jwks(document.dump());
  if (!parsed || parsed->keys.empty()) {
    throw std::runtime_error("test key did not parse");
  }
  return parsed->keys.front();
}

ValidationErrorKind split_error(const std::string& token) {
  try {
    split_jwt(token);
  } catch (const ValidationError& e) {
    return e.kind();
  }
  return ValidationErrorKind::INACTIVE_TOKEN;
}

TEST(SplitJwtTest, ThreeSegments) {
  auto parts = split_jwt("aaa.bbb.ccc");
  EXPECT_EQ(parts.header_b64, "aaa");
  EXPECT_EQ(parts.payload_b64, "bbb");
  EXPECT_EQ(parts.signature_b64, "ccc");
  EXPECT_EQ(parts.signing_input(), "aaa.bbb");

  // Unsigned tokens have an empty signature segment
  EXPECT_EQ(split_jwt("aaa.bbb.").signature_b64, "");
}

TEST(SplitJwtTest, Malformed) {
  EXPECT_EQ(split_error("opaque"), ValidationErrorKind::MALFORMED_TOKEN);
  EXPECT_EQ(split_error("a.b"), ValidationErrorKind::MALFORMED_TOKEN);
  EXPECT_EQ(split_error("a.b.c.d"), ValidationErrorKind::MALFORMED_TOKEN);
  EXPECT_EQ(split_error(".b.c"), ValidationErrorKind::MALFORMED_TOKEN);
}

TEST(TokenInspectorTest, DecodesWithoutVerifying) {
  std::string header = util::base64url_encode(R"({"alg":"none"})");
  std::string payload = util::base64url_encode(R"({"sub":"abc","exp":99})");
  auto decoded = TokenInspector::inspect(header + "." + payload + ".");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->header["alg"], "none");
  EXPECT_EQ(decoded->claims["sub"], "abc");
}

TEST(TokenInspectorTest, RejectsGarbage) {
  EXPECT_FALSE(TokenInspector::inspect("not-a-jwt").has_value());
  EXPECT_FALSE(TokenInspector::inspect("@@.@@.@@").has_value());

  std::string array_payload = util::base64url_encode("[1,2]");
  std::string header = util::base64url_encode(R"({"alg":"RS256"})");
  EXPECT_FALSE(
      TokenInspector::unverified_claims(header + "." + array_payload + ".x")
          .has_value());
}

TEST(TokenInspectorTest, RefreshAtThreeQuartersOfLifetime) {
  EXPECT_EQ(TokenInspector::refresh_at({{"iat", 0}, {"exp", 100}}), 75);
  EXPECT_EQ(TokenInspector::refresh_at({{"iat", 1000}, {"exp", 4600}}), 3700);
  EXPECT_EQ(TokenInspector::refresh_at({{"exp", 100}}), 75);
  EXPECT_EQ(TokenInspector::refresh_at(nlohmann::json::object()), 0);
  EXPECT_EQ(TokenInspector::refresh_at({{"iat", "soon"}, {"exp", 100}}), 75);
}

TEST(NumericClaimTest, IntegersAndFloats) {
  nlohmann::json claims = {{"a", 5}, {"b", 7.9}, {"c", "8"}};
  EXPECT_EQ(numeric_claim(claims, "a"), 5);
  EXPECT_EQ(numeric_claim(claims, "b"), 7);
  EXPECT_FALSE(numeric_claim(claims, "c").has_value());
  EXPECT_FALSE(numeric_claim(claims, "missing").has_value());
}

class SignVerifyTest : public ::testing::TestWithParam<bool> {
 protected:
  const TestKey& key() const {
    return GetParam() ? TestKey::ec("sv-ec") : TestKey::rsa("sv-rsa");
  }
};

TEST_P(SignVerifyTest, RoundTrip) {
  auto signer = JwtSigner::from_pem(key().private_pem());
  EXPECT_EQ(signer.algorithm(), GetParam() ? "ES256" : "RS256");

  std::string token = signer.sign({{"sub", "x"}}, key().kid());
  auto decoded = TokenInspector::inspect(token);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->header["kid"], key().kid());
  EXPECT_EQ(decoded->header["alg"], signer.algorithm());

  auto parts = split_jwt(token);
  JsonWebKey jwk = to_jwk(key().public_jwk());
  EXPECT_TRUE(verify_jws_signature(signer.algorithm(), jwk,
                                   parts.signing_input(),
                                   util::base64url_decode(parts.signature_b64)));

  // Same signature over a different payload
  std::string tampered_input =
      parts.header_b64 + "." + util::base64url_encode(R"({"sub":"y"})");
  EXPECT_FALSE(verify_jws_signature(signer.algorithm(), jwk, tampered_input,
                                    util::base64url_decode(parts.signature_b64)));
}

INSTANTIATE_TEST_SUITE_P(RsaAndEc, SignVerifyTest, ::testing::Bool());

TEST(VerifyJwsSignatureTest, AlgorithmMustFitKey) {
  JsonWebKey rsa = to_jwk(TestKey::rsa("alg-rsa").public_jwk());
  JsonWebKey ec = to_jwk(TestKey::ec("alg-ec").public_jwk());

  auto kind_of = [](const std::string& alg, const JsonWebKey& key) {
    try {
      verify_jws_signature(alg, key, "a.b", "sig");
    } catch (const ValidationError& e) {
      return e.kind();
    }
    return ValidationErrorKind::INACTIVE_TOKEN;
  };

  EXPECT_EQ(kind_of("HS256", rsa), ValidationErrorKind::INVALID_ALGORITHM);
  EXPECT_EQ(kind_of("none", rsa), ValidationErrorKind::INVALID_ALGORITHM);
  EXPECT_EQ(kind_of("ES256", rsa), ValidationErrorKind::INVALID_ALGORITHM);
  EXPECT_EQ(kind_of("RS256", ec), ValidationErrorKind::INVALID_ALGORITHM);
  // Key pinned to RS256 by its "alg" member
  EXPECT_EQ(kind_of("RS384", rsa), ValidationErrorKind::INVALID_ALGORITHM);
  // P-256 key with a P-384 algorithm
  ec.alg.clear();
  EXPECT_EQ(kind_of("ES384", ec), ValidationErrorKind::INVALID_ALGORITHM);
}

TEST(VerifyJwsSignatureTest, WrongLengthEcSignature) {
  JsonWebKey ec = to_jwk(TestKey::ec("short-ec").public_jwk());
  EXPECT_FALSE(verify_jws_signature("ES256", ec, "a.b", std::string(10, 'x')));
}

TEST(JwtSignerTest, EncryptedPem) {
  const TestKey& key = TestKey::rsa("enc");
  std::string pem = key.private_pem("correct horse");

  EXPECT_THROW(JwtSigner::from_pem(pem), ConfigError);
  EXPECT_THROW(JwtSigner::from_pem(pem, "wrong"), ConfigError);
  auto signer = JwtSigner::from_pem(pem, "correct horse");
  EXPECT_EQ(signer.algorithm(), "RS256");
}

TEST(JwtSignerTest, FromFile) {
  TempDir dir;
  std::string path = dir.write("key.pem", TestKey::ec("file-ec").private_pem());
  EXPECT_EQ(JwtSigner::from_pem_file(path).algorithm(), "ES256");
  EXPECT_THROW(JwtSigner::from_pem_file(dir.file("missing.pem")), ConfigError);
  EXPECT_THROW(JwtSigner::from_pem("not a key"), ConfigError);
}

TEST(JwtSignerTest, MovedFromSignerRefusesToSign) {
  auto signer = JwtSigner::from_pem(TestKey::rsa("move").private_pem());
  JwtSigner moved(std::move(signer));
  EXPECT_FALSE(moved.sign({{"a", 1}}).empty());
  EXPECT_THROW(signer.sign({{"a", 1}}), AuthException);
}

}  // namespace
}  // namespace oidc
}  // namespace authkit
