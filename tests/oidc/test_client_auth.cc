#include <gtest/gtest.h>

#include "authkit/auth/auth_error.h"
#include "authkit/oidc/client_auth.h"
#include "authkit/oidc/jwt.h"
#include "support/temp_dir.h"
#include "support/test_keys.h"

namespace authkit {
namespace oidc {
namespace {

using test::TempDir;
using test::TestKey;

const char kTokenEndpoint[] = "https://auth.example.com/v1/token";

JsonWebKey public_key(const TestKey& key) {
  nlohmann::json document = {
      {"keys", nlohmann::json::array({key.public_jwk()})}};
  return JwksClient::parse_jwks(document.dump())->keys.front();
}

bool signed_by(const std::string& token, const TestKey& key) {
  JwtParts parts = split_jwt(token);
  auto decoded = TokenInspector::inspect(token);
  return decoded &&
         verify_jws_signature(decoded->header.value("alg", ""),
                              public_key(key), parts.signing_input(),
                              util::base64url_decode(parts.signature_b64));
}

TEST(ClientAuthTest, NoClientAuthOnlyIdentifies) {
  NoClientAuth auth("cli-1");
  util::FormData fields;
  HttpHeaders headers;
  auth.enrich(fields, headers, kTokenEndpoint);

  EXPECT_EQ(fields, (util::FormData{{"client_id", "cli-1"}}));
  EXPECT_TRUE(headers.empty());
  EXPECT_EQ(auth.client_id(), "cli-1");
}

TEST(ClientAuthTest, SecretBasicUsesAuthorizationHeader) {
  ClientSecretBasicAuth auth("cli 1", "p:ss");
  util::FormData fields{{"grant_type", "client_credentials"}};
  HttpHeaders headers;
  auth.enrich(fields, headers, kTokenEndpoint);

  EXPECT_EQ(headers["Authorization"],
            "Basic " + util::base64_encode("cli%201:p%3Ass"));
  EXPECT_EQ(fields.count("client_id"), 0u);
  EXPECT_EQ(fields.count("client_secret"), 0u);
}

TEST(ClientAuthTest, SecretPostUsesFormFields) {
  ClientSecretPostAuth auth("cli-1", "s3cret");
  util::FormData fields;
  HttpHeaders headers;
  auth.enrich(fields, headers, kTokenEndpoint);

  EXPECT_EQ(fields["client_id"], "cli-1");
  EXPECT_EQ(fields["client_secret"], "s3cret");
  EXPECT_TRUE(headers.empty());
}

TEST(ClientAuthTest, PrivateKeyJwtNeedsKey) {
  EXPECT_THROW(std::make_shared<PrivateKeyJwtAuth>("cli-1", nullopt, nullopt,
                                                   nullopt),
               ConfigError);
}

TEST(ClientAuthTest, PrivateKeyJwtAssertion) {
  const TestKey& key = TestKey::rsa("client-key");
  PrivateKeyJwtAuth auth("cli-1", key.private_pem(), nullopt, nullopt);

  util::FormData fields;
  HttpHeaders headers;
  auth.enrich(fields, headers, kTokenEndpoint);
  EXPECT_EQ(fields["client_id"], "cli-1");
  EXPECT_EQ(fields["client_assertion_type"],
            PrivateKeyJwtAuth::kAssertionType);
  ASSERT_TRUE(signed_by(fields["client_assertion"], key));

  auto claims = TokenInspector::unverified_claims(fields["client_assertion"]);
  ASSERT_TRUE(claims.has_value());
  EXPECT_EQ((*claims)["iss"], "cli-1");
  EXPECT_EQ((*claims)["sub"], "cli-1");
  EXPECT_EQ((*claims)["aud"], kTokenEndpoint);
  EXPECT_EQ((*claims)["exp"].get<int64_t>() - (*claims)["iat"].get<int64_t>(),
            PrivateKeyJwtAuth::kAssertionLifetime);
  EXPECT_FALSE((*claims)["jti"].get<std::string>().empty());
}

TEST(ClientAuthTest, AssertionsAreNotReplayable) {
  PrivateKeyJwtAuth auth("cli-1", TestKey::ec("client-ec").private_pem(),
                         nullopt, nullopt);
  auto first = TokenInspector::unverified_claims(auth.make_assertion("aud"));
  auto second = TokenInspector::unverified_claims(auth.make_assertion("aud"));
  ASSERT_TRUE(first && second);
  EXPECT_NE((*first)["jti"], (*second)["jti"]);
}

TEST(ClientAuthTest, EncryptedKeyFile) {
  TempDir dir;
  const TestKey& key = TestKey::ec("client-ec");
  std::string path = dir.write("client.pem", key.private_pem("hunter2"));

  PrivateKeyJwtAuth auth("cli-1", nullopt, path, std::string("hunter2"));
  EXPECT_TRUE(signed_by(auth.make_assertion(kTokenEndpoint), key));
}

TEST(ClientAuthTest, KeyProblemsSurfaceOnFirstUse) {
  TempDir dir;
  std::string path =
      dir.write("client.pem", TestKey::rsa("client-key").private_pem("right"));

  // Construction only records where the key lives
  PrivateKeyJwtAuth wrong_password("cli-1", nullopt, path,
                                   std::string("wrong"));
  EXPECT_THROW(wrong_password.make_assertion(kTokenEndpoint), ConfigError);

  PrivateKeyJwtAuth missing_file("cli-1", nullopt, dir.file("absent.pem"),
                                 nullopt);
  EXPECT_THROW(missing_file.make_assertion(kTokenEndpoint), AuthException);
}

}  // namespace
}  // namespace oidc
}  // namespace authkit
