#include <gtest/gtest.h>

#include "authkit/auth/auth_error.h"
#include "authkit/oidc/multi_validator.h"
#include "support/fake_auth_server.h"
#include "support/test_keys.h"

namespace authkit {
namespace oidc {
namespace {

using test::FakeAuthServer;
using test::TestKey;

// Two tenants on one fake server: the root issuer signs with RSA, the
// tenant-b issuer with EC
class MultiValidatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    server_ = std::make_shared<FakeAuthServer>();
    http_ = std::make_shared<HttpClient>(server_);
    issuer_a_ = server_->issuer();
    issuer_b_ = server_->url("/tenant-b");
    jwks_b_ = server_->url("/tenant-b/keys");
    server_->serve_jwks({TestKey::rsa("a-1").public_jwk()});
    server_->serve_json(
        jwks_b_,
        {{"keys", nlohmann::json::array({TestKey::ec("b-1").public_jwk()})}});
  }

  std::shared_ptr<JwksClient> jwks(const std::string& uri) {
    JwksClientConfig config;
    config.jwks_uri = uri;
    return std::make_shared<JwksClient>(http_, config);
  }

  OidcMultiIssuerValidator make_validator() {
    return OidcMultiIssuerValidator(
        {TrustEntry{issuer_a_, "api-a", jwks(server_->jwks_endpoint())},
         TrustEntry{issuer_b_, "api-b", jwks(jwks_b_)}});
  }

  std::string token_a(const std::string& audience = "api-a") {
    return TestKey::rsa("a-1").sign(test::token_claims(issuer_a_, audience));
  }

  std::string token_b(const std::string& audience = "api-b") {
    return TestKey::ec("b-1").sign(test::token_claims(issuer_b_, audience));
  }

  static ValidationErrorKind failure(OidcMultiIssuerValidator& validator,
                                     const std::string& token) {
    try {
      validator.validate_access_token(token);
    } catch (const ValidationError& e) {
      return e.kind();
    }
    ADD_FAILURE() << "token was accepted";
    return ValidationErrorKind::MALFORMED_ARGUMENT;
  }

  std::shared_ptr<FakeAuthServer> server_;
  std::shared_ptr<HttpClient> http_;
  std::string issuer_a_;
  std::string issuer_b_;
  std::string jwks_b_;
};

TEST_F(MultiValidatorTest, RoutesByIssuer) {
  auto validator = make_validator();

  auto claims_a = validator.validate_access_token(token_a());
  EXPECT_EQ(claims_a["iss"], issuer_a_);
  auto claims_b = validator.validate_access_token(token_b());
  EXPECT_EQ(claims_b["iss"], issuer_b_);

  EXPECT_EQ(server_->request_count(server_->jwks_endpoint()), 1u);
  EXPECT_EQ(server_->request_count(jwks_b_), 1u);
}

TEST_F(MultiValidatorTest, UntrustedIssuerFetchesNothing) {
  auto validator = make_validator();
  std::string foreign = TestKey::rsa("a-1").sign(
      test::token_claims("https://evil.example.com", "api-a"));

  EXPECT_EQ(failure(validator, foreign), ValidationErrorKind::UNTRUSTED_ISSUER);
  EXPECT_EQ(server_->request_count(), 0u);
}

TEST_F(MultiValidatorTest, IssuerMatchIsExact) {
  auto validator = make_validator();
  std::string trailing_slash = TestKey::rsa("a-1").sign(
      test::token_claims(issuer_a_ + "/", "api-a"));
  EXPECT_EQ(failure(validator, trailing_slash),
            ValidationErrorKind::UNTRUSTED_ISSUER);
}

TEST_F(MultiValidatorTest, AudienceIsPerIssuer) {
  auto validator = make_validator();
  EXPECT_EQ(failure(validator, token_a("api-b")),
            ValidationErrorKind::WRONG_AUDIENCE);
  EXPECT_EQ(failure(validator, token_b("api-a")),
            ValidationErrorKind::WRONG_AUDIENCE);
}

TEST_F(MultiValidatorTest, KeysDoNotCrossIssuers) {
  auto validator = make_validator();
  // Claims issuer B, signed with issuer A's key
  std::string forged =
      TestKey::rsa("a-1").sign(test::token_claims(issuer_b_, "api-b"));
  EXPECT_EQ(failure(validator, forged),
            ValidationErrorKind::UNKNOWN_SIGNING_KEY);
}

TEST_F(MultiValidatorTest, MalformedTokens) {
  auto validator = make_validator();
  EXPECT_EQ(failure(validator, ""), ValidationErrorKind::MALFORMED_ARGUMENT);
  EXPECT_EQ(failure(validator, "not-a-jwt"),
            ValidationErrorKind::MALFORMED_TOKEN);

  nlohmann::json claims = test::token_claims(issuer_a_, "api-a");
  claims.erase("iss");
  EXPECT_EQ(failure(validator, TestKey::rsa("a-1").sign(claims)),
            ValidationErrorKind::MALFORMED_TOKEN);
}

TEST_F(MultiValidatorTest, RequiredScopes) {
  auto validator = make_validator();
  EXPECT_NO_THROW(
      (validator.validate_access_token(token_a(), {"admin", "profile"})));
  try {
    validator.validate_access_token(token_a(), {"admin"});
    FAIL() << "expected ValidationError";
  } catch (const ValidationError& e) {
    EXPECT_EQ(e.kind(), ValidationErrorKind::MISSING_REQUIRED_SCOPE);
  }
}

TEST_F(MultiValidatorTest, AcceptsNonTextSubject) {
  auto validator = make_validator();
  nlohmann::json claims = test::token_claims(issuer_a_, "api-a");
  claims["sub"] = 12345;

  nlohmann::json accepted;
  ASSERT_NO_THROW(accepted = validator.validate_access_token(
                      TestKey::rsa("a-1").sign(claims)));
  EXPECT_EQ(accepted["sub"], 12345);

  claims.erase("sub");
  EXPECT_NO_THROW(
      validator.validate_access_token(TestKey::rsa("a-1").sign(claims)));
}

TEST_F(MultiValidatorTest, LoggingCanBeTurnedOff) {
  OidcMultiIssuerValidator quiet(
      {TrustEntry{issuer_a_, "api-a", jwks(server_->jwks_endpoint())}},
      false);
  EXPECT_NO_THROW(quiet.validate_access_token(token_a()));
  EXPECT_EQ(failure(quiet, token_b()), ValidationErrorKind::UNTRUSTED_ISSUER);
}

TEST_F(MultiValidatorTest, RejectsBadTrustLists) {
  auto keys = jwks(server_->jwks_endpoint());
  EXPECT_THROW(OidcMultiIssuerValidator(
                   {TrustEntry{issuer_a_, "api-a", keys},
                    TrustEntry{issuer_a_, "api-other", keys}}),
               ConfigError);
  EXPECT_THROW(OidcMultiIssuerValidator({TrustEntry{"", "api-a", keys}}),
               ConfigError);
  EXPECT_THROW(OidcMultiIssuerValidator({TrustEntry{issuer_a_, "", keys}}),
               ConfigError);
  EXPECT_THROW(
      OidcMultiIssuerValidator({TrustEntry{issuer_a_, "api-a", nullptr}}),
      ConfigError);
}

TEST_F(MultiValidatorTest, FromConfigsResolvesKeysLazily) {
  ClientValidatorConfig explicit_keys;
  explicit_keys.server.auth_server = issuer_a_;
  explicit_keys.server.client_id = "rs-a";
  explicit_keys.server.audiences = {"api-a"};
  explicit_keys.server.jwks_endpoint = server_->jwks_endpoint();

  // Issuer differs from the server URL; keys found through discovery
  ClientValidatorConfig discovered;
  discovered.server.auth_server = server_->url("/tenant-b/");
  discovered.server.issuer = issuer_b_;
  discovered.server.client_id = "rs-b";
  discovered.server.audiences = {"api-b"};
  server_->serve_json(server_->url("/tenant-b/.well-known/openid-configuration"),
                      {{"issuer", issuer_b_}, {"jwks_uri", jwks_b_}});

  AuthClientContext context;
  context.http = http_;
  auto validator = OidcMultiIssuerValidator::from_configs(
      {explicit_keys, discovered}, context);
  EXPECT_EQ(validator.trusted_issuers(),
            (std::vector<std::string>{issuer_a_, issuer_b_}));
  EXPECT_EQ(server_->request_count(), 0u);

  EXPECT_NO_THROW(validator.validate_access_token(token_b()));
  EXPECT_EQ(server_->request_count(), 2u);
  EXPECT_NO_THROW(validator.validate_access_token(token_a()));
  EXPECT_EQ(server_->request_count(), 3u);
}

TEST_F(MultiValidatorTest, FromConfigsNeedsOneAudience) {
  ClientValidatorConfig config;
  config.server.auth_server = issuer_a_;
  config.server.client_id = "rs-a";
  config.server.audiences = {"api-a", "api-x"};

  try {
    OidcMultiIssuerValidator::from_configs({config});
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_EQ(e.field(), "audiences");
  }

  config.server.audiences.clear();
  EXPECT_THROW(OidcMultiIssuerValidator::from_configs({config}), ConfigError);
}

TEST_F(MultiValidatorTest, FromConfigsRejectsDuplicateIssuers) {
  ClientValidatorConfig first;
  first.server.auth_server = issuer_a_;
  first.server.client_id = "rs-a";
  first.server.audiences = {"api-a"};
  ClientValidatorConfig second = first;
  second.server.auth_server = server_->url("/other");
  second.server.issuer = issuer_a_;

  EXPECT_THROW(OidcMultiIssuerValidator::from_configs({first, second}),
               ConfigError);
}

}  // namespace
}  // namespace oidc
}  // namespace authkit
