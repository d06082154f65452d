#include <gtest/gtest.h>

#include "authkit/auth/auth_error.h"
#include "authkit/auth/credential.h"
#include "support/temp_dir.h"
#include "support/test_keys.h"

namespace authkit {
namespace {

using test::TempDir;
using test::TestKey;

TEST(CredentialTest, AnyObjectIsValid) {
  Credential credential(nlohmann::json::object());
  EXPECT_TRUE(credential.data().has_value());
  EXPECT_THROW(credential.set_data(nullopt), DataIntegrityError);
}

TEST(CredentialTest, NoDataUntilSet) {
  Credential credential;
  EXPECT_FALSE(credential.data().has_value());
}

TEST(OidcCredentialTest, RequiresAccessToken) {
  EXPECT_THROW(std::make_shared<OidcCredential>(nlohmann::json::object()),
               DataIntegrityError);
  EXPECT_THROW(std::make_shared<OidcCredential>(
                   nlohmann::json{{"refresh_token", "r"}}),
               DataIntegrityError);
  EXPECT_THROW(
      std::make_shared<OidcCredential>(nlohmann::json{{"access_token", ""}}),
      DataIntegrityError);
}

TEST(OidcCredentialTest, Accessors) {
  OidcCredential credential(nlohmann::json{{"access_token", "at"},
                                           {"refresh_token", "rt"},
                                           {"id_token", "it"},
                                           {"token_type", "Bearer"},
                                           {"scope", "openid offline_access"},
                                           {"expires_in", 3600}});
  EXPECT_EQ(credential.access_token(), "at");
  EXPECT_EQ(credential.refresh_token(), "rt");
  EXPECT_EQ(credential.id_token(), "it");
  EXPECT_EQ(credential.token_type(), "Bearer");
  EXPECT_EQ(credential.scope(), "openid offline_access");
}

TEST(OidcCredentialTest, MissingOptionalMembers) {
  OidcCredential credential(nlohmann::json{{"access_token", "at"}});
  EXPECT_FALSE(credential.refresh_token().has_value());
  EXPECT_FALSE(credential.id_token().has_value());
}

TEST(OidcCredentialTest, ExpiryTimeFromAccessToken) {
  std::string token = TestKey::rsa("cred-key").sign(
      {{"iss", "https://issuer.example.com"}, {"iat", 1000}, {"exp", 4600}});
  OidcCredential credential(nlohmann::json{{"access_token", token}});
  EXPECT_EQ(credential.expiry_time(), 4600);
}

TEST(OidcCredentialTest, ExpiryTimeOfOpaqueToken) {
  OidcCredential credential(nlohmann::json{{"access_token", "opaque"}});
  EXPECT_FALSE(credential.expiry_time().has_value());
}

TEST(OidcCredentialTest, LoadsFromFile) {
  TempDir dir;
  std::string path = dir.write("token.json", R"({"access_token": "at"})");
  OidcCredential credential(nullopt, path);
  credential.load();
  EXPECT_EQ(credential.access_token(), "at");

  std::string bad = dir.write("bad.json", R"({"refresh_token": "rt"})");
  OidcCredential invalid(nullopt, bad);
  EXPECT_THROW(invalid.load(), DataIntegrityError);
}

TEST(StaticApiKeyCredentialTest, BuildsFromKey) {
  StaticApiKeyCredential credential(std::string("PLAK123"), "api-key");
  EXPECT_EQ(credential.api_key(), "PLAK123");
  EXPECT_EQ(credential.bearer_token_prefix(), "api-key");
}

TEST(StaticApiKeyCredentialTest, RequiresBothMembers) {
  EXPECT_THROW(std::make_shared<StaticApiKeyCredential>(
                   nlohmann::json{{"api_key", "k"}}),
               DataIntegrityError);
  EXPECT_THROW(std::make_shared<StaticApiKeyCredential>(
                   nlohmann::json{{"bearer_token_prefix", "Bearer"}}),
               DataIntegrityError);
}

TEST(LegacyApiKeyCredentialTest, RequiresApiKey) {
  EXPECT_THROW(std::make_shared<LegacyApiKeyCredential>(
                   nlohmann::json{{"token", "jwt"}}),
               DataIntegrityError);
  LegacyApiKeyCredential credential(
      nlohmann::json{{"api_key", "PLAK"}, {"token", "jwt"}});
  EXPECT_EQ(credential.api_key(), "PLAK");
  EXPECT_EQ(credential.legacy_jwt(), "jwt");
}

TEST(DataIntegrityErrorTest, NamesTheFile) {
  TempDir dir;
  std::string path = dir.write("bad.json", "[]");
  Credential credential(nullopt, path);
  try {
    credential.load();
    FAIL() << "expected DataIntegrityError";
  } catch (const DataIntegrityError& e) {
    EXPECT_EQ(e.file_path(), path);
  }
}

}  // namespace
}  // namespace authkit
