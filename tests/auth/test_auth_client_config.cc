#include <gtest/gtest.h>

#include "authkit/auth/auth_client_config.h"
#include "authkit/auth/auth_error.h"
#include "support/temp_dir.h"

namespace authkit {
namespace {

using test::TempDir;

nlohmann::json oidc_json(const std::string& client_type) {
  return {{"client_type", client_type},
          {"auth_server", "https://login.example.com/oauth2/default"},
          {"client_id", "client-123"},
          {"scopes", {"openid", "offline_access"}},
          {"audiences", {"https://api.example.com/"}}};
}

std::string config_error_field(const nlohmann::json& json) {
  try {
    AuthClientConfig::from_json(json);
  } catch (const ConfigError& e) {
    return e.field();
  }
  return "<no error>";
}

TEST(AuthClientConfigTest, DeviceCodePublicClient) {
  auto config = AuthClientConfig::from_json(oidc_json("oidc_device_code"));
  EXPECT_EQ(config.client_type(), "oidc_device_code");

  const auto& device = get<DeviceCodeClientConfig>(config.value());
  EXPECT_EQ(device.server.auth_server,
            "https://login.example.com/oauth2/default");
  EXPECT_EQ(device.server.client_id, "client-123");
  EXPECT_EQ(device.server.scopes.size(), 2u);
  EXPECT_TRUE(holds_alternative<PublicClientAuth>(device.client_auth));
  ASSERT_NE(config.oidc_server(), nullptr);
}

TEST(AuthClientConfigTest, HyphenatedTypeIsNormalized) {
  auto json = oidc_json("oidc-auth-code");
  json["redirect_uri"] = "http://localhost:8080/callback";
  auto config = AuthClientConfig::from_json(json);
  EXPECT_EQ(config.client_type(), "oidc_auth_code");
  EXPECT_EQ(normalize_client_type("oidc-client-credentials-secret"),
            "oidc_client_credentials_secret");
}

TEST(AuthClientConfigTest, SecretClient) {
  auto json = oidc_json("oidc_client_credentials_secret");
  json["client_secret"] = "s3cret";
  json["client_secret_auth_method"] = "post";
  auto config = AuthClientConfig::from_json(json);

  const auto& cc = get<ClientCredentialsClientConfig>(config.value());
  const auto* secret = get_if<ClientSecretConfig>(&cc.client_auth);
  ASSERT_NE(secret, nullptr);
  EXPECT_EQ(secret->client_secret, "s3cret");
  EXPECT_EQ(secret->auth_method, ClientSecretAuthMethod::POST);
}

TEST(AuthClientConfigTest, PubkeyClient) {
  auto json = oidc_json("oidc_resource_owner_pubkey");
  json["client_privkey_file"] = "/keys/client.pem";
  json["client_privkey_password"] = "pw";
  auto config = AuthClientConfig::from_json(json);

  const auto& ro = get<ResourceOwnerClientConfig>(config.value());
  const auto* pubkey = get_if<ClientPubkeyConfig>(&ro.client_auth);
  ASSERT_NE(pubkey, nullptr);
  EXPECT_EQ(pubkey->client_privkey_file, "/keys/client.pem");
  EXPECT_FALSE(pubkey->client_privkey.has_value());
}

TEST(AuthClientConfigTest, ScopesMayBeSpaceSeparated) {
  auto json = oidc_json("oidc_device_code");
  json["scopes"] = "openid  profile";
  auto config = AuthClientConfig::from_json(json);
  std::vector<std::string> expected = {"openid", "profile"};
  EXPECT_EQ(config.oidc_server()->scopes, expected);
}

TEST(AuthClientConfigTest, NonOidcKinds) {
  auto legacy = AuthClientConfig::from_json({{"client_type", "planet_legacy"}});
  EXPECT_EQ(get<PlanetLegacyClientConfig>(legacy.value()).legacy_auth_endpoint,
            kDefaultLegacyAuthEndpoint);
  EXPECT_EQ(legacy.oidc_server(), nullptr);

  auto key = AuthClientConfig::from_json(
      {{"client_type", "static_apikey"}, {"api_key", "PLAK"}});
  EXPECT_EQ(get<StaticApiKeyClientConfig>(key.value()).bearer_token_prefix,
            "Bearer");

  auto none = AuthClientConfig::from_json({{"client_type", "none"}});
  EXPECT_EQ(none.client_type(), "none");
}

TEST(AuthClientConfigTest, RejectsMoreThanOneAudience) {
  auto json = oidc_json("oidc_device_code");
  json["audiences"] = {"https://a.example.com/", "https://b.example.com/"};
  EXPECT_EQ(config_error_field(json), "audiences");
}

TEST(AuthClientConfigTest, MissingFields) {
  auto json = oidc_json("oidc_device_code");
  json.erase("auth_server");
  EXPECT_EQ(config_error_field(json), "auth_server");

  json = oidc_json("oidc_device_code");
  json.erase("client_id");
  EXPECT_EQ(config_error_field(json), "client_id");

  EXPECT_EQ(config_error_field(oidc_json("oidc_client_credentials_secret")),
            "client_secret");
  EXPECT_EQ(config_error_field(oidc_json("oidc_device_code_pubkey")),
            "client_privkey");
  EXPECT_EQ(config_error_field(oidc_json("oidc_auth_code")), "redirect_uri");
  EXPECT_EQ(config_error_field({{"client_type", "static_apikey"}}), "api_key");
  EXPECT_EQ(config_error_field({{"auth_server", "x"}}), "client_type");
}

TEST(AuthClientConfigTest, RejectsUnknownAndPublicClientCredentials) {
  EXPECT_EQ(config_error_field(oidc_json("oidc_magic_link")), "client_type");
  EXPECT_EQ(config_error_field(oidc_json("oidc_client_credentials")),
            "client_type");
}

TEST(AuthClientConfigTest, RejectsMistypedFields) {
  auto json = oidc_json("oidc_device_code");
  json["client_id"] = 42;
  EXPECT_EQ(config_error_field(json), "client_id");

  json = oidc_json("oidc_device_code");
  json["scopes"] = {1, 2};
  EXPECT_EQ(config_error_field(json), "scopes");

  json = oidc_json("oidc_device_code_secret");
  json["client_secret"] = "x";
  json["client_secret_auth_method"] = "jwt";
  EXPECT_EQ(config_error_field(json), "client_secret_auth_method");

  EXPECT_THROW(AuthClientConfig::from_json(nlohmann::json::array()),
               ConfigError);
}

TEST(AuthClientConfigTest, DirectConstructionIsValidated) {
  ClientCredentialsClientConfig public_cc;
  public_cc.server.auth_server = "https://login.example.com";
  public_cc.server.client_id = "id";
  EXPECT_THROW(AuthClientConfig{public_cc}, ConfigError);
}

TEST(AuthClientConfigTest, JsonRoundTrip) {
  auto json = oidc_json("oidc_auth_code_secret");
  json["client_secret"] = "s";
  json["redirect_uri"] = "https://app.example.com/cb";
  json["organization"] = "org-1";
  auto config = AuthClientConfig::from_json(json);

  nlohmann::json written = config.to_json();
  EXPECT_EQ(written["client_type"], "oidc_auth_code_secret");
  EXPECT_EQ(written["client_secret_auth_method"], "basic");
  EXPECT_FALSE(written.contains("local_redirect_uri"));

  auto reparsed = AuthClientConfig::from_json(written);
  EXPECT_EQ(reparsed.to_json(), written);
}

TEST(AuthClientConfigTest, ReadsJsonFile) {
  TempDir dir;
  std::string path = dir.write("client.json", oidc_json("oidc_device_code").dump());
  EXPECT_EQ(AuthClientConfig::from_file(path).client_type(), "oidc_device_code");
}

TEST(AuthClientConfigTest, ReadsYamlFile) {
  TempDir dir;
  std::string path = dir.write("client.yaml",
                               "client_type: oidc-client-validator\n"
                               "auth_server: https://login.example.com\n"
                               "client_id: 12345\n"
                               "audiences:\n"
                               "  - https://api.example.com/\n");
  auto config = AuthClientConfig::from_file(path);
  EXPECT_EQ(config.client_type(), "oidc_client_validator");
  EXPECT_EQ(config.oidc_server()->client_id, "12345");
  ASSERT_EQ(config.oidc_server()->audiences.size(), 1u);
}

TEST(AuthClientConfigTest, UnreadableOrInvalidFiles) {
  TempDir dir;
  EXPECT_THROW(AuthClientConfig::from_file(dir.file("missing.json")),
               ConfigError);
  EXPECT_THROW(AuthClientConfig::from_file(dir.write("bad.json", "{nope")),
               ConfigError);
  EXPECT_THROW(AuthClientConfig::from_file(dir.write("bad.yaml", "a: [1, 2")),
               ConfigError);
}

}  // namespace
}  // namespace authkit
