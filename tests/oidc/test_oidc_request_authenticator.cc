#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sys/time.h>

#include "authkit/auth/auth_error.h"
#include "authkit/oidc/oidc_flows.h"
#include "authkit/oidc/oidc_request_authenticator.h"
#include "mocks/mock_user_interaction.h"
#include "support/fake_auth_server.h"
#include "support/temp_dir.h"
#include "support/test_keys.h"

namespace authkit {
namespace oidc {
namespace {

using test::FakeAuthServer;
using test::MockUserInteraction;
using test::TempDir;
using test::TestKey;
using ::testing::NiceMock;

void touch_in_future(const std::string& path, int seconds_ahead) {
  struct timeval times[2];
  gettimeofday(&times[0], nullptr);
  times[0].tv_sec += seconds_ahead;
  times[1] = times[0];
  ASSERT_EQ(utimes(path.c_str(), times), 0);
}

class OidcRequestAuthenticatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    server_ = std::make_shared<FakeAuthServer>();
    interaction_ = std::make_shared<NiceMock<MockUserInteraction>>();

    ClientCredentialsClientConfig config;
    config.server.auth_server = server_->issuer();
    config.server.client_id = "svc-1";
    config.server.token_endpoint = server_->token_endpoint();
    config.server.scopes = {"api"};
    config.client_auth = ClientSecretConfig{"s3cret"};
    client_ = std::make_shared<ClientCredentialsAuthClient>(config, context());
  }

  AuthClientContext context() {
    AuthClientContext ctx;
    ctx.http = std::make_shared<HttpClient>(server_);
    ctx.interaction = interaction_;
    return ctx;
  }

  // Signed access token issued age seconds ago
  std::string access_token(int64_t age, int64_t lifetime = 3600) {
    nlohmann::json claims = test::token_claims(server_->issuer(), "api",
                                               lifetime);
    claims["iat"] = claims["iat"].get<int64_t>() - age;
    claims["exp"] = claims["exp"].get<int64_t>() - age;
    claims["jti"] = util::random_urlsafe_string(8);
    return TestKey::rsa("rsa-1").sign(claims);
  }

  std::string expired_token() { return access_token(4000); }
  std::string fresh_token() { return access_token(0); }

  std::shared_ptr<OidcCredential> credential(
      const std::string& token,
      const optional<std::string>& refresh_token = nullopt,
      const optional<std::string>& path = nullopt) {
    nlohmann::json data = {{"access_token", token}, {"token_type", "Bearer"}};
    if (refresh_token) {
      data["refresh_token"] = *refresh_token;
    }
    auto cred = std::make_shared<OidcCredential>(data, path);
    if (path) {
      cred->save();
    }
    return cred;
  }

  void serve_token(const std::string& token, bool with_refresh_token) {
    nlohmann::json response = {{"access_token", token},
                               {"token_type", "Bearer"},
                               {"expires_in", 3600}};
    if (with_refresh_token) {
      response["refresh_token"] = "rt-new";
    }
    server_->serve_json(server_->token_endpoint(), response);
  }

  std::shared_ptr<FakeAuthServer> server_;
  std::shared_ptr<NiceMock<MockUserInteraction>> interaction_;
  std::shared_ptr<ClientCredentialsAuthClient> client_;
  TempDir dir_;
};

TEST_F(OidcRequestAuthenticatorTest, DowncastsCredentials) {
  EXPECT_FALSE(as_oidc_credential(nullptr));
  auto api_key = std::make_shared<StaticApiKeyCredential>(std::string("k"),
                                                          "Bearer");
  EXPECT_THROW(as_oidc_credential(api_key), ConfigError);
}

TEST_F(OidcRequestAuthenticatorTest, FreshTokenNeedsNoNetwork) {
  const std::string token = fresh_token();
  RefreshOrReloginOidcTokenRequestAuthenticator authenticator(
      credential(token), client_);

  HttpRequest request;
  authenticator.authenticate(request);
  EXPECT_EQ(request.headers["Authorization"], "Bearer " + token);
  EXPECT_GT(authenticator.refresh_at(), util::epoch_seconds());
  EXPECT_EQ(server_->request_count(), 0u);
}

TEST_F(OidcRequestAuthenticatorTest, LogsInAgainWithoutRefreshToken) {
  const std::string renewed = fresh_token();
  serve_token(renewed, false);
  const std::string path = dir_.file("token.json");
  RefreshOrReloginOidcTokenRequestAuthenticator authenticator(
      credential(expired_token(), nullopt, path), client_);

  EXPECT_NO_THROW(authenticator.pre_request_hook());
  EXPECT_EQ(authenticator.token_body(), renewed);

  auto form = FakeAuthServer::form(server_->requests().back());
  EXPECT_EQ(form["grant_type"], "client_credentials");
  EXPECT_EQ(form["scope"], "api");

  OidcCredential on_disk(nullopt, path);
  on_disk.load();
  EXPECT_EQ(on_disk.access_token(), renewed);
}

TEST_F(OidcRequestAuthenticatorTest, PrefersRefreshToken) {
  const std::string renewed = fresh_token();
  serve_token(renewed, false);
  const std::string path = dir_.file("token.json");
  RefreshOrReloginOidcTokenRequestAuthenticator authenticator(
      credential(expired_token(), std::string("rt-old"), path), client_);

  authenticator.pre_request_hook();
  EXPECT_EQ(authenticator.token_body(), renewed);
  auto form = FakeAuthServer::form(server_->requests().back());
  EXPECT_EQ(form["grant_type"], "refresh_token");
  EXPECT_EQ(form["refresh_token"], "rt-old");

  // Server did not rotate the refresh token, so the old one is kept
  EXPECT_EQ(authenticator.oidc_credential()->refresh_token(), "rt-old");
  EXPECT_EQ(authenticator.oidc_credential()->path(), path);
}

TEST_F(OidcRequestAuthenticatorTest, RotatedRefreshTokenIsSaved) {
  serve_token(fresh_token(), true);
  const std::string path = dir_.file("token.json");
  RefreshOrReloginOidcTokenRequestAuthenticator authenticator(
      credential(expired_token(), std::string("rt-old"), path), client_);

  authenticator.pre_request_hook();
  OidcCredential on_disk(nullopt, path);
  on_disk.load();
  EXPECT_EQ(on_disk.refresh_token(), "rt-new");
}

TEST_F(OidcRequestAuthenticatorTest, PicksUpTokenRenewedElsewhere) {
  serve_token(fresh_token(), true);
  const std::string path = dir_.file("token.json");
  auto stale = credential(expired_token(), std::string("rt-old"), path);

  // Another process sharing the file renewed the token meanwhile
  const std::string renewed = fresh_token();
  credential(renewed, std::string("rt-other"), path);
  touch_in_future(path, 5);

  RefreshOrReloginOidcTokenRequestAuthenticator authenticator(stale, client_);
  authenticator.pre_request_hook();
  EXPECT_EQ(authenticator.token_body(), renewed);
  EXPECT_EQ(server_->request_count(), 0u);
}

TEST_F(OidcRequestAuthenticatorTest, RefreshOnlyKeepsOldTokenWithoutRefreshToken) {
  const std::string old_token = expired_token();
  RefreshingOidcTokenRequestAuthenticator authenticator(credential(old_token),
                                                        client_);

  EXPECT_NO_THROW(authenticator.pre_request_hook());
  EXPECT_EQ(authenticator.token_body(), old_token);
  EXPECT_EQ(server_->request_count(), 0u);
}

TEST_F(OidcRequestAuthenticatorTest, FailedRefreshKeepsOldToken) {
  server_->serve_json(server_->token_endpoint(),
                      {{"error", "invalid_grant"}}, 400);
  const std::string old_token = expired_token();
  RefreshOrReloginOidcTokenRequestAuthenticator authenticator(
      credential(old_token, std::string("rt-revoked")), client_);

  HttpRequest request;
  EXPECT_NO_THROW(authenticator.authenticate(request));
  EXPECT_EQ(request.headers["Authorization"], "Bearer " + old_token);
  EXPECT_EQ(server_->request_count(), 1u);
}

TEST_F(OidcRequestAuthenticatorTest, WithoutAuthClientOnlyReloads) {
  const std::string old_token = expired_token();
  RefreshingOidcTokenRequestAuthenticator authenticator(credential(old_token));

  authenticator.pre_request_hook();
  EXPECT_EQ(authenticator.token_body(), old_token);
  EXPECT_EQ(server_->request_count(), 0u);
}

TEST_F(OidcRequestAuthenticatorTest, UpdateCredentialForcesReload) {
  RefreshOrReloginOidcTokenRequestAuthenticator authenticator(
      credential(fresh_token()), client_);
  authenticator.pre_request_hook();
  ASSERT_GT(authenticator.refresh_at(), 0);

  const std::string replacement = fresh_token();
  authenticator.update_credential(credential(replacement));
  EXPECT_EQ(authenticator.refresh_at(), 0);
  authenticator.pre_request_hook();
  EXPECT_EQ(authenticator.token_body(), replacement);

  EXPECT_THROW(authenticator.update_credential(
                   std::make_shared<LegacyApiKeyCredential>(
                       nlohmann::json{{"api_key", "k"}})),
               ConfigError);
}

TEST_F(OidcRequestAuthenticatorTest, ClientsPickTheirAuthenticator) {
  auto cred = credential(fresh_token());
  EXPECT_TRUE(std::dynamic_pointer_cast<
              RefreshOrReloginOidcTokenRequestAuthenticator>(
      client_->default_request_authenticator(cred)));

  ResourceOwnerClientConfig owner_config;
  owner_config.server.auth_server = server_->issuer();
  owner_config.server.client_id = "cli-1";
  auto owner = std::make_shared<ResourceOwnerAuthClient>(owner_config,
                                                         context());
  auto owner_auth = owner->default_request_authenticator(cred);
  EXPECT_TRUE(
      std::dynamic_pointer_cast<RefreshingOidcTokenRequestAuthenticator>(
          owner_auth));
  EXPECT_FALSE(
      std::dynamic_pointer_cast<RefreshOrReloginOidcTokenRequestAuthenticator>(
          owner_auth));

  ClientValidatorConfig validator_config;
  validator_config.server.auth_server = server_->issuer();
  validator_config.server.client_id = "rs-1";
  auto validator = std::make_shared<OidcClientValidatorAuthClient>(
      validator_config, context());
  EXPECT_THROW(validator->default_request_authenticator(cred)
                   ->pre_request_hook(),
               FlowError);
}

}  // namespace
}  // namespace oidc
}  // namespace authkit
