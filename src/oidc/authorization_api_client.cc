#include "authkit/oidc/authorization_api_client.h"

#include "authkit/auth/auth_error.h"
#include "authkit/oidc/callback_listener.h"
#include "authkit/oidc/token_api_client.h"

#define AUTHKIT_LOG_COMPONENT "authkit.flow.authcode"
#include "authkit/logging/log_macros.h"

namespace authkit {
namespace oidc {

namespace {

std::string trim(const std::string& value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

}  // namespace

PkceChallenge PkceChallenge::generate() {
  PkceChallenge pkce;
  // 32 random bytes encode to 43 characters, the RFC 7636 minimum
  pkce.code_verifier = util::random_urlsafe_string(32);
  pkce.code_challenge = util::base64url_encode(util::sha256(pkce.code_verifier));
  pkce.code_challenge_method = "S256";
  return pkce;
}

AuthorizationApiClient::AuthorizationApiClient(std::string endpoint_uri,
                                               std::string client_id)
    : endpoint_uri_(std::move(endpoint_uri)), client_id_(std::move(client_id)) {}

AuthorizationRequest AuthorizationApiClient::build_request(
    const std::string& redirect_uri,
    const std::vector<std::string>& requested_scopes,
    const std::vector<std::string>& requested_audiences,
    const util::FormData& extra) const {
  AuthorizationRequest request;
  request.redirect_uri = redirect_uri;
  request.state = util::random_urlsafe_string(16);
  request.nonce = util::random_urlsafe_string(16);
  request.pkce = PkceChallenge::generate();

  util::FormData params{{"response_type", "code"},
                        {"client_id", client_id_},
                        {"redirect_uri", redirect_uri},
                        {"state", request.state},
                        {"nonce", request.nonce},
                        {"code_challenge", request.pkce.code_challenge},
                        {"code_challenge_method",
                         request.pkce.code_challenge_method}};
  add_scopes_and_audiences(params, requested_scopes, requested_audiences);
  merge_extra(params, extra);

  const char separator =
      endpoint_uri_.find('?') == std::string::npos ? '?' : '&';
  request.url = endpoint_uri_ + separator + util::form_encode(params);
  return request;
}

AuthorizationResult AuthorizationApiClient::authcode_with_browser(
    const std::string& local_redirect_uri,
    const std::vector<std::string>& requested_scopes,
    const std::vector<std::string>& requested_audiences,
    const util::FormData& extra,
    UserInteraction& interaction,
    const std::string& acknowledgement_html,
    std::chrono::seconds timeout) const {
  CallbackListener::Config listener_config;
  listener_config.redirect_uri = local_redirect_uri;
  listener_config.timeout = timeout;
  listener_config.acknowledgement_html = acknowledgement_html;
  CallbackListener listener(listener_config);
  listener.start();

  AuthorizationRequest request = build_request(
      listener.redirect_uri(), requested_scopes, requested_audiences, extra);
  if (!interaction.open_browser(request.url)) {
    interaction.notify("Open the following URL in a browser to log in:\n\n    " +
                       request.url + "\n");
  }

  AuthorizationResult result;
  result.code = listener.wait_for_code(request.state);
  result.redirect_uri = request.redirect_uri;
  result.code_verifier = request.pkce.code_verifier;
  result.nonce = request.nonce;
  AUTHKIT_LOG(Debug, "Authorization code received on {}", result.redirect_uri);
  return result;
}

AuthorizationResult AuthorizationApiClient::authcode_with_prompt(
    const std::string& redirect_uri,
    const std::vector<std::string>& requested_scopes,
    const std::vector<std::string>& requested_audiences,
    const util::FormData& extra,
    UserInteraction& interaction) const {
  AuthorizationRequest request = build_request(
      redirect_uri, requested_scopes, requested_audiences, extra);
  interaction.notify("Open the following URL in a browser to log in:\n\n    " +
                     request.url + "\n");
  const std::string answer = trim(interaction.prompt(
      "Paste the URL you were redirected to, or the authorization code"));
  if (answer.empty()) {
    throw FlowError("Login cancelled: no authorization code entered");
  }

  AuthorizationResult result;
  auto question = answer.find('?');
  if (question == std::string::npos && answer.find('=') == std::string::npos) {
    result.code = answer;
  } else {
    auto params = util::parse_query_string(
        question == std::string::npos ? answer : answer.substr(question + 1));
    auto error = params.find("error");
    if (error != params.end()) {
      auto description = params.find("error_description");
      throw ProtocolError(error->second, description == params.end()
                                             ? ""
                                             : description->second);
    }
    auto state = params.find("state");
    if (state == params.end() || state->second != request.state) {
      throw FlowError("Authorization response state does not match the request");
    }
    auto code = params.find("code");
    if (code == params.end() || code->second.empty()) {
      throw FlowError("Authorization response carries no code");
    }
    result.code = code->second;
  }
  result.redirect_uri = request.redirect_uri;
  result.code_verifier = request.pkce.code_verifier;
  result.nonce = request.nonce;
  return result;
}

}  // namespace oidc
}  // namespace authkit
