#ifndef AUTHKIT_OIDC_AUTHORIZATION_API_CLIENT_H
#define AUTHKIT_OIDC_AUTHORIZATION_API_CLIENT_H

#include <chrono>
#include <string>
#include <vector>

#include "authkit/auth/auth_util.h"
#include "authkit/auth/user_interaction.h"

/**
 * @file authorization_api_client.h
 * @brief Authorization endpoint driven through the user's browser
 *
 * Unlike the other endpoint clients this one never talks to the server
 * itself: the user agent does, and the result comes back either through
 * the loopback callback listener or pasted in by the user.
 */

namespace authkit {
namespace oidc {

// RFC 7636 verifier and S256 challenge
struct PkceChallenge {
  std::string code_verifier;
  std::string code_challenge;
  std::string code_challenge_method;

  static PkceChallenge generate();
};

struct AuthorizationRequest {
  std::string url;
  std::string redirect_uri;
  std::string state;
  std::string nonce;
  PkceChallenge pkce;
};

struct AuthorizationResult {
  std::string code;
  std::string redirect_uri;  // Must be repeated at the token endpoint
  std::string code_verifier;
  std::string nonce;
};

class AuthorizationApiClient {
 public:
  AuthorizationApiClient(std::string endpoint_uri, std::string client_id);

  const std::string& endpoint_uri() const { return endpoint_uri_; }

  // Fresh state, nonce and PKCE pair for every call
  AuthorizationRequest build_request(
      const std::string& redirect_uri,
      const std::vector<std::string>& requested_scopes,
      const std::vector<std::string>& requested_audiences,
      const util::FormData& extra = {}) const;

  /**
   * @brief Open the browser and catch the redirect on a loopback listener
   * @param local_redirect_uri http://localhost:<port>/<path>; port 0 picks
   *        a free port
   */
  AuthorizationResult authcode_with_browser(
      const std::string& local_redirect_uri,
      const std::vector<std::string>& requested_scopes,
      const std::vector<std::string>& requested_audiences,
      const util::FormData& extra,
      UserInteraction& interaction,
      const std::string& acknowledgement_html = "",
      std::chrono::seconds timeout = std::chrono::seconds(300)) const;

  /**
   * @brief Print the URL and ask the user to paste back the redirect
   *
   * The answer may be the full redirected URL or the bare code; when it is
   * a URL its state is checked.
   */
  AuthorizationResult authcode_with_prompt(
      const std::string& redirect_uri,
      const std::vector<std::string>& requested_scopes,
      const std::vector<std::string>& requested_audiences,
      const util::FormData& extra,
      UserInteraction& interaction) const;

 private:
  std::string endpoint_uri_;
  std::string client_id_;
};

}  // namespace oidc
}  // namespace authkit

#endif  // AUTHKIT_OIDC_AUTHORIZATION_API_CLIENT_H
