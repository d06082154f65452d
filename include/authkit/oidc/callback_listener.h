#ifndef AUTHKIT_OIDC_CALLBACK_LISTENER_H
#define AUTHKIT_OIDC_CALLBACK_LISTENER_H

#include <chrono>
#include <string>

/**
 * @file callback_listener.h
 * @brief Single-shot loopback HTTP listener for authorization redirects
 */

namespace authkit {
namespace oidc {

struct RedirectUri {
  std::string scheme;
  std::string host;
  int port;
  std::string path;
};

/**
 * @brief Split an http:// redirect URI into host, port and path
 * @throws ConfigError for other schemes or unparsable URIs
 */
RedirectUri parse_redirect_uri(const std::string& uri);

/**
 * @brief Waits for the browser to come back with an authorization code
 *
 * Binds to the loopback interface only. Port 0 in the redirect URI picks
 * a free port; port() reports the one actually bound and redirect_uri()
 * the URI to hand to the authorization server.
 */
class CallbackListener {
 public:
  struct Config {
    std::string redirect_uri;
    std::chrono::seconds timeout;
    std::string acknowledgement_html;  // Empty selects a built-in page

    Config() : timeout(300) {}
  };

  explicit CallbackListener(const Config& config);
  ~CallbackListener();

  CallbackListener(const CallbackListener&) = delete;
  CallbackListener& operator=(const CallbackListener&) = delete;

  // Bind and listen. @throws FlowError when the socket cannot be set up
  void start();

  int port() const { return port_; }
  std::string redirect_uri() const;

  /**
   * @brief Serve requests until the redirect arrives and return its code
   *
   * Requests for other paths get a 404 and are otherwise ignored.
   * @throws ProtocolError when the redirect carries an error
   * @throws FlowError on state mismatch, missing code or timeout
   */
  std::string wait_for_code(const std::string& expected_state);

 private:
  void send_response(int client_fd, int status, const std::string& body);

  Config config_;
  RedirectUri uri_;
  int listen_fd_;
  int port_;
};

}  // namespace oidc
}  // namespace authkit

#endif  // AUTHKIT_OIDC_CALLBACK_LISTENER_H
