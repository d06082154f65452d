#include "authkit/oidc/callback_listener.h"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "authkit/auth/auth_error.h"
#include "authkit/auth/auth_util.h"

#define AUTHKIT_LOG_COMPONENT "authkit.flow.callback"
#include "authkit/logging/log_macros.h"

namespace authkit {
namespace oidc {

namespace {

const char kDefaultAcknowledgement[] =
    "<html><head><title>Authorization complete</title></head>"
    "<body><h2>Authorization complete</h2>"
    "<p>You may close this window and return to the application.</p>"
    "</body></html>";

const size_t kMaxRequestSize = 16 * 1024;

const char* reason_phrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    default: return "Error";
  }
}

// Query values come from the browser and are echoed into the page
std::string html_escape(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      case '\'': out += "&#39;"; break;
      default: out += c;
    }
  }
  return out;
}

// Reads up to the end of the request headers
std::string read_request(int fd,
                         std::chrono::steady_clock::time_point deadline) {
  std::string request;
  char buffer[2048];
  while (request.find("\r\n\r\n") == std::string::npos &&
         request.size() < kMaxRequestSize) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      break;
    }
    struct pollfd pfd{fd, POLLIN, 0};
    int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0 && errno == EINTR) {
      continue;
    }
    if (ready <= 0) {
      break;
    }
    ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    request.append(buffer, static_cast<size_t>(n));
  }
  return request;
}

}  // namespace

RedirectUri parse_redirect_uri(const std::string& uri) {
  const std::string prefix = "http://";
  if (uri.compare(0, prefix.size(), prefix) != 0) {
    throw ConfigError("Local redirect URI must use http://", "redirect_uri");
  }
  RedirectUri result;
  result.scheme = "http";
  std::string rest = uri.substr(prefix.size());
  auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  result.path = slash == std::string::npos ? "/" : rest.substr(slash);
  auto query = result.path.find('?');
  if (query != std::string::npos) {
    result.path.erase(query);
  }

  auto colon = authority.rfind(':');
  if (colon == std::string::npos) {
    result.host = authority;
    result.port = 80;
  } else {
    result.host = authority.substr(0, colon);
    try {
      size_t consumed = 0;
      result.port = std::stoi(authority.substr(colon + 1), &consumed);
      if (consumed != authority.size() - colon - 1 || result.port < 0 ||
          result.port > 65535) {
        throw std::invalid_argument("port");
      }
    } catch (const std::logic_error&) {
      throw ConfigError("Invalid port in redirect URI '" + uri + "'",
                        "redirect_uri");
    }
  }
  if (result.host.empty()) {
    throw ConfigError("Redirect URI '" + uri + "' has no host",
                      "redirect_uri");
  }
  return result;
}

CallbackListener::CallbackListener(const Config& config)
    : config_(config),
      uri_(parse_redirect_uri(config.redirect_uri)),
      listen_fd_(-1),
      port_(uri_.port) {}

CallbackListener::~CallbackListener() {
  if (listen_fd_ >= 0) {
    close(listen_fd_);
  }
}

std::string CallbackListener::redirect_uri() const {
  return "http://" + uri_.host + ":" + std::to_string(port_) + uri_.path;
}

void CallbackListener::start() {
  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    throw FlowError(std::string("socket() failed: ") + std::strerror(errno));
  }
  int reuse = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(uri_.port));
  if (uri_.host == "localhost") {
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  } else if (inet_pton(AF_INET, uri_.host.c_str(), &addr.sin_addr) != 1) {
    throw ConfigError("Callback host must be localhost or an IPv4 address",
                      "redirect_uri");
  }

  if (bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr),
           sizeof(addr)) != 0) {
    throw FlowError("Cannot listen on " + uri_.host + ":" +
                    std::to_string(uri_.port) + ": " + std::strerror(errno));
  }
  if (listen(listen_fd_, 4) != 0) {
    throw FlowError(std::string("listen() failed: ") + std::strerror(errno));
  }

  socklen_t len = sizeof(addr);
  if (getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr),
                  &len) == 0) {
    port_ = ntohs(addr.sin_port);
  }
  AUTHKIT_LOG(Debug, "Waiting for authorization callback on {}",
              redirect_uri());
}

void CallbackListener::send_response(int client_fd,
                                     int status,
                                     const std::string& body) {
  std::string response = "HTTP/1.1 " + std::to_string(status) + " " +
                         reason_phrase(status) +
                         "\r\nContent-Type: text/html; charset=utf-8"
                         "\r\nContent-Length: " +
                         std::to_string(body.size()) +
                         "\r\nConnection: close\r\n\r\n" + body;
  size_t sent = 0;
  while (sent < response.size()) {
    ssize_t n = send(client_fd, response.data() + sent, response.size() - sent,
                     MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      AUTHKIT_LOG(Debug, "Callback response truncated: {}",
                  std::strerror(errno));
      return;
    }
    sent += static_cast<size_t>(n);
  }
}

std::string CallbackListener::wait_for_code(const std::string& expected_state) {
  if (listen_fd_ < 0) {
    start();
  }
  const auto deadline = std::chrono::steady_clock::now() + config_.timeout;

  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      throw FlowError("Timed out waiting for the authorization callback");
    }
    struct pollfd pfd{listen_fd_, POLLIN, 0};
    int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw FlowError(std::string("poll() failed: ") + std::strerror(errno));
    }
    if (ready == 0) {
      continue;
    }

    int client_fd = accept(listen_fd_, nullptr, nullptr);
    if (client_fd < 0) {
      continue;
    }
    std::string request = read_request(client_fd, deadline);

    // "GET /path?query HTTP/1.1"
    std::string target;
    auto first_space = request.find(' ');
    auto second_space = first_space == std::string::npos
                            ? std::string::npos
                            : request.find(' ', first_space + 1);
    if (request.compare(0, 4, "GET ") == 0 &&
        second_space != std::string::npos) {
      target = request.substr(first_space + 1, second_space - first_space - 1);
    }
    auto question = target.find('?');
    std::string path = target.substr(0, question);
    if (target.empty() || path != uri_.path) {
      send_response(client_fd, 404, "Not found");
      close(client_fd);
      continue;
    }

    util::FormData params = question == std::string::npos
                                ? util::FormData()
                                : util::parse_query_string(
                                      target.substr(question + 1));
    auto error = params.find("error");
    if (error != params.end()) {
      send_response(client_fd, 400,
                    "Authorization failed: " + html_escape(error->second));
      close(client_fd);
      auto description = params.find("error_description");
      throw ProtocolError(error->second, description == params.end()
                                             ? ""
                                             : description->second);
    }
    auto state = params.find("state");
    if (state == params.end() || state->second != expected_state) {
      send_response(client_fd, 400, "Authorization state mismatch");
      close(client_fd);
      throw FlowError("Authorization callback state does not match the request");
    }
    auto code = params.find("code");
    if (code == params.end() || code->second.empty()) {
      send_response(client_fd, 400, "Authorization code missing");
      close(client_fd);
      throw FlowError("Authorization callback carries no code");
    }

    send_response(client_fd, 200,
                  config_.acknowledgement_html.empty()
                      ? std::string(kDefaultAcknowledgement)
                      : config_.acknowledgement_html);
    close(client_fd);
    return code->second;
  }
}

}  // namespace oidc
}  // namespace authkit
