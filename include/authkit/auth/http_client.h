#ifndef AUTHKIT_AUTH_HTTP_CLIENT_H
#define AUTHKIT_AUTH_HTTP_CLIENT_H

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "authkit/auth/auth_util.h"
#include "authkit/core/compat.h"

/**
 * @file http_client.h
 * @brief Synchronous HTTP client used by every protocol API client
 */

namespace authkit {

enum class HttpMethod { GET, POST };

const char* http_method_to_string(HttpMethod method);

using HttpHeaders = std::unordered_map<std::string, std::string>;

// Identifies this toolkit to the servers it talks to
constexpr const char kAppHeaderName[] = "X-Authkit-App";
constexpr const char kAppHeaderValue[] = "authkit";

struct HttpResponse {
  int status_code;                    // -1 when no response was received
  HttpHeaders headers;
  std::string body;
  std::string error;                  // Transport error text, if any

  HttpResponse() : status_code(-1) {}

  // Case-insensitive header lookup
  optional<std::string> header(const std::string& name) const;

  bool ok() const { return status_code >= 200 && status_code < 300; }
};

struct HttpRequest {
  std::string url;
  HttpMethod method;
  HttpHeaders headers;
  std::string body;
  std::chrono::seconds timeout;
  bool verify_ssl;

  HttpRequest() : method(HttpMethod::GET), timeout(30), verify_ssl(true) {}

  bool has_header(const std::string& name) const;
};

/**
 * @brief Sends one request and returns whatever came back
 *
 * Implementations never throw for HTTP level failures; a request that
 * produced no response has status_code -1 and a non-empty error.
 */
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;
  virtual HttpResponse send(const HttpRequest& request) = 0;
};

/**
 * @brief libcurl backed transport
 */
class CurlHttpTransport : public HttpTransport {
 public:
  struct Config {
    std::chrono::seconds connection_timeout;
    std::string ca_bundle_path;
    std::string user_agent;
    long max_redirects;

    Config()
        : connection_timeout(10), user_agent("authkit/1.0"), max_redirects(5) {}
  };

  explicit CurlHttpTransport(const Config& config = Config());
  ~CurlHttpTransport() override;

  HttpResponse send(const HttpRequest& request) override;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

/**
 * @brief Retry on HTTP 429 with exponential backoff
 *
 * The n-th retry (n starting at 0) waits backoff_factor * 2^n, or the
 * Retry-After value when the server asks for longer. No single wait
 * exceeds max_delay.
 */
struct RetryPolicy {
  int max_retries;
  std::chrono::milliseconds backoff_factor;
  std::chrono::milliseconds max_delay;

  RetryPolicy() : max_retries(3), backoff_factor(1000), max_delay(30000) {}
};

/**
 * @brief Adds the toolkit's default headers and retry policy to a transport
 *
 * Every request carries "Accept: application/json" and the application
 * identifying header unless the caller set them already.
 */
class HttpClient {
 public:
  using SleepFunction = std::function<void(std::chrono::milliseconds)>;

  struct Config {
    std::string app_header_name;
    std::string app_header_value;
    std::chrono::seconds timeout;
    bool verify_ssl;
    RetryPolicy retry;

    Config()
        : app_header_name(kAppHeaderName),
          app_header_value(kAppHeaderValue),
          timeout(30),
          verify_ssl(true) {}
  };

  // A null transport selects CurlHttpTransport
  explicit HttpClient(std::shared_ptr<HttpTransport> transport = nullptr,
                      const Config& config = Config());

  HttpResponse request(HttpRequest request);

  HttpResponse get(const std::string& url, const HttpHeaders& headers = {});

  HttpResponse post_form(const std::string& url,
                         const util::FormData& fields,
                         const HttpHeaders& headers = {});

  HttpResponse post_json(const std::string& url,
                         const nlohmann::json& payload,
                         const HttpHeaders& headers = {});

  void set_sleep_function(SleepFunction sleep) { sleep_ = std::move(sleep); }

  const Config& config() const { return config_; }
  const std::shared_ptr<HttpTransport>& transport() const { return transport_; }

 private:
  std::shared_ptr<HttpTransport> transport_;
  Config config_;
  SleepFunction sleep_;
};

}  // namespace authkit

#endif  // AUTHKIT_AUTH_HTTP_CLIENT_H
