#include "authkit/auth/http_client.h"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <thread>

#include <curl/curl.h>

#define AUTHKIT_LOG_COMPONENT "authkit.http"
#include "authkit/logging/log_macros.h"

namespace authkit {

namespace {

bool iequals(const std::string& a, const std::string& b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  std::string* response = static_cast<std::string*>(userdata);
  response->append(ptr, size * nmemb);
  return size * nmemb;
}

size_t header_callback(char* buffer, size_t size, size_t nitems,
                       void* userdata) {
  auto* headers = static_cast<HttpHeaders*>(userdata);
  std::string header(buffer, size * nitems);

  size_t colon_pos = header.find(':');
  if (colon_pos != std::string::npos) {
    std::string name = header.substr(0, colon_pos);
    std::string value = header.substr(colon_pos + 1);

    name.erase(0, name.find_first_not_of(" \t"));
    name.erase(name.find_last_not_of(" \t\r\n") + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t\r\n") + 1);

    if (!name.empty()) {
      (*headers)[name] = value;
    }
  }

  return size * nitems;
}

std::once_flag curl_init_flag;

}  // namespace

const char* http_method_to_string(HttpMethod method) {
  switch (method) {
    case HttpMethod::GET: return "GET";
    case HttpMethod::POST: return "POST";
  }
  return "GET";
}

optional<std::string> HttpResponse::header(const std::string& name) const {
  for (const auto& entry : headers) {
    if (iequals(entry.first, name)) {
      return entry.second;
    }
  }
  return nullopt;
}

bool HttpRequest::has_header(const std::string& name) const {
  for (const auto& entry : headers) {
    if (iequals(entry.first, name)) {
      return true;
    }
  }
  return false;
}

class CurlHttpTransport::Impl {
 public:
  explicit Impl(const Config& config) : config_(config) {
    std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_ALL); });
  }

  HttpResponse send(const HttpRequest& request) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
      response.status_code = -1;
      response.error = "Failed to initialize CURL";
      return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

    if (request.method == HttpMethod::POST) {
      curl_easy_setopt(curl, CURLOPT_POST, 1L);
    }

    if (!request.body.empty() || request.method == HttpMethod::POST) {
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                       static_cast<long>(request.body.size()));
    }

    struct curl_slist* headers = nullptr;
    for (const auto& header_pair : request.headers) {
      std::string header = header_pair.first + ": " + header_pair.second;
      headers = curl_slist_append(headers, header.c_str());
    }
    if (headers) {
      curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, request.verify_ssl ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, request.verify_ssl ? 2L : 0L);
    if (!config_.ca_bundle_path.empty()) {
      curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle_path.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, config_.max_redirects);

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(config_.connection_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT,
                     static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    std::string response_body;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<int>(http_code);
    if (res != CURLE_OK && response.status_code == 0) {
      response.status_code = -1;
    }
    response.body = std::move(response_body);
    if (res != CURLE_OK) {
      response.error = curl_easy_strerror(res);
    }

    if (headers) {
      curl_slist_free_all(headers);
    }
    curl_easy_cleanup(curl);

    return response;
  }

 private:
  Config config_;
};

CurlHttpTransport::CurlHttpTransport(const Config& config)
    : impl_(std::make_unique<Impl>(config)) {}

CurlHttpTransport::~CurlHttpTransport() = default;

HttpResponse CurlHttpTransport::send(const HttpRequest& request) {
  return impl_->send(request);
}

HttpClient::HttpClient(std::shared_ptr<HttpTransport> transport,
                       const Config& config)
    : transport_(transport ? std::move(transport)
                           : std::make_shared<CurlHttpTransport>()),
      config_(config),
      sleep_([](std::chrono::milliseconds delay) {
        std::this_thread::sleep_for(delay);
      }) {}

HttpResponse HttpClient::request(HttpRequest request) {
  if (!request.has_header("Accept")) {
    request.headers["Accept"] = "application/json";
  }
  if (!config_.app_header_name.empty() &&
      !request.has_header(config_.app_header_name)) {
    request.headers[config_.app_header_name] = config_.app_header_value;
  }
  request.timeout = config_.timeout;
  request.verify_ssl = config_.verify_ssl;

  for (int attempt = 0;; ++attempt) {
    AUTHKIT_LOG(Debug, "{} {}", http_method_to_string(request.method),
                request.url);
    HttpResponse response = transport_->send(request);
    if (response.status_code != 429 || attempt >= config_.retry.max_retries) {
      return response;
    }

    const RetryPolicy& retry = config_.retry;
    std::chrono::milliseconds delay(retry.backoff_factor.count() << attempt);
    auto retry_after = response.header("Retry-After");
    if (retry_after) {
      try {
        // Clamped before scaling so huge values cannot overflow
        const long long cap_seconds = retry.max_delay.count() / 1000 + 1;
        std::chrono::milliseconds requested(
            std::min(std::stoll(*retry_after), cap_seconds) * 1000);
        delay = std::max(delay, requested);
      } catch (const std::exception&) {
        // HTTP-date form is not honoured; keep the computed backoff
      }
    }
    delay = std::min(delay, retry.max_delay);
    AUTHKIT_LOG(Warning, "HTTP 429 from {}, retry {} of {} in {} ms",
                request.url, attempt + 1, config_.retry.max_retries,
                static_cast<long long>(delay.count()));
    sleep_(delay);
  }
}

HttpResponse HttpClient::get(const std::string& url,
                             const HttpHeaders& headers) {
  HttpRequest request;
  request.url = url;
  request.method = HttpMethod::GET;
  request.headers = headers;
  return this->request(std::move(request));
}

HttpResponse HttpClient::post_form(const std::string& url,
                                   const util::FormData& fields,
                                   const HttpHeaders& headers) {
  HttpRequest request;
  request.url = url;
  request.method = HttpMethod::POST;
  request.headers = headers;
  request.headers["Content-Type"] = "application/x-www-form-urlencoded";
  request.body = util::form_encode(fields);
  return this->request(std::move(request));
}

HttpResponse HttpClient::post_json(const std::string& url,
                                   const nlohmann::json& payload,
                                   const HttpHeaders& headers) {
  HttpRequest request;
  request.url = url;
  request.method = HttpMethod::POST;
  request.headers = headers;
  request.headers["Content-Type"] = "application/json";
  request.body = payload.dump();
  return this->request(std::move(request));
}

}  // namespace authkit
