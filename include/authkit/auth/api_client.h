#ifndef AUTHKIT_AUTH_API_CLIENT_H
#define AUTHKIT_AUTH_API_CLIENT_H

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "authkit/auth/http_client.h"

/**
 * @file api_client.h
 * @brief Base for narrow clients bound to a single server endpoint
 *
 * Responses are classified in a fixed order:
 *  1. a JSON body carrying "error" (OAuth) or "errorCode" (Okta style)
 *     raises ProtocolError with the server's code and description;
 *  2. otherwise a non-2xx status raises TransportError;
 *  3. otherwise, when JSON is expected, a missing or non-JSON body raises
 *     PayloadError.
 */

namespace authkit {

class ApiClient {
 public:
  ApiClient(std::shared_ptr<HttpClient> http, std::string endpoint_uri);
  virtual ~ApiClient() = default;

  const std::string& endpoint_uri() const { return endpoint_uri_; }

  // Raises for error payloads and non-2xx statuses
  static void check_response(const HttpResponse& response);

  // check_response() plus the JSON payload shape check
  static nlohmann::json checked_json(const HttpResponse& response);

 protected:
  nlohmann::json checked_get_json(const HttpHeaders& headers = {});
  nlohmann::json checked_post_form_json(const util::FormData& fields,
                                        const HttpHeaders& headers = {});
  void checked_post_form(const util::FormData& fields,
                         const HttpHeaders& headers = {});
  nlohmann::json checked_post_json_json(const nlohmann::json& payload,
                                        const HttpHeaders& headers = {});

  std::shared_ptr<HttpClient> http_;
  std::string endpoint_uri_;
};

}  // namespace authkit

#endif  // AUTHKIT_AUTH_API_CLIENT_H
