#pragma once

#include <gmock/gmock.h>

#include <nlohmann/json.hpp>

#include "authkit/auth/http_client.h"

namespace authkit {
namespace test {

class MockHttpTransport : public HttpTransport {
 public:
  MOCK_METHOD(HttpResponse, send, (const HttpRequest& request), (override));
};

inline HttpResponse json_response(int status, const nlohmann::json& body,
                                  const HttpHeaders& extra_headers = {}) {
  HttpResponse response;
  response.status_code = status;
  response.headers = extra_headers;
  response.headers["Content-Type"] = "application/json";
  response.body = body.dump();
  return response;
}

inline HttpResponse text_response(int status, const std::string& body,
                                  const std::string& content_type =
                                      "text/plain") {
  HttpResponse response;
  response.status_code = status;
  response.headers["Content-Type"] = content_type;
  response.body = body;
  return response;
}

}  // namespace test
}  // namespace authkit
