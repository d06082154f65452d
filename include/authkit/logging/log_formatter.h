#pragma once

#include <string>

#include "authkit/logging/log_message.h"

namespace authkit {
namespace logging {

class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

// "2024-01-01 12:00:00.123 [WARNING] [authkit.oidc.flow] message {k=v}"
// Correlation fields (issuer, client, request) follow the logger name.
class DefaultFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// One JSON object per line, suitable for log shippers
class JsonFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

}  // namespace logging
}  // namespace authkit
