#include "authkit/logging/log_formatter.h"

#include <ctime>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace authkit {
namespace logging {

namespace {

std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          tp.time_since_epoch())
                          .count() %
                      1000;
  std::tm tm_buf;
  localtime_r(&seconds, &tm_buf);

  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return fmt::format("{}.{:03d}", date, static_cast<int>(millis));
}

std::string componentLabel(const LogMessage& msg) {
  std::string label = componentToString(msg.component);
  if (!msg.component_name.empty()) {
    label += '.';
    label += msg.component_name;
  }
  return label;
}

}  // namespace

std::string DefaultFormatter::format(const LogMessage& msg) const {
  fmt::memory_buffer out;
  auto it = std::back_inserter(out);
  fmt::format_to(it, "{} [{}] ", formatTimestamp(msg.timestamp),
                 logLevelToString(msg.level));
  if (msg.component != Component::Root) {
    fmt::format_to(it, "[{}] ", componentLabel(msg));
  }
  fmt::format_to(it, "[{}] ", msg.logger_name);

  if (!msg.issuer.empty()) {
    fmt::format_to(it, "[iss:{}] ", msg.issuer);
  }
  if (!msg.client_id.empty()) {
    fmt::format_to(it, "[client:{}] ", msg.client_id);
  }
  if (!msg.request_id.empty()) {
    fmt::format_to(it, "[req:{}] ", msg.request_id);
  }
  fmt::format_to(it, "{}", msg.message);

  if (!msg.key_values.empty()) {
    const char* sep = " {";
    for (const auto& kv : msg.key_values) {
      fmt::format_to(it, "{}{}={}", sep, kv.first, kv.second);
      sep = ", ";
    }
    fmt::format_to(it, "}}");
  }
  return fmt::to_string(out);
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  nlohmann::json entry = {{"timestamp", formatTimestamp(msg.timestamp)},
                          {"level", logLevelToString(msg.level)},
                          {"logger", msg.logger_name}};
  if (msg.process_id > 0) {
    entry["pid"] = msg.process_id;
  }
  if (msg.component != Component::Root) {
    entry["component"] = componentLabel(msg);
  }
  if (msg.file) {
    entry["file"] = msg.file;
    entry["line"] = msg.line;
    if (msg.function) {
      entry["function"] = msg.function;
    }
  }
  if (!msg.issuer.empty()) {
    entry["issuer"] = msg.issuer;
  }
  if (!msg.client_id.empty()) {
    entry["client_id"] = msg.client_id;
  }
  if (!msg.request_id.empty()) {
    entry["request_id"] = msg.request_id;
  }
  entry["message"] = msg.message;
  if (!msg.key_values.empty()) {
    entry["metadata"] = msg.key_values;
  }
  // Invalid UTF-8 in a message must not take the caller down
  return entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace logging
}  // namespace authkit
