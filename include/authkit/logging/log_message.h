#pragma once

#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <unistd.h>

#include "authkit/logging/log_level.h"

namespace authkit {
namespace logging {

struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string message;
  std::chrono::system_clock::time_point timestamp;

  // Component information
  Component component{Component::Root};
  std::string component_name;

  // Source location
  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  // Process and thread info
  pid_t process_id{0};
  std::thread::id thread_id;

  // Correlation IDs
  std::string request_id;
  std::string client_id;
  std::string issuer;

  std::map<std::string, std::string> key_values;

  std::string logger_name;

  LogMessage()
      : timestamp(std::chrono::system_clock::now()),
        process_id(getpid()),
        thread_id(std::this_thread::get_id()) {}
};

// Context carried by a caller that wants correlation fields attached
class LogContext {
 public:
  std::string request_id;
  std::string client_id;
  std::string issuer;

  Component component{Component::Root};
  std::string component_name;

  std::map<std::string, std::string> metadata;

  void setLocation(const char* file, int line, const char* func) {
    source_file = file;
    source_line = line;
    source_function = func;
  }

  const char* getFile() const { return source_file; }
  int getLine() const { return source_line; }
  const char* getFunction() const { return source_function; }

  void merge(const LogContext& other) {
    if (!other.request_id.empty())
      request_id = other.request_id;
    if (!other.client_id.empty())
      client_id = other.client_id;
    if (!other.issuer.empty())
      issuer = other.issuer;
    for (const auto& kv : other.metadata) {
      metadata[kv.first] = kv.second;
    }
  }

  LogMessage toLogMessage(LogLevel level, const std::string& msg) const {
    LogMessage log_msg;
    log_msg.level = level;
    log_msg.message = msg;
    log_msg.component = component;
    log_msg.component_name = component_name;
    log_msg.file = source_file;
    log_msg.line = source_line;
    log_msg.function = source_function;
    log_msg.request_id = request_id;
    log_msg.client_id = client_id;
    log_msg.issuer = issuer;
    log_msg.key_values = metadata;
    return log_msg;
  }

 private:
  const char* source_file{nullptr};
  int source_line{0};
  const char* source_function{nullptr};
};

}  // namespace logging
}  // namespace authkit
