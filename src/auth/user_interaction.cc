#include "authkit/auth/user_interaction.h"

#include <termios.h>
#include <unistd.h>

#include "authkit/auth/auth_error.h"
#include "authkit/auth/auth_util.h"

#define AUTHKIT_LOG_COMPONENT "authkit.flow"
#include "authkit/logging/log_macros.h"

namespace authkit {

namespace {

std::string json_string(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  if (it != object.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return "";
}

// Restores terminal echo when it goes out of scope
class EchoGuard {
 public:
  EchoGuard()
      : active_(isatty(STDIN_FILENO) &&
                tcgetattr(STDIN_FILENO, &saved_) == 0) {
    if (active_) {
      struct termios silent = saved_;
      silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
      tcsetattr(STDIN_FILENO, TCSANOW, &silent);
    }
  }
  ~EchoGuard() {
    if (active_) {
      tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
    }
  }

 private:
  bool active_;
  struct termios saved_;
};

}  // namespace

ConsoleUserInteraction::ConsoleUserInteraction(std::istream& in,
                                               std::ostream& out)
    : in_(in), out_(out) {}

bool ConsoleUserInteraction::open_browser(const std::string& url) {
  try {
    auto result = util::run_process({"xdg-open", url});
    if (result.exit_status != 0) {
      AUTHKIT_LOG(Warning, "xdg-open exited with status {}",
                  result.exit_status);
      return false;
    }
    return true;
  } catch (const AuthException& e) {
    AUTHKIT_LOG(Warning, "Cannot launch a browser: {}", e.what());
    return false;
  }
}

std::string ConsoleUserInteraction::prompt(const std::string& message) {
  out_ << message << ": " << std::flush;
  std::string answer;
  if (!std::getline(in_, answer)) {
    throw FlowError("Input closed while waiting for an answer");
  }
  return answer;
}

std::string ConsoleUserInteraction::prompt_secret(const std::string& message) {
  std::string answer;
  {
    EchoGuard guard;
    out_ << message << ": " << std::flush;
    if (!std::getline(in_, answer)) {
      throw FlowError("Input closed while waiting for an answer");
    }
  }
  out_ << "\n";
  return answer;
}

void ConsoleUserInteraction::present_device_code(
    const nlohmann::json& device_authorization, bool display_qr_code) {
  const std::string uri = json_string(device_authorization, "verification_uri");
  const std::string complete =
      json_string(device_authorization, "verification_uri_complete");
  const std::string user_code = json_string(device_authorization, "user_code");

  out_ << "\nTo complete login, visit\n    " << uri
       << "\nand enter the code\n    " << user_code << "\n";
  if (!complete.empty()) {
    out_ << "or open\n    " << complete << "\n";
    if (display_qr_code) {
      AUTHKIT_LOG(Debug, "QR rendering unavailable on the console");
    }
  }
  out_ << std::endl;
}

void ConsoleUserInteraction::notify(const std::string& message) {
  out_ << message << std::endl;
}

}  // namespace authkit
