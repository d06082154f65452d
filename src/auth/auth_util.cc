#include "authkit/auth/auth_util.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <cctype>
#include <chrono>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "authkit/auth/auth_error.h"

extern char** environ;

namespace authkit {
namespace util {

namespace {

std::string trim(const std::string& value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

const char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

}  // namespace

ContentType parse_content_type(const std::string& header_value) {
  ContentType result;
  std::stringstream stream(header_value);
  std::string part;
  bool first = true;
  while (std::getline(stream, part, ';')) {
    part = trim(part);
    if (first) {
      result.content_type = to_lower(part);
      first = false;
      continue;
    }
    auto eq = part.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    if (to_lower(trim(part.substr(0, eq))) == "charset") {
      std::string charset = trim(part.substr(eq + 1));
      if (charset.size() >= 2 && charset.front() == '"' &&
          charset.back() == '"') {
        charset = charset.substr(1, charset.size() - 2);
      }
      result.charset = to_lower(charset);
    }
  }
  return result;
}

std::string base64_encode(const std::string& data) {
  std::string out;
  out.reserve(((data.size() + 2) / 3) * 4);
  size_t i = 0;
  while (i + 2 < data.size()) {
    uint32_t n = (static_cast<uint8_t>(data[i]) << 16) |
                 (static_cast<uint8_t>(data[i + 1]) << 8) |
                 static_cast<uint8_t>(data[i + 2]);
    out += kBase64Alphabet[(n >> 18) & 0x3F];
    out += kBase64Alphabet[(n >> 12) & 0x3F];
    out += kBase64Alphabet[(n >> 6) & 0x3F];
    out += kBase64Alphabet[n & 0x3F];
    i += 3;
  }
  size_t rest = data.size() - i;
  if (rest == 1) {
    uint32_t n = static_cast<uint8_t>(data[i]) << 16;
    out += kBase64Alphabet[(n >> 18) & 0x3F];
    out += kBase64Alphabet[(n >> 12) & 0x3F];
    out += "==";
  } else if (rest == 2) {
    uint32_t n = (static_cast<uint8_t>(data[i]) << 16) |
                 (static_cast<uint8_t>(data[i + 1]) << 8);
    out += kBase64Alphabet[(n >> 18) & 0x3F];
    out += kBase64Alphabet[(n >> 12) & 0x3F];
    out += kBase64Alphabet[(n >> 6) & 0x3F];
    out += '=';
  }
  return out;
}

std::string base64url_encode(const std::string& data) {
  std::string out = base64_encode(data);
  std::replace(out.begin(), out.end(), '+', '-');
  std::replace(out.begin(), out.end(), '/', '_');
  out.erase(std::find(out.begin(), out.end(), '='), out.end());
  return out;
}

std::string base64url_decode(const std::string& input) {
  std::string out;
  out.reserve(input.size() * 3 / 4);

  uint32_t buffer = 0;
  int bits = 0;
  for (char c : input) {
    int value;
    if (c >= 'A' && c <= 'Z') {
      value = c - 'A';
    } else if (c >= 'a' && c <= 'z') {
      value = c - 'a' + 26;
    } else if (c >= '0' && c <= '9') {
      value = c - '0' + 52;
    } else if (c == '-' || c == '+') {
      value = 62;
    } else if (c == '_' || c == '/') {
      value = 63;
    } else if (c == '=') {
      break;
    } else {
      throw std::invalid_argument("Invalid base64url character");
    }
    buffer = (buffer << 6) | static_cast<uint32_t>(value);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out += static_cast<char>((buffer >> bits) & 0xFF);
    }
  }
  return out;
}

std::string url_encode(const std::string& value) {
  char* escaped =
      curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size()));
  if (!escaped) {
    throw std::runtime_error("URL encoding failed");
  }
  std::string result(escaped);
  curl_free(escaped);
  return result;
}

std::string url_decode(const std::string& value) {
  // Form bodies encode spaces as '+'
  std::string plus_decoded = value;
  std::replace(plus_decoded.begin(), plus_decoded.end(), '+', ' ');

  int out_length = 0;
  char* unescaped =
      curl_easy_unescape(nullptr, plus_decoded.c_str(),
                         static_cast<int>(plus_decoded.size()), &out_length);
  if (!unescaped) {
    throw std::runtime_error("URL decoding failed");
  }
  std::string result(unescaped, static_cast<size_t>(out_length));
  curl_free(unescaped);
  return result;
}

std::string form_encode(const FormData& fields) {
  std::string body;
  for (const auto& field : fields) {
    if (!body.empty()) {
      body += '&';
    }
    body += url_encode(field.first) + "=" + url_encode(field.second);
  }
  return body;
}

FormData parse_query_string(const std::string& query) {
  FormData result;
  std::string input = query;
  if (!input.empty() && input[0] == '?') {
    input.erase(0, 1);
  }
  std::stringstream stream(input);
  std::string pair;
  while (std::getline(stream, pair, '&')) {
    if (pair.empty()) {
      continue;
    }
    auto eq = pair.find('=');
    if (eq == std::string::npos) {
      result[url_decode(pair)] = "";
    } else {
      result[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
    }
  }
  return result;
}

std::string join(const std::vector<std::string>& parts,
                 const std::string& separator) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += parts[i];
  }
  return out;
}

std::vector<std::string> split_whitespace(const std::string& value) {
  std::vector<std::string> parts;
  std::istringstream stream(value);
  std::string part;
  while (stream >> part) {
    parts.push_back(part);
  }
  return parts;
}

std::string random_urlsafe_string(size_t num_bytes) {
  std::string bytes(num_bytes, '\0');
  if (RAND_bytes(reinterpret_cast<unsigned char*>(&bytes[0]),
                 static_cast<int>(num_bytes)) != 1) {
    throw AuthException("Failed to generate random bytes");
  }
  return base64url_encode(bytes);
}

std::string sha256(const std::string& data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(),
                 nullptr) != 1) {
    throw AuthException("SHA-256 digest failed");
  }
  return std::string(reinterpret_cast<char*>(digest), digest_len);
}

int64_t epoch_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

ProcessResult run_process(const std::vector<std::string>& args) {
  int pipe_fds[2];
  if (pipe(pipe_fds) != 0) {
    throw AuthException(std::string("pipe() failed: ") + std::strerror(errno));
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addclose(&actions, pipe_fds[0]);
  posix_spawn_file_actions_adddup2(&actions, pipe_fds[1], STDOUT_FILENO);
  posix_spawn_file_actions_addclose(&actions, pipe_fds[1]);

  std::vector<char*> argv;
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  pid_t pid = 0;
  int rc = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), environ);
  posix_spawn_file_actions_destroy(&actions);
  close(pipe_fds[1]);
  if (rc != 0) {
    close(pipe_fds[0]);
    throw AuthException("Failed to run " + args[0] + ": " + std::strerror(rc));
  }

  ProcessResult result{0, ""};
  char buffer[4096];
  ssize_t n;
  while ((n = read(pipe_fds[0], buffer, sizeof(buffer))) > 0 ||
         (n < 0 && errno == EINTR)) {
    if (n > 0) {
      result.output.append(buffer, static_cast<size_t>(n));
    }
  }
  close(pipe_fds[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw AuthException(std::string("waitpid() failed: ") +
                          std::strerror(errno));
    }
  }
  result.exit_status = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  return result;
}


}  // namespace util
}  // namespace authkit
