#include "authkit/auth/file_backed_json.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "authkit/auth/auth_error.h"
#include "authkit/auth/auth_util.h"

#define AUTHKIT_LOG_COMPONENT "authkit.credential"
#include "authkit/logging/log_macros.h"

namespace authkit {

namespace {

const char kSopsSuffix[] = ".sops.json";

const size_t kSopsSuffixLen = sizeof(kSopsSuffix) - 1;

bool is_sops_path(const std::string& path) {
  return path.size() >= kSopsSuffixLen &&
         path.compare(path.size() - kSopsSuffixLen, kSopsSuffixLen,
                      kSopsSuffix) == 0;
}

// Scratch file beside the target. sops picks its creation rules by file
// name, so the scratch copy of an encrypted file keeps the suffix.
std::string scratch_path(const std::string& path, bool sops) {
  if (!sops) {
    return path + ".tmp";
  }
  return path.substr(0, path.size() - kSopsSuffixLen) + ".tmp" + kSopsSuffix;
}

void encrypt_in_place(const std::string& path) {
  util::ProcessResult result;
  try {
    result = util::run_process({"sops", "-e", "--input-type", "json",
                                "--output-type", "json", "-i", path});
  } catch (const AuthException&) {
    unlink(path.c_str());
    throw;
  }
  if (result.exit_status != 0) {
    unlink(path.c_str());
    throw DataIntegrityError("sops encryption failed with status " +
                                 std::to_string(result.exit_status),
                             path);
  }
}

std::chrono::system_clock::time_point stat_to_time_point(
    const struct stat& st) {
  auto since_epoch = std::chrono::seconds(st.st_mtim.tv_sec) +
                     std::chrono::nanoseconds(st.st_mtim.tv_nsec);
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          since_epoch));
}

bool path_exists(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0;
}

void make_directories(const std::string& dir) {
  if (dir.empty() || path_exists(dir)) {
    return;
  }
  auto slash = dir.find_last_of('/');
  if (slash != std::string::npos && slash > 0) {
    make_directories(dir.substr(0, slash));
  }
  if (mkdir(dir.c_str(), 0700) != 0 && errno != EEXIST) {
    throw DataIntegrityError(
        std::string("Cannot create directory: ") + std::strerror(errno), dir);
  }
}

}  // namespace

nlohmann::json remove_null_members(const nlohmann::json& value) {
  if (!value.is_object()) {
    return value;
  }
  nlohmann::json result = nlohmann::json::object();
  for (auto it = value.begin(); it != value.end(); ++it) {
    if (!it.value().is_null()) {
      result[it.key()] = remove_null_members(it.value());
    }
  }
  return result;
}

FileBackedJsonObject::FileBackedJsonObject(optional<std::string> file_path)
    : file_path_(std::move(file_path)) {}

void FileBackedJsonObject::set_path(optional<std::string> file_path) {
  file_path_ = std::move(file_path);
}

void FileBackedJsonObject::set_data(const optional<nlohmann::json>& new_data) {
  check_data(new_data);
  data_ = new_data;
  load_time_ = std::chrono::system_clock::now();
}

void FileBackedJsonObject::update_data(const nlohmann::json& sparse_update) {
  if (!sparse_update.is_object()) {
    raise_invalid("Update data must be a JSON object");
  }
  nlohmann::json merged = data_ ? *data_ : nlohmann::json::object();
  for (auto it = sparse_update.begin(); it != sparse_update.end(); ++it) {
    merged[it.key()] = it.value();
  }
  set_data(merged);
}

void FileBackedJsonObject::load() {
  if (!file_path_) {
    return;
  }
  if (!path_exists(*file_path_)) {
    throw CredentialMissingError(*file_path_);
  }

  nlohmann::json new_data = read_file(*file_path_);
  check_data(new_data);
  data_ = std::move(new_data);
  load_time_ = std::chrono::system_clock::now();
}

FileBackedJsonObject::LoadStatus FileBackedJsonObject::try_load() {
  if (!file_path_) {
    return LoadStatus::NO_PATH;
  }
  if (!path_exists(*file_path_)) {
    return LoadStatus::MISSING;
  }
  load();
  return LoadStatus::LOADED;
}

void FileBackedJsonObject::lazy_load() {
  if (!data_) {
    load();
  }
}

void FileBackedJsonObject::lazy_reload() {
  if (!data_) {
    load();
    return;
  }
  if (!file_path_) {
    return;
  }

  struct stat st;
  if (stat(file_path_->c_str(), &st) != 0) {
    // Nothing newer on disk; keep what we have
    return;
  }
  if (stat_to_time_point(st) > load_time_) {
    AUTHKIT_LOG(Debug, "Reloading {} after external modification",
                *file_path_);
    load();
  }
}

void FileBackedJsonObject::save() {
  if (!data_) {
    raise_invalid("Cannot save, no data has been set");
  }
  check_data(data_);
  if (!file_path_) {
    return;
  }

  auto slash = file_path_->find_last_of('/');
  if (slash != std::string::npos && slash > 0) {
    make_directories(file_path_->substr(0, slash));
  }

  write_file(*file_path_, remove_null_members(*data_));
  load_time_ = std::chrono::system_clock::now();
}

bool FileBackedJsonObject::is_persisted_to_disk() const {
  return file_path_ && path_exists(*file_path_);
}

void FileBackedJsonObject::check_data(
    const optional<nlohmann::json>& data) const {
  if (!data) {
    raise_invalid("None data is invalid");
  }
  if (!data->is_object()) {
    raise_invalid("Data must be a JSON object");
  }
}

void FileBackedJsonObject::raise_invalid(const std::string& message) const {
  throw DataIntegrityError(message, file_path_.value_or(""));
}

optional<std::string> FileBackedJsonObject::string_member(
    const std::string& key) const {
  if (!data_ || !data_->is_object()) {
    return nullopt;
  }
  auto it = data_->find(key);
  if (it == data_->end() || !it->is_string()) {
    return nullopt;
  }
  return it->get<std::string>();
}

nlohmann::json FileBackedJsonObject::read_file(const std::string& file_path) {
  std::string content;
  if (is_sops_path(file_path)) {
    AUTHKIT_LOG(Debug, "Decrypting {} with sops", file_path);
    auto result = util::run_process({"sops", "-d", file_path});
    if (result.exit_status != 0) {
      throw DataIntegrityError("sops decryption failed with status " +
                                   std::to_string(result.exit_status),
                               file_path);
    }
    content = std::move(result.output);
  } else {
    std::ifstream file(file_path);
    if (!file.is_open()) {
      throw DataIntegrityError("Cannot open file", file_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    content = buffer.str();
  }

  try {
    return nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error& e) {
    throw DataIntegrityError(std::string("Invalid JSON: ") + e.what(),
                             file_path);
  }
}

void FileBackedJsonObject::write_file(const std::string& file_path,
                                      const nlohmann::json& data) {
  const std::string serialized = data.dump(2) + "\n";
  const bool sops = is_sops_path(file_path);
  const std::string write_path = scratch_path(file_path, sops);

  int fd = open(write_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
  if (fd < 0) {
    throw DataIntegrityError(
        std::string("Cannot open file for writing: ") + std::strerror(errno),
        write_path);
  }
  const char* cursor = serialized.data();
  size_t remaining = serialized.size();
  while (remaining > 0) {
    ssize_t written = write(fd, cursor, remaining);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      int saved = errno;
      close(fd);
      unlink(write_path.c_str());
      throw DataIntegrityError(
          std::string("Write failed: ") + std::strerror(saved), write_path);
    }
    cursor += written;
    remaining -= static_cast<size_t>(written);
  }
  fchmod(fd, S_IRUSR | S_IWUSR);
  close(fd);

  if (sops) {
    AUTHKIT_LOG(Debug, "Encrypting {} with sops", file_path);
    encrypt_in_place(write_path);
  }
  if (rename(write_path.c_str(), file_path.c_str()) != 0) {
    int saved = errno;
    unlink(write_path.c_str());
    throw DataIntegrityError(
        std::string("Cannot replace file: ") + std::strerror(saved),
        file_path);
  }
  chmod(file_path.c_str(), S_IRUSR | S_IWUSR);
}

}  // namespace authkit
