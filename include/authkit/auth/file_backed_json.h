#ifndef AUTHKIT_AUTH_FILE_BACKED_JSON_H
#define AUTHKIT_AUTH_FILE_BACKED_JSON_H

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "authkit/core/compat.h"

/**
 * @file file_backed_json.h
 * @brief JSON document with a validity contract, optionally backed by a file
 *
 * data() is nullopt until something is loaded or set; an empty object is a
 * valid, distinct state. Every mutation is checked with check_data() first
 * and leaves the previous state untouched when the check fails.
 *
 * Files whose name ends in ".sops.json" are decrypted with `sops -d` on
 * read and encrypted in place with `sops -e` after write.
 */

namespace authkit {

class FileBackedJsonObject {
 public:
  enum class LoadStatus {
    LOADED,   // File read and accepted
    NO_PATH,  // In-memory object, nothing to read
    MISSING   // Path set but the file does not exist yet
  };

  explicit FileBackedJsonObject(optional<std::string> file_path = nullopt);
  virtual ~FileBackedJsonObject() = default;

  FileBackedJsonObject(const FileBackedJsonObject&) = default;
  FileBackedJsonObject& operator=(const FileBackedJsonObject&) = default;

  const optional<std::string>& path() const { return file_path_; }
  void set_path(optional<std::string> file_path);

  const optional<nlohmann::json>& data() const { return data_; }

  /**
   * @brief Replace the data after validating it
   * @throws DataIntegrityError when new_data is nullopt or fails check_data()
   */
  void set_data(const optional<nlohmann::json>& new_data);

  /**
   * @brief Merge top-level members into the current data (or into {} when
   * nothing is loaded) and validate the result before accepting it
   */
  void update_data(const nlohmann::json& sparse_update);

  /**
   * @brief Read the backing file
   *
   * No-op without a path. A missing file raises CredentialMissingError and
   * unparsable or invalid content raises DataIntegrityError; in both cases
   * the previously held data is kept.
   */
  void load();

  // As load(), but reports expected absence instead of throwing
  LoadStatus try_load();

  // Load only if nothing is held in memory yet
  void lazy_load();

  // Load when nothing is held or the file changed since the last load
  void lazy_reload();

  /**
   * @brief Write the data to the backing file
   *
   * No-op without a path. Null members are dropped, keys are sorted and the
   * file is made readable by the owner only.
   * @throws DataIntegrityError when there is no data to save
   */
  void save();

  bool is_persisted_to_disk() const;

  std::chrono::system_clock::time_point load_time() const {
    return load_time_;
  }

  /**
   * @brief Validity contract; subclasses extend it with required fields
   * @throws DataIntegrityError
   */
  virtual void check_data(const optional<nlohmann::json>& data) const;

 protected:
  // Throws DataIntegrityError naming this object's file
  [[noreturn]] void raise_invalid(const std::string& message) const;

  // Convenience for subclasses: string member or nullopt
  optional<std::string> string_member(const std::string& key) const;

 private:
  static nlohmann::json read_file(const std::string& file_path);
  static void write_file(const std::string& file_path,
                         const nlohmann::json& data);

  optional<nlohmann::json> data_;
  optional<std::string> file_path_;
  std::chrono::system_clock::time_point load_time_{};
};

// Recursively drops null members from objects (arrays are kept as is)
nlohmann::json remove_null_members(const nlohmann::json& value);

}  // namespace authkit

#endif  // AUTHKIT_AUTH_FILE_BACKED_JSON_H
