#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace authkit {
namespace test {

// Fresh directory under $TMPDIR, removed with everything in it on scope exit
class TempDir {
 public:
  TempDir() {
    std::string pattern =
        (std::filesystem::temp_directory_path() / "authkit-test-XXXXXX")
            .string();
    if (!mkdtemp(&pattern[0])) {
      throw std::runtime_error("mkdtemp failed");
    }
    path_ = pattern;
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

  std::string file(const std::string& name) const {
    return (path_ / name).string();
  }

  std::string write(const std::string& name, const std::string& contents) const {
    std::string target = file(name);
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    out << contents;
    return target;
  }

  static std::string read(const std::string& target) {
    std::ifstream in(target, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
  }

 private:
  std::filesystem::path path_;
};

}  // namespace test
}  // namespace authkit
