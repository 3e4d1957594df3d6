#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>

namespace ftpd {
namespace test {

/**
 * Scratch directory under the system temp dir, removed with everything in it
 * when the object goes away. The path is canonical so it compares equal to
 * what SessionRoot reports.
 */
class TempDirectory {
 public:
  TempDirectory() {
    std::string pattern =
        (std::filesystem::temp_directory_path() / "ftpd_test_XXXXXX").string();
    if (::mkdtemp(&pattern[0]) == nullptr) {
      throw std::runtime_error("mkdtemp failed");
    }
    path_ = std::filesystem::canonical(pattern).string();
  }

  ~TempDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDirectory(const TempDirectory&) = delete;
  TempDirectory& operator=(const TempDirectory&) = delete;

  const std::string& path() const { return path_; }

  std::string join(const std::string& relative) const {
    return path_ + "/" + relative;
  }

  void writeFile(const std::string& relative, const std::string& content) {
    std::ofstream out(join(relative), std::ios::binary | std::ios::trunc);
    out << content;
  }

  std::string readFile(const std::string& relative) const {
    std::ifstream in(join(relative), std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
  }

  void makeDirectory(const std::string& relative) {
    std::filesystem::create_directories(join(relative));
  }

  bool exists(const std::string& relative) const {
    std::error_code ec;
    return std::filesystem::exists(join(relative), ec);
  }

 private:
  std::string path_;
};

}  // namespace test
}  // namespace ftpd
