#pragma once
/** @file  TempDir.hpp
 *  @brief Scratch directory removed when the test ends.
 */

#include <filesystem>
#include <random>
#include <sstream>
#include <system_error>

namespace DocCrawler::test {

  class TempDir {
  public:
    TempDir() {
      std::random_device rd;
      std::ostringstream name;
      name << "doccrawler-test-" << std::hex << rd() << rd();
      path_ = std::filesystem::temp_directory_path() / name.str();
      std::filesystem::create_directories(path_);
    }

    ~TempDir() {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

  private:
    std::filesystem::path path_;
  };

} // namespace DocCrawler::test
