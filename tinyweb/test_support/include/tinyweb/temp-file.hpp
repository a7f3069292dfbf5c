#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace tinyweb::test {

// Creates a uniquely named temporary directory holding one file. Both are removed on destruction.
class ScopedTempFile {
 public:
  ScopedTempFile(std::string_view name, std::string_view content);

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ScopedTempFile(ScopedTempFile&&) = delete;
  ScopedTempFile& operator=(ScopedTempFile&&) = delete;

  ~ScopedTempFile();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

  [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return _path; }

  [[nodiscard]] std::string filename() const { return _path.filename().string(); }

 private:
  std::filesystem::path _dir;
  std::filesystem::path _path;
};

}  // namespace tinyweb::test
