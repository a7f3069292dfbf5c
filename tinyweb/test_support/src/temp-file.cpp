#include "tinyweb/temp-file.hpp"

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <ios>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "tinyweb/log.hpp"

namespace tinyweb::test {

namespace {

std::filesystem::path CreateUniqueDir() {
  static std::atomic<unsigned> counter{0};
  const auto base = std::filesystem::temp_directory_path();
  for (int attempt = 0; attempt < 100; ++attempt) {
    auto candidate = base / ("tinyweb-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
    std::error_code ec;
    if (std::filesystem::create_directory(candidate, ec)) {
      return candidate;
    }
  }
  throw std::runtime_error("Unable to create a temporary directory");
}

}  // namespace

ScopedTempFile::ScopedTempFile(std::string_view name, std::string_view content)
    : _dir(CreateUniqueDir()), _path(_dir / name) {
  std::ofstream ofs(_path, std::ios::binary | std::ios::trunc);
  ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!ofs) {
    throw std::runtime_error("Unable to write temporary file " + _path.string());
  }
}

ScopedTempFile::~ScopedTempFile() {
  std::error_code ec;
  std::filesystem::remove_all(_dir, ec);
  if (ec) {
    log::warn("Unable to remove temporary directory {}: {}", _dir.string(), ec.message());
  }
}

}  // namespace tinyweb::test
