#pragma once

#include <cstddef>
#include <limits>
#include <span>
#include <string>
#include <string_view>

#include "tinyweb/base-fd.hpp"

namespace tinyweb {

// Read-only regular file with its size captured at opening.
class File {
 public:
  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  File() noexcept = default;

  // Open a regular file by path. On failure (missing file, directory, no permission),
  // operator bool() returns false. Does not throw on missing files.
  explicit File(std::string_view path);

  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Return the file size in bytes, at the time of opening.
  [[nodiscard]] std::size_t size() const noexcept { return _fileSize; }

  // Read up to dst.size() bytes starting at the given absolute offset (pread).
  // Returns the number of bytes read (0 on EOF), kError on error.
  [[nodiscard]] std::size_t readAt(std::span<char> dst, std::size_t offset) const;

  // Returns the probable content type based on the file extension, 'text/plain' if unknown.
  [[nodiscard]] std::string_view detectedContentType() const noexcept { return _contentType; }

 private:
  BaseFd _fd;
  std::string_view _contentType;
  std::size_t _fileSize{0};
};

}  // namespace tinyweb
