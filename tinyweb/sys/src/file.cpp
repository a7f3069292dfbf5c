#include "tinyweb/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <span>
#include <string>
#include <string_view>

#include "tinyweb/log.hpp"
#include "tinyweb/mime-mappings.hpp"

namespace tinyweb {

File::File(std::string_view path)
    : _fd(::open(std::string(path).c_str(), O_RDONLY | O_CLOEXEC)), _contentType(MIMETypeForPath(path)) {
  if (!_fd) {
    log::debug("Unable to open file '{}': {}", path, std::strerror(errno));
    return;
  }
  struct stat st{};
  if (::fstat(_fd.fd(), &st) != 0 || !S_ISREG(st.st_mode)) {
    log::debug("'{}' is not a readable regular file", path);
    _fd.close();
    return;
  }
  _fileSize = static_cast<std::size_t>(st.st_size);
}

std::size_t File::readAt(std::span<char> dst, std::size_t offset) const {
  for (;;) {
    const auto nbRead = ::pread(_fd.fd(), dst.data(), dst.size(), static_cast<off_t>(offset));
    if (nbRead >= 0) {
      return static_cast<std::size_t>(nbRead);
    }
    if (errno != EINTR) {
      log::error("pread failed on fd # {}: {}", _fd.fd(), std::strerror(errno));
      return kError;
    }
  }
}

}  // namespace tinyweb
