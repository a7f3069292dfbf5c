#include "tinyweb/socket-transport.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>

#include "tinyweb/http-error.hpp"
#include "tinyweb/log.hpp"
#include "tinyweb/socket-ops.hpp"
#include "tinyweb/task.hpp"

namespace tinyweb {

Task<std::size_t> SocketTransport::read(std::span<char> buf) {
  while (true) {
    const int64_t nbRead = SafeRecv(fd(), buf.data(), buf.size());
    if (nbRead >= 0) {
      co_return static_cast<std::size_t>(nbRead);
    }
    const int err = errno;
    if (err == EINTR) {
      continue;
    }
    if (err != EAGAIN && err != EWOULDBLOCK) {
      throw HttpError(ErrorKind::IOError, fmt::format("recv failed on fd # {}: {}", fd(), std::strerror(err)));
    }
    co_await _scheduler.readable(fd());
  }
}

Task<void> SocketTransport::write(std::string_view data) {
  while (!data.empty()) {
    const int64_t nbSent = SafeSend(fd(), data);
    if (nbSent >= 0) {
      data.remove_prefix(static_cast<std::size_t>(nbSent));
      continue;
    }
    const int err = errno;
    if (err == EINTR) {
      continue;
    }
    if (err != EAGAIN && err != EWOULDBLOCK) {
      throw HttpError(ErrorKind::IOError, fmt::format("send failed on fd # {}: {}", fd(), std::strerror(err)));
    }
    co_await _scheduler.writable(fd());
  }
}

void SocketTransport::shutdownWrite() const noexcept {
  if (!ShutdownWrite(fd())) {
    log::debug("shutdown(SHUT_WR) failed on fd # {}: {}", fd(), std::strerror(errno));
  }
}

}  // namespace tinyweb
