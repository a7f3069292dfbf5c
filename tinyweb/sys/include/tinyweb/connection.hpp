#pragma once

#include "tinyweb/base-fd.hpp"
#include "tinyweb/socket.hpp"

namespace tinyweb {

// RAII class wrapping a non-blocking connection accepted on a listening socket.
class Connection {
 public:
  Connection() noexcept = default;

  // Accepts one pending connection. On failure, the Connection is empty and errno describes the failure
  // (EAGAIN when nothing is pending).
  explicit Connection(const Socket& socket);

  explicit Connection(BaseFd&& bd) noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace tinyweb
