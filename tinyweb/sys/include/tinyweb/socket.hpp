#pragma once

#include <cstdint>
#include <string_view>

#include "tinyweb/base-fd.hpp"

namespace tinyweb {

// RAII class wrapping an IPv4 TCP socket file descriptor.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Throws std::system_error on failure.
  explicit Socket(Type type);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind to given IPv4 address and port, then listen with given backlog.
  // If port is 0, an ephemeral port is chosen and written back in the argument.
  // Throws std::system_error on failure, std::invalid_argument if address is not a valid IPv4 address.
  void bindAndListen(std::string_view address, uint16_t& port, int backlog, bool reusePort);

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace tinyweb
