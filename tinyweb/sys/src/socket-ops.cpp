#include "tinyweb/socket-ops.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tinyweb {

bool SetTcpNoDelay(int fd) noexcept {
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) == 0;
}

uint16_t GetLocalPort(int fd) noexcept {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return 0;
  }
  return ntohs(addr.sin_port);
}

int64_t SafeSend(int fd, std::string_view data) noexcept {
  return static_cast<int64_t>(::send(fd, data.data(), data.size(), MSG_NOSIGNAL));
}

int64_t SafeRecv(int fd, char* buf, std::size_t len) noexcept {
  return static_cast<int64_t>(::recv(fd, buf, len, 0));
}

bool ShutdownWrite(int fd) noexcept { return ::shutdown(fd, SHUT_WR) == 0; }

}  // namespace tinyweb
