#include "tinyweb/socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "tinyweb/errno-throw.hpp"
#include "tinyweb/log.hpp"
#include "tinyweb/socket-ops.hpp"

namespace tinyweb {

namespace {

int ComputeSocketType(Socket::Type type) {
  switch (type) {
    case Socket::Type::Stream:
      return SOCK_STREAM | SOCK_CLOEXEC;
    case Socket::Type::StreamNonBlock:
      return SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC;
    default:
      throw std::invalid_argument("Invalid socket type");
  }
}

}  // namespace

Socket::Socket(Type type) : _baseFd(::socket(AF_INET, ComputeSocketType(type), 0)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(std::string_view address, uint16_t& port, int backlog, bool reusePort) {
  const int fd = _baseFd.fd();
  static constexpr int kEnable = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) == -1) {
    throw_errno("setsockopt(SO_REUSEADDR) failed");
  }
  if (reusePort && ::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &kEnable, sizeof(kEnable)) == -1) {
    log::warn("setsockopt(SO_REUSEPORT) failed on fd # {}, ignoring", fd);
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, std::string(address).c_str(), &addr.sin_addr) != 1) {
    throw std::invalid_argument("Invalid IPv4 bind address");
  }
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1) {
    throw_errno("bind failed for {}:{}", address, port);
  }
  if (::listen(fd, backlog) == -1) {
    throw_errno("listen failed (backlog={})", backlog);
  }
  if (port == 0) {
    port = GetLocalPort(fd);
    if (port == 0) {
      throw_errno("getsockname failed");
    }
  }
  log::debug("Socket fd # {} listening on {}:{} (backlog={})", fd, address, port, backlog);
}

}  // namespace tinyweb
