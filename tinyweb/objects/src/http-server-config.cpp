#include "tinyweb/http-server-config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace tinyweb {

namespace {

// A line buffer must at least hold a minimal request line such as "GET / HTTP/1.0\r\n".
constexpr std::size_t kMinLineLength = 16;

}  // namespace

void HttpServerConfig::validate() const {
  if (maxConcurrency == 0) {
    throw std::invalid_argument("maxConcurrency should be strictly positive");
  }
  if (backlog <= 0) {
    throw std::invalid_argument("backlog should be strictly positive");
  }
  if (requestTimeout <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("requestTimeout should be strictly positive");
  }
  if (pollInterval <= std::chrono::milliseconds::zero() ||
      std::cmp_less(std::numeric_limits<int>::max(), pollInterval.count())) {
    throw std::invalid_argument("pollInterval is out of range");
  }
  if (maxLineLength < kMinLineLength) {
    throw std::invalid_argument("maxLineLength is too small");
  }
  if (sendFileChunkSize == 0) {
    throw std::invalid_argument("sendFileChunkSize should be strictly positive");
  }
  if (bindAddress.empty()) {
    throw std::invalid_argument("bindAddress should not be empty");
  }
}

HttpServerConfig& HttpServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

HttpServerConfig& HttpServerConfig::withBindAddress(std::string_view address) {
  bindAddress = address;
  return *this;
}

HttpServerConfig& HttpServerConfig::withBacklog(int backlog) {
  this->backlog = backlog;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReusePort(bool on) {
  reusePort = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withTcpNoDelay(bool on) {
  tcpNoDelay = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxConcurrency(uint32_t maxConcurrency) {
  this->maxConcurrency = maxConcurrency;
  return *this;
}

HttpServerConfig& HttpServerConfig::withRequestTimeout(std::chrono::milliseconds timeout) {
  requestTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withPollInterval(std::chrono::milliseconds interval) {
  pollInterval = interval;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxLineLength(std::size_t maxLineLength) {
  this->maxLineLength = maxLineLength;
  return *this;
}

HttpServerConfig& HttpServerConfig::withSendFileChunkSize(std::size_t chunkSize) {
  sendFileChunkSize = chunkSize;
  return *this;
}

HttpServerConfig& HttpServerConfig::withDebug(bool on) {
  debug = on;
  return *this;
}

}  // namespace tinyweb
