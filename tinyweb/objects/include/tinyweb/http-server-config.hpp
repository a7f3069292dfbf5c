#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace tinyweb {

struct HttpServerConfig {
#ifdef TINYWEB_CONSTRAINED_TARGET
  static constexpr uint32_t kDefaultMaxConcurrency = 3;
#else
  static constexpr uint32_t kDefaultMaxConcurrency = 10;
#endif

  // ============================
  // Listener / socket parameters
  // ============================
  // TCP port to bind. 0 lets the OS pick an ephemeral free port, retrievable via HttpServer::port().
  uint16_t port{8081};

  // IPv4 address to bind.
  std::string bindAddress{"127.0.0.1"};

  // Size of the kernel queue of pending connections. Connections arriving while all slots are busy wait there.
  int backlog{16};

  // If true, enables SO_REUSEPORT.
  bool reusePort{false};

  // Disable the Nagle algorithm on accepted connections.
  bool tcpNoDelay{false};

  // ============================
  // Concurrency & timeouts
  // ============================
  // Maximum number of connections served at the same time.
  uint32_t maxConcurrency{kDefaultMaxConcurrency};

  // Maximum duration to receive a full request (request line, headers and body).
  // The connection is closed without response when exceeded.
  std::chrono::milliseconds requestTimeout{std::chrono::seconds{3}};

  // Maximum time the scheduler blocks when no timer is pending.
  std::chrono::milliseconds pollInterval{500};

  // ============================
  // Memory bounds
  // ============================
  // Size of the per-connection line buffer: the maximum length of the request line and of one header line,
  // line terminator included.
  std::size_t maxLineLength{512};

  // Size of the buffer used to stream files.
  std::size_t sendFileChunkSize{512};

  // When true, error responses caused by exceptions include their message.
  bool debug{false};

  // Validates config. Throws std::invalid_argument if it is not valid.
  void validate() const;

  HttpServerConfig& withPort(uint16_t port);

  HttpServerConfig& withBindAddress(std::string_view address);

  HttpServerConfig& withBacklog(int backlog);

  HttpServerConfig& withReusePort(bool on = true);

  HttpServerConfig& withTcpNoDelay(bool on = true);

  HttpServerConfig& withMaxConcurrency(uint32_t maxConcurrency);

  HttpServerConfig& withRequestTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withPollInterval(std::chrono::milliseconds interval);

  HttpServerConfig& withMaxLineLength(std::size_t maxLineLength);

  HttpServerConfig& withSendFileChunkSize(std::size_t chunkSize);

  HttpServerConfig& withDebug(bool on = true);

  bool operator==(const HttpServerConfig&) const noexcept = default;
};

}  // namespace tinyweb
