#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tinyweb/http-status-code.hpp"
#include "tinyweb/socket.hpp"

namespace tinyweb::test {
using namespace std::chrono_literals;

// Blocking loopback client socket.
class ClientConnection {
 public:
  ClientConnection() noexcept = default;

  // Retries connecting until timeout. fd() is -1 on failure.
  explicit ClientConnection(uint16_t port, std::chrono::milliseconds timeout = 500ms);

  [[nodiscard]] int fd() const noexcept { return _socket.fd(); }

  void close() noexcept { _socket.close(); }

 private:
  Socket _socket;
};

// Minimal parsed HTTP response for test assertions.
struct ParsedResponse {
  [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;

  http::StatusCode statusCode{0};
  std::string version;
  std::string reason;
  std::map<std::string, std::string, std::less<>> headers;  // case-sensitive keys
  std::string body;
};

struct RequestOptions {
  std::string method{"GET"};
  std::string target{"/"};
  std::string version{"HTTP/1.0"};
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;
  std::chrono::milliseconds recvTimeout{2000ms};
};

void sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout = 500ms);

// Sets SO_RCVTIMEO on a blocking socket.
void setRecvTimeout(int fd, std::chrono::milliseconds timeout);

// Reads until the peer closes the connection or the receive timeout expires.
std::string recvUntilClosed(int fd);

// Sends raw bytes on a new connection and returns everything received until close.
std::string sendAndCollect(uint16_t port, std::string_view raw);

// Content-Length is added when the body is not empty.
std::string buildRequest(const RequestOptions& opt);

// Raw response of a request, throws std::runtime_error if the connection could not be made.
std::string request(uint16_t port, const RequestOptions& opt = {});

std::string simpleGet(uint16_t port, std::string_view target);

// Very small HTTP response parser (not resilient to all malformed cases, just for test consumption).
std::optional<ParsedResponse> parseResponse(std::string_view raw);

ParsedResponse parseResponseOrThrow(std::string_view raw);

bool AttemptConnect(uint16_t port);

// Returns true if the peer closed the connection before timeout, without sending anything.
bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout);

bool WaitForListenerClosed(uint16_t port, std::chrono::milliseconds timeout);

}  // namespace tinyweb::test
