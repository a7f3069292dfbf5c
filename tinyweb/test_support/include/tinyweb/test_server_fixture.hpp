#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

#include "tinyweb/http-server-config.hpp"
#include "tinyweb/http-server.hpp"

namespace tinyweb::test {

// RAII test server harness.
//  * Constructs the HttpServer (binds & listens immediately) on an ephemeral port
//  * Lets the caller register routes through the setup callback, before serving starts
//  * Serves in a background jthread, stopped and joined on destruction (or by an early stop())
class TestServer {
 public:
  using Setup = std::function<void(HttpServer&)>;

  explicit TestServer(HttpServerConfig cfg, const Setup& setup = {},
                      std::chrono::milliseconds pollPeriod = std::chrono::milliseconds{5});

  TestServer(const TestServer&) = delete;
  TestServer& operator=(const TestServer&) = delete;

  ~TestServer();

  [[nodiscard]] uint16_t port() const noexcept { return server.port(); }

  // Stops serving and waits for the shutdown to complete. Idempotent.
  void stop();

  HttpServer server;

 private:
  std::jthread _thread;
};

// Polls 'pred' until it returns true or timeout elapses. Returns the last value of pred.
bool WaitFor(const std::function<bool()>& pred, std::chrono::milliseconds timeout = std::chrono::milliseconds{1000});

}  // namespace tinyweb::test
