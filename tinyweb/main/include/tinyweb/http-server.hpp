#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <utility>

#include "tinyweb/concurrency-limiter.hpp"
#include "tinyweb/connection.hpp"
#include "tinyweb/http-response.hpp"
#include "tinyweb/http-server-config.hpp"
#include "tinyweb/request-parser.hpp"
#include "tinyweb/resource.hpp"
#include "tinyweb/route-config.hpp"
#include "tinyweb/router.hpp"
#include "tinyweb/scheduler.hpp"
#include "tinyweb/server-stats.hpp"
#include "tinyweb/socket-transport.hpp"
#include "tinyweb/socket.hpp"
#include "tinyweb/task.hpp"

namespace tinyweb {

// HTTP/1.0 server serving one request per connection, with at most maxConcurrency connections at a time.
// All connections are served by cooperative tasks on the thread calling run() / runUntil().
//
// Lifecycle:
//  - The constructor binds and listens immediately, so port() is known right away (ephemeral port with port 0).
//  - Routes and resources are registered before serving. Registration after the first run throws std::logic_error.
//  - run() / runUntil() serve until stop() (thread-safe), the predicate, or a termination signal when
//    SignalHandler is enabled, then shutdown() closes the listening socket, cancels every connection task
//    and waits for their cleanup.
//
// Connections beyond maxConcurrency are not accepted: they wait in the kernel backlog.
class HttpServer {
 public:
  explicit HttpServer(HttpServerConfig config);

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  ~HttpServer();

  // Registers a plain handler for pattern. See Router::addRoute.
  HttpServer& addRoute(std::string_view pattern, RequestHandler handler, RouteConfig config = {}) {
    _router.addRoute(pattern, std::move(handler), std::move(config));
    return *this;
  }

  // Registers a resource exposing some of get, post, put and del. See MakeResourceEntry.
  template <class R>
  HttpServer& addResource(std::string_view pattern, std::shared_ptr<R> resource, RouteConfig config = {}) {
    _router.addResource(pattern, MakeResourceEntry(std::move(resource)), std::move(config));
    return *this;
  }

  // Serves until stop() is called or a termination signal is received, then shuts down.
  void run();

  // Like run(), also returning once predicate returns true. It is checked after each scheduling round.
  void runUntil(const std::function<bool()>& predicate);

  // Requests run() / runUntil() to return. Can be called from any thread.
  void stop() noexcept;

  // Closes the listening socket, cancels all connection tasks and waits for their completion. Idempotent.
  // Must be called from the serving thread (it is called by run() before returning).
  void shutdown();

  [[nodiscard]] uint16_t port() const noexcept { return _config.port; }

  [[nodiscard]] bool isListening() const noexcept { return _listening.load(std::memory_order_acquire); }

  // Number of connections currently being served.
  [[nodiscard]] uint32_t activeCount() const noexcept { return _activeConnections.load(std::memory_order_relaxed); }

  [[nodiscard]] ServerStats stats() const noexcept;

  [[nodiscard]] const HttpServerConfig& config() const noexcept { return _config; }

  [[nodiscard]] const Router& router() const noexcept { return _router; }

 private:
  // Increments the active connection count for its lifetime.
  class ActiveConnectionGuard {
   public:
    explicit ActiveConnectionGuard(HttpServer& server) noexcept;

    ActiveConnectionGuard(const ActiveConnectionGuard&) = delete;
    ActiveConnectionGuard& operator=(const ActiveConnectionGuard&) = delete;

    ~ActiveConnectionGuard();

   private:
    HttpServer& _server;
  };

  Task<void> acceptLoop();

  Task<Connection> acceptOne();

  Task<void> serveConnection(Connection connection, ConcurrencyLimiter::Permit permit);

  Task<void> handleExchange(SocketTransport& transport);

  Task<void> dispatch(const ParsedRequest& parsed, HttpResponse& response);

  HttpServerConfig _config;
  Socket _listenSocket;
  Router _router;

  std::atomic<uint64_t> _connectionsAccepted{0};
  std::atomic<uint64_t> _requestsServed{0};
  std::atomic<uint64_t> _timeouts{0};
  std::atomic<uint64_t> _parseFailures{0};
  std::atomic<uint64_t> _handlerFailures{0};
  std::atomic<uint32_t> _activeConnections{0};
  std::atomic<uint32_t> _maxActiveObserved{0};
  std::atomic<bool> _stopRequested{false};
  std::atomic<bool> _listening{false};
  bool _running{false};
  bool _shutdownDone{false};

  // Connection tasks reference the members above: they are destroyed first.
  ConcurrencyLimiter _limiter;
  Scheduler _scheduler;
};

}  // namespace tinyweb
