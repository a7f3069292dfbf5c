#include "tinyweb/http-server.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "tinyweb/concurrency-limiter.hpp"
#include "tinyweb/connection.hpp"
#include "tinyweb/http-constants.hpp"
#include "tinyweb/http-error.hpp"
#include "tinyweb/http-method.hpp"
#include "tinyweb/http-response.hpp"
#include "tinyweb/http-server-config.hpp"
#include "tinyweb/http-status-code.hpp"
#include "tinyweb/log.hpp"
#include "tinyweb/request-parser.hpp"
#include "tinyweb/resource.hpp"
#include "tinyweb/router.hpp"
#include "tinyweb/scheduler.hpp"
#include "tinyweb/server-stats.hpp"
#include "tinyweb/signal-handler.hpp"
#include "tinyweb/socket-ops.hpp"
#include "tinyweb/socket-transport.hpp"
#include "tinyweb/socket.hpp"
#include "tinyweb/stream-reader.hpp"
#include "tinyweb/task.hpp"
#include "tinyweb/timedef.hpp"

namespace tinyweb {

namespace {

// Delay before accepting again after a resource error (for instance EMFILE).
constexpr std::chrono::milliseconds kAcceptRetryDelay{100};

}  // namespace

HttpServer::HttpServer(HttpServerConfig config)
    : _config(std::move(config)),
      _listenSocket(Socket::Type::StreamNonBlock),
      _limiter(_scheduler, _config.maxConcurrency),
      _scheduler(_config.pollInterval) {
  _config.validate();
  _listenSocket.bindAndListen(_config.bindAddress, _config.port, _config.backlog, _config.reusePort);
  _listening.store(true, std::memory_order_release);
  log::info("Server listening on {}:{} (max concurrency {}, backlog {})", _config.bindAddress, _config.port,
            _config.maxConcurrency, _config.backlog);
}

HttpServer::~HttpServer() {
  if (_running) {
    log::critical("HttpServer destroyed while running");
  }
  shutdown();
}

HttpServer::ActiveConnectionGuard::ActiveConnectionGuard(HttpServer& server) noexcept : _server(server) {
  const uint32_t active = _server._activeConnections.fetch_add(1, std::memory_order_relaxed) + 1U;
  if (active > _server._maxActiveObserved.load(std::memory_order_relaxed)) {
    _server._maxActiveObserved.store(active, std::memory_order_relaxed);
  }
}

HttpServer::ActiveConnectionGuard::~ActiveConnectionGuard() {
  _server._activeConnections.fetch_sub(1, std::memory_order_relaxed);
}

void HttpServer::run() { runUntil({}); }

void HttpServer::runUntil(const std::function<bool()>& predicate) {
  if (_shutdownDone) {
    throw std::logic_error("Server has been shut down");
  }
  if (_running) {
    throw std::logic_error("Server is already running");
  }
  _running = true;
  _router.freeze();
  _scheduler.spawn(acceptLoop());

  while (!_stopRequested.load(std::memory_order_acquire) && !SignalHandler::IsStopRequested() &&
         !(predicate && predicate())) {
    _scheduler.runOnce();
  }

  shutdown();
  _running = false;
}

void HttpServer::stop() noexcept {
  _stopRequested.store(true, std::memory_order_release);
  _scheduler.wakeup();
}

void HttpServer::shutdown() {
  if (_shutdownDone) {
    return;
  }
  _shutdownDone = true;
  _stopRequested.store(true, std::memory_order_release);
  log::info("Shutting down server on port {} ({} active connection(s))", _config.port, activeCount());

  // the accept loop is cancelled with the connection tasks, before its fd is closed
  _scheduler.cancelAll(CancelReason::Shutdown);
  _listenSocket.close();
  _listening.store(false, std::memory_order_release);
  _scheduler.drain();

  log::info("Server stopped, {} request(s) served", _requestsServed.load(std::memory_order_relaxed));
}

ServerStats HttpServer::stats() const noexcept {
  ServerStats ret;
  ret.connectionsAccepted = _connectionsAccepted.load(std::memory_order_relaxed);
  ret.requestsServed = _requestsServed.load(std::memory_order_relaxed);
  ret.timeouts = _timeouts.load(std::memory_order_relaxed);
  ret.parseFailures = _parseFailures.load(std::memory_order_relaxed);
  ret.handlerFailures = _handlerFailures.load(std::memory_order_relaxed);
  ret.activeConnections = _activeConnections.load(std::memory_order_relaxed);
  ret.maxActiveObserved = _maxActiveObserved.load(std::memory_order_relaxed);
  return ret;
}

Task<void> HttpServer::acceptLoop() {
  while (true) {
    _scheduler.throwIfCancelled();
    // a slot is reserved before accepting: extra connections stay in the kernel backlog
    ConcurrencyLimiter::Permit permit = co_await _limiter.acquire();
    Connection connection = co_await acceptOne();
    if (_config.tcpNoDelay && !SetTcpNoDelay(connection.fd())) {
      log::warn("Unable to set TCP_NODELAY on fd # {}", connection.fd());
    }
    _connectionsAccepted.fetch_add(1, std::memory_order_relaxed);
    _scheduler.spawn(serveConnection(std::move(connection), std::move(permit)));
  }
}

Task<Connection> HttpServer::acceptOne() {
  while (true) {
    Connection connection(_listenSocket);
    if (connection) {
      co_return std::move(connection);
    }
    const int err = errno;
    if (err == EAGAIN || err == EWOULDBLOCK) {
      co_await _scheduler.readable(_listenSocket.fd());
    } else if (err != EINTR && err != ECONNABORTED) {
      co_await _scheduler.sleep(kAcceptRetryDelay);
    }
  }
}

Task<void> HttpServer::serveConnection(Connection connection, ConcurrencyLimiter::Permit permit) {
  // the slot is released when the task completes, on every path
  ConcurrencyLimiter::Permit slot = std::move(permit);
  ActiveConnectionGuard activeGuard(*this);
  SocketTransport transport(_scheduler, std::move(connection));
  try {
    co_await handleExchange(transport);
    transport.shutdownWrite();
  } catch (const TaskCancelled& ex) {
    if (ex.reason() == CancelReason::Timeout) {
      _timeouts.fetch_add(1, std::memory_order_relaxed);
      log::warn("Request timeout on fd # {}, closing connection", transport.fd());
    } else {
      log::debug("Connection fd # {} cancelled by shutdown", transport.fd());
    }
  } catch (const HttpError& ex) {
    log::debug("Connection fd # {} aborted: {}", transport.fd(), ex.what());
  } catch (const std::exception& ex) {
    log::error("Unexpected error on fd # {}: {}", transport.fd(), ex.what());
  }
  log::debug("Connection fd # {} closed", transport.fd());
}

Task<void> HttpServer::handleExchange(SocketTransport& transport) {
  Scheduler::TaskState& task = _scheduler.current();
  StreamReader reader(transport, _config.maxLineLength);
  RequestParser parser(reader, _router);
  HttpResponse response(transport, HttpResponse::Options{_config.debug, _config.sendFileChunkSize});

  _scheduler.setDeadline(task, SteadyClock::now() + _config.requestTimeout);
  std::optional<ParsedRequest> parsed;
  std::optional<HttpError> parseError;
  try {
    parsed.emplace(co_await parser.parse());
  } catch (const HttpError& ex) {
    if (ex.kind() == ErrorKind::IOError) {
      throw;
    }
    parseError.emplace(ex);
  }
  _scheduler.clearDeadline(task);

  if (parseError) {
    _parseFailures.fetch_add(1, std::memory_order_relaxed);
    log::warn("Request rejected on fd # {} ({}): {}", transport.fd(), ErrorKindToStr(parseError->kind()),
              parseError->what());
    co_await response.error(parseError->statusCode(), parseError->what());
  } else {
    co_await dispatch(*parsed, response);
  }
  _requestsServed.fetch_add(1, std::memory_order_relaxed);
}

Task<void> HttpServer::dispatch(const ParsedRequest& parsed, HttpResponse& response) {
  const Route& route = *parsed.route;
  const HttpRequest& request = parsed.request;
  response.bindRoute(route.config);
  log::debug("{} {} dispatched to route {}", http::MethodToStr(request.method()), request.path(), route.pattern);

  http::StatusCode failureStatus = 0;
  std::string failureReason;
  try {
    if (parsed.preflight) {
      response.addAccessControlHeaders().setHeader(http::ContentLength, "0");
      co_await response.start({});
    } else if (route.isResource()) {
      co_await DispatchResource(route.resource, request, response);
    } else {
      co_await route.handler(request, response);
    }
    if (!response.started()) {
      co_await response.start();
    }
  } catch (const TaskCancelled&) {
    throw;
  } catch (const HttpError& ex) {
    if (ex.kind() == ErrorKind::IOError) {
      throw;
    }
    failureStatus = ex.statusCode();
    failureReason = ex.what();
  } catch (const std::exception& ex) {
    failureStatus = http::StatusCodeInternalServerError;
    failureReason = ex.what();
  }

  if (failureStatus != 0) {
    _handlerFailures.fetch_add(1, std::memory_order_relaxed);
    if (response.started()) {
      log::error("Handler of {} failed after the response started: {}", route.pattern, failureReason);
    } else {
      log::error("Handler of {} failed with status {}: {}", route.pattern, failureStatus, failureReason);
      co_await response.error(failureStatus, failureReason);
    }
  }
  response.markDone();
}

}  // namespace tinyweb
