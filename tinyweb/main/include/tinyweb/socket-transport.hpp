#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <utility>

#include "tinyweb/connection.hpp"
#include "tinyweb/scheduler.hpp"
#include "tinyweb/task.hpp"
#include "tinyweb/transport.hpp"

namespace tinyweb {

// Transport over an accepted non-blocking connection, parking the calling task on EAGAIN.
// It owns the connection: destroying it closes the socket.
class SocketTransport : public ITransport {
 public:
  SocketTransport(Scheduler& scheduler, Connection connection) noexcept
      : _scheduler(scheduler), _connection(std::move(connection)) {}

  Task<std::size_t> read(std::span<char> buf) override;

  Task<void> write(std::string_view data) override;

  // Signals the end of the response to the peer.
  void shutdownWrite() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _connection.fd(); }

 private:
  Scheduler& _scheduler;
  Connection _connection;
};

}  // namespace tinyweb
