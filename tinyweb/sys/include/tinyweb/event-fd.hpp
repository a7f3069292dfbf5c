#pragma once

#include "tinyweb/base-fd.hpp"

namespace tinyweb {

// RAII eventfd (non-blocking, close-on-exec) used to wake up a blocking poll from another thread.
class EventFd {
 public:
  EventFd();

  // Send a wakeup event. Thread-safe.
  void send() const noexcept;

  // Drain pending wakeup events.
  void read() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace tinyweb
