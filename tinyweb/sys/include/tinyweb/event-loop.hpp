#pragma once

#include <sys/epoll.h>

#include <chrono>
#include <cstdint>
#include <span>
#include <vector>

#include "tinyweb/base-fd.hpp"
#include "tinyweb/event.hpp"

namespace tinyweb {

// Thin RAII wrapper over epoll.
//  * The event buffer starts with kInitialCapacity slots and doubles when a poll saturates it. It never shrinks.
//  * add() returns success/failure and log details on failure; caller decides the policy.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 16;

  struct Event {
    int fd;
    EventBmp eventBmp;
  };

  explicit EventLoop(uint32_t initialCapacity = kInitialCapacity);

  // Register fd with given events. Throws std::system_error on failure.
  void addOrThrow(Event event) const;

  // Register fd with given events. Returns false on failure (logged).
  [[nodiscard]] bool add(Event event) const;

  // Delete fd from monitoring. Failures are logged at debug level.
  void del(int fd) const;

  // Waits up to timeout for ready events.
  // Returns a span over an internal reusable buffer, valid until the next call.
  // Empty on timeout or when interrupted by a signal.
  [[nodiscard]] std::span<const Event> poll(std::chrono::milliseconds timeout);

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_epollEvents.size()); }

 private:
  BaseFd _baseFd;
  std::vector<epoll_event> _epollEvents;
  std::vector<Event> _readyEvents;
};

}  // namespace tinyweb
