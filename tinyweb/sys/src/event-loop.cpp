#include "tinyweb/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <utility>

#include "tinyweb/errno-throw.hpp"
#include "tinyweb/event.hpp"
#include "tinyweb/log.hpp"

namespace tinyweb {

static_assert(EventIn == EPOLLIN, "EventIn value mismatch");
static_assert(EventOut == EPOLLOUT, "EventOut value mismatch");
static_assert(EventErr == EPOLLERR, "EventErr value mismatch");
static_assert(EventHup == EPOLLHUP, "EventHup value mismatch");
static_assert(EventRdHup == EPOLLRDHUP, "EventRdHup value mismatch");

EventLoop::EventLoop(uint32_t initialCapacity)
    : _baseFd(::epoll_create1(EPOLL_CLOEXEC)), _epollEvents(std::max(1U, initialCapacity)) {
  if (!_baseFd) {
    throw_errno("epoll_create1 failed");
  }
  _readyEvents.reserve(_epollEvents.size());
  log::debug("EventLoop fd # {} opened", _baseFd.fd());
}

void EventLoop::addOrThrow(Event event) const {
  if (!add(event)) [[unlikely]] {
    throw_errno("epoll_ctl ADD failed (fd # {}, events=0x{:x})", event.fd, event.eventBmp);
  }
}

bool EventLoop::add(Event event) const {
  epoll_event ev{event.eventBmp, epoll_data_t{.fd = event.fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, event.fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    log::error("epoll_ctl ADD failed (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp, err,
               std::strerror(err));
    errno = err;
    return false;
  }
  return true;
}

void EventLoop::del(int fd) const {
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) [[unlikely]] {
    // Benign if the fd was already closed.
    const auto err = errno;
    log::debug("epoll_ctl DEL failed (fd # {}, errno={}, msg={})", fd, err, std::strerror(err));
  }
}

std::span<const EventLoop::Event> EventLoop::poll(std::chrono::milliseconds timeout) {
  const int nbReadyFds = ::epoll_wait(_baseFd.fd(), _epollEvents.data(), static_cast<int>(_epollEvents.size()),
                                      static_cast<int>(std::max(timeout.count(), std::chrono::milliseconds::rep{0})));
  _readyEvents.clear();
  if (nbReadyFds == -1) {
    if (errno != EINTR) {
      const auto err = errno;
      log::error("epoll_wait failed (timeout_ms={}, errno={}, msg={})", timeout.count(), err, std::strerror(err));
    }
    return _readyEvents;
  }

  for (int idx = 0; idx < nbReadyFds; ++idx) {
    const auto& ev = _epollEvents[static_cast<std::size_t>(idx)];
    _readyEvents.push_back(Event{ev.data.fd, static_cast<EventBmp>(ev.events)});
  }

  if (std::cmp_equal(nbReadyFds, _epollEvents.size())) {
    _epollEvents.resize(_epollEvents.size() * 2U);
  }
  return _readyEvents;
}

}  // namespace tinyweb
