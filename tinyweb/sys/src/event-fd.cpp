#include "tinyweb/event-fd.hpp"

#include <sys/eventfd.h>

#include <cerrno>
#include <cstring>

#include "tinyweb/errno-throw.hpp"
#include "tinyweb/log.hpp"

namespace tinyweb {

EventFd::EventFd() : _baseFd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new EventFd");
  }
  log::debug("EventFd fd # {} opened", fd());
}

void EventFd::send() const noexcept {
  if (::eventfd_write(fd(), 1) == -1) {
    const auto savedErr = errno;
    if (savedErr != EAGAIN) {
      log::error("Event fd send failed err={}: {}", savedErr, std::strerror(savedErr));
    }
  }
}

void EventFd::read() const noexcept {
  eventfd_t counterValue;
  if (::eventfd_read(fd(), &counterValue) == -1) {
    const auto savedErr = errno;
    if (savedErr != EAGAIN) {
      log::error("Event fd read failed err={}: {}", savedErr, std::strerror(savedErr));
    }
  }
}

}  // namespace tinyweb
