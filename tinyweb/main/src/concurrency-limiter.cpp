#include "tinyweb/concurrency-limiter.hpp"

#include <algorithm>
#include <coroutine>
#include <stdexcept>

#include "tinyweb/log.hpp"
#include "tinyweb/scheduler.hpp"

namespace tinyweb {

ConcurrencyLimiter::AcquireAwaiter::~AcquireAwaiter() {
  if (_queued) {
    _limiter.removeWaiter(this);
  }
  if (_granted) {
    // frame destroyed between grant and resumption
    _limiter.release();
  }
}

bool ConcurrencyLimiter::AcquireAwaiter::await_ready() noexcept {
  if (_limiter._active < _limiter._maxSlots && _limiter._waiters.empty()) {
    ++_limiter._active;
    _granted = true;
  }
  return _granted;
}

bool ConcurrencyLimiter::AcquireAwaiter::await_suspend(std::coroutine_handle<> handle) {
  _state = &_limiter._scheduler.current();
  if (!_limiter._scheduler.park(handle)) {
    return false;
  }
  _limiter._waiters.push_back(this);
  _queued = true;
  log::debug("Waiting for a concurrency slot ({} waiter(s))", _limiter._waiters.size());
  return true;
}

ConcurrencyLimiter::Permit ConcurrencyLimiter::AcquireAwaiter::await_resume() {
  if (_queued) {
    _limiter.removeWaiter(this);
    _queued = false;
  }
  if (_state != nullptr && _state->cancelled()) {
    if (_granted) {
      _granted = false;
      _limiter.release();
    }
    throw TaskCancelled(*_state->cancelReason());
  }
  if (!_granted) {
    throw std::logic_error("Concurrency slot waiter resumed without a slot");
  }
  _granted = false;
  return Permit(&_limiter);
}

void ConcurrencyLimiter::release() noexcept {
  if (!_waiters.empty()) {
    // the slot is handed over, the active count is unchanged
    AcquireAwaiter* waiter = _waiters.front();
    _waiters.pop_front();
    waiter->_queued = false;
    waiter->_granted = true;
    _scheduler.wake(*waiter->_state);
    return;
  }
  --_active;
}

void ConcurrencyLimiter::removeWaiter(AcquireAwaiter* waiter) noexcept {
  const auto it = std::ranges::find(_waiters, waiter);
  if (it != _waiters.end()) {
    _waiters.erase(it);
  }
}

}  // namespace tinyweb
