#include "tinyweb/scheduler.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <coroutine>
#include <exception>
#include <memory>
#include <stdexcept>
#include <utility>

#include "tinyweb/event-loop.hpp"
#include "tinyweb/event.hpp"
#include "tinyweb/log.hpp"
#include "tinyweb/task.hpp"
#include "tinyweb/timedef.hpp"

namespace tinyweb {

const char* TaskCancelled::what() const noexcept {
  return _reason == CancelReason::Timeout ? "task cancelled: timeout" : "task cancelled: shutdown";
}

bool Scheduler::IoAwaiter::await_suspend(std::coroutine_handle<> handle) {
  _state = &_scheduler.current();
  if (_state->cancelled()) {
    return false;
  }
  if (!_scheduler._eventLoop.add(EventLoop::Event{_fd, _events})) {
    throw std::runtime_error(fmt::format("Unable to watch fd # {}", _fd));
  }
  _state->_wait = TaskState::Wait::Io;
  _state->_fd = _fd;
  _state->_parked = handle;
  _scheduler._fdWaiters[_fd] = _state;
  return true;
}

void Scheduler::IoAwaiter::await_resume() const {
  if (_state->cancelled()) {
    throw TaskCancelled(*_state->_cancelReason);
  }
}

bool Scheduler::SleepAwaiter::await_suspend(std::coroutine_handle<> handle) {
  _state = &_scheduler.current();
  if (_state->cancelled()) {
    return false;
  }
  _state->_wait = TaskState::Wait::Sleep;
  _state->_wakeAt = _wakeAt;
  _state->_parked = handle;
  return true;
}

void Scheduler::SleepAwaiter::await_resume() const {
  if (_state->cancelled()) {
    throw TaskCancelled(*_state->_cancelReason);
  }
}

Scheduler::Scheduler(std::chrono::milliseconds pollInterval) : _pollInterval(pollInterval) {
  _eventLoop.addOrThrow(EventLoop::Event{_wakeupFd.fd(), EventIn});
}

Scheduler::~Scheduler() {
  // destroying frames releases their resources, which may try to wake other tasks
  _closing = true;
  _ready.clear();
  _fdWaiters.clear();
  _tasks.clear();
}

Scheduler::TaskState& Scheduler::spawn(Task<void> task) {
  if (!task.valid()) {
    throw std::invalid_argument("Cannot spawn an empty task");
  }
  TaskState& state = *_tasks.emplace_back(std::make_unique<TaskState>(TaskState::Key{}, std::move(task)));
  enqueue(state);
  return state;
}

Scheduler::TaskState& Scheduler::current() const {
  if (_current == nullptr) {
    throw std::logic_error("No task is running");
  }
  return *_current;
}

bool Scheduler::park(std::coroutine_handle<> handle) {
  TaskState& state = current();
  if (state.cancelled()) {
    return false;
  }
  state._wait = TaskState::Wait::External;
  state._parked = handle;
  return true;
}

void Scheduler::wake(TaskState& state) noexcept {
  if (_closing || !state._parked) {
    return;
  }
  state._wait = TaskState::Wait::None;
  enqueue(state);
}

void Scheduler::throwIfCancelled() const {
  const TaskState& state = current();
  if (state.cancelled()) {
    throw TaskCancelled(*state._cancelReason);
  }
}

void Scheduler::cancel(TaskState& state, CancelReason reason) noexcept {
  if (state.done() || state.cancelled()) {
    return;
  }
  state._cancelReason = reason;
  if (state._wait == TaskState::Wait::Io) {
    unregisterIo(state);
  }
  if (state._wait != TaskState::Wait::None) {
    state._wait = TaskState::Wait::None;
    state._wakeAt = SteadyTimePoint::max();
    enqueue(state);
  }
}

void Scheduler::cancelAll(CancelReason reason) noexcept {
  for (auto& state : _tasks) {
    cancel(*state, reason);
  }
}

void Scheduler::enqueue(TaskState& state) noexcept {
  if (!state._queued) {
    state._queued = true;
    _ready.push_back(&state);
  }
}

void Scheduler::unregisterIo(TaskState& state) noexcept {
  _eventLoop.del(state._fd);
  _fdWaiters.erase(state._fd);
  state._fd = -1;
}

void Scheduler::resumeReady() {
  while (!_ready.empty()) {
    TaskState& state = *_ready.front();
    _ready.pop_front();
    state._queued = false;
    if (!state._parked) {
      continue;
    }
    state._wait = TaskState::Wait::None;
    _current = &state;
    std::exchange(state._parked, {}).resume();
    _current = nullptr;
  }
}

void Scheduler::fireTimers(SteadyTimePoint now) noexcept {
  for (auto& statePtr : _tasks) {
    TaskState& state = *statePtr;
    if (state._wait == TaskState::Wait::Sleep && state._wakeAt <= now) {
      state._wakeAt = SteadyTimePoint::max();
      state._wait = TaskState::Wait::None;
      enqueue(state);
    }
    if (state._deadline <= now) {
      state._deadline = SteadyTimePoint::max();
      log::debug("Task deadline reached");
      cancel(state, CancelReason::Timeout);
    }
  }
}

std::chrono::milliseconds Scheduler::computePollTimeout() const noexcept {
  if (!_ready.empty()) {
    return std::chrono::milliseconds{0};
  }
  SteadyTimePoint nearest = SteadyTimePoint::max();
  for (const auto& state : _tasks) {
    if (state->_wait == TaskState::Wait::Sleep) {
      nearest = std::min(nearest, state->_wakeAt);
    }
    if (!state->cancelled()) {
      nearest = std::min(nearest, state->_deadline);
    }
  }
  if (nearest == SteadyTimePoint::max()) {
    return _pollInterval;
  }
  const auto now = SteadyClock::now();
  if (nearest <= now) {
    return std::chrono::milliseconds{0};
  }
  return std::min(_pollInterval, std::chrono::ceil<std::chrono::milliseconds>(nearest - now));
}

void Scheduler::reapFinished() {
  std::erase_if(_tasks, [](const std::unique_ptr<TaskState>& state) {
    if (!state->done()) {
      return false;
    }
    try {
      state->_task.result();
    } catch (const TaskCancelled& ex) {
      log::debug("Task ended by cancellation ({})", ex.what());
    } catch (const std::exception& ex) {
      log::error("Task ended with an exception: {}", ex.what());
    }
    return true;
  });
}

void Scheduler::runOnce() {
  resumeReady();

  for (const EventLoop::Event& event : _eventLoop.poll(computePollTimeout())) {
    if (event.fd == _wakeupFd.fd()) {
      _wakeupFd.read();
      continue;
    }
    const auto it = _fdWaiters.find(event.fd);
    if (it == _fdWaiters.end()) {
      continue;
    }
    TaskState& state = *it->second;
    unregisterIo(state);
    state._wait = TaskState::Wait::None;
    enqueue(state);
  }

  fireTimers(SteadyClock::now());
  resumeReady();
  reapFinished();
}

void Scheduler::drain() {
  while (!_tasks.empty()) {
    runOnce();
  }
}

}  // namespace tinyweb
