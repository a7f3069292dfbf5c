#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <optional>
#include <stdexcept>
#include <utility>

namespace tinyweb {

template <class T>
class Task;

namespace detail {

struct TaskPromiseBase {
  std::suspend_always initial_suspend() noexcept { return {}; }

  void unhandled_exception() noexcept { _exception = std::current_exception(); }

  void rethrowIfFailed() const {
    if (_exception) {
      std::rethrow_exception(_exception);
    }
  }

  // Coroutine awaiting this one, resumed when this one completes.
  std::coroutine_handle<> _continuation;
  std::exception_ptr _exception;
};

template <class Promise>
struct FinalAwaiter {
  [[nodiscard]] bool await_ready() const noexcept { return false; }

  std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> handle) noexcept {
    if (auto continuation = handle.promise()._continuation) {
      return continuation;
    }
    return std::noop_coroutine();
  }

  void await_resume() const noexcept {}
};

template <class T>
struct TaskPromise : TaskPromiseBase {
  template <class U>
    requires std::convertible_to<U, T>
  void return_value(U&& value) {
    _value.emplace(std::forward<U>(value));
  }

  T consumeResult() {
    rethrowIfFailed();
    return std::move(*_value);
  }

  std::optional<T> _value;
};

template <>
struct TaskPromise<void> : TaskPromiseBase {
  void return_void() const noexcept {}

  void consumeResult() const { rethrowIfFailed(); }
};

}  // namespace detail

// Lazy coroutine task. It does not start until awaited (or resumed by the Scheduler when spawned as a root task).
// Awaiting a Task resumes the awaiter once the Task completes (symmetric transfer), rethrowing its exception if any.
// Destroying a Task destroys its coroutine frame, running the destructors of its live locals.
template <class T = void>
class Task {
 public:
  struct promise_type : detail::TaskPromise<T> {
    Task get_return_object() noexcept { return Task{std::coroutine_handle<promise_type>::from_promise(*this)}; }

    detail::FinalAwaiter<promise_type> final_suspend() noexcept { return {}; }
  };

  Task() noexcept = default;
  explicit Task(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  Task(Task&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  Task& operator=(Task&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  ~Task() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  [[nodiscard]] std::coroutine_handle<> handle() const noexcept { return _coro; }

  // Returns the value (or rethrows the exception) of a completed Task.
  T result() {
    if (!_coro || !_coro.done()) {
      throw std::logic_error("Task result requested before completion");
    }
    return _coro.promise().consumeResult();
  }

  // Drives a Task that completes without parking on an external event (in-memory I/O for instance).
  // Throws std::logic_error if the Task suspended waiting for the Scheduler.
  T runSynchronously() {
    if (_coro && !_coro.done()) {
      _coro.resume();
    }
    return result();
  }

  void reset() noexcept {
    if (_coro) {
      _coro.destroy();
      _coro = {};
    }
  }

  auto operator co_await() && noexcept {
    struct Awaiter {
      [[nodiscard]] bool await_ready() const noexcept { return !coro || coro.done(); }

      std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept {
        coro.promise()._continuation = awaiting;
        return coro;
      }

      T await_resume() {
        if (!coro) {
          throw std::logic_error("Awaiting an empty Task");
        }
        return coro.promise().consumeResult();
      }

      std::coroutine_handle<promise_type> coro;
    };
    return Awaiter{_coro};
  }

 private:
  std::coroutine_handle<promise_type> _coro;
};

}  // namespace tinyweb
