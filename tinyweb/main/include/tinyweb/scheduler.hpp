#pragma once

#include <chrono>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tinyweb/event-fd.hpp"
#include "tinyweb/event-loop.hpp"
#include "tinyweb/event.hpp"
#include "tinyweb/task.hpp"
#include "tinyweb/timedef.hpp"

namespace tinyweb {

enum class CancelReason : uint8_t { Timeout, Shutdown };

// Thrown from the suspension point of a cancelled task. It unwinds the whole task.
class TaskCancelled : public std::exception {
 public:
  explicit TaskCancelled(CancelReason reason) noexcept : _reason(reason) {}

  [[nodiscard]] const char* what() const noexcept override;

  [[nodiscard]] CancelReason reason() const noexcept { return _reason; }

 private:
  CancelReason _reason;
};

// Single threaded cooperative scheduler of root tasks.
// Tasks only suspend on fd readiness (readable / writable), timers (sleep) or an explicit park, and are resumed
// from runOnce(). Once cancelled, a task never parks again: its current and next suspension points throw
// TaskCancelled.
class Scheduler {
 public:
  class IoAwaiter;
  class SleepAwaiter;

  class TaskState {
    class Key {
      friend class Scheduler;
      Key() = default;
    };

   public:
    // Only constructible by the Scheduler, through spawn().
    TaskState(Key /*key*/, Task<void> task) noexcept : _task(std::move(task)), _parked(_task.handle()) {}

    [[nodiscard]] bool done() const noexcept { return _task.done(); }

    [[nodiscard]] bool cancelled() const noexcept { return _cancelReason.has_value(); }

    [[nodiscard]] std::optional<CancelReason> cancelReason() const noexcept { return _cancelReason; }

    [[nodiscard]] SteadyTimePoint deadline() const noexcept { return _deadline; }

   private:
    friend class Scheduler;
    friend class Scheduler::IoAwaiter;
    friend class Scheduler::SleepAwaiter;

    enum class Wait : uint8_t { None, Io, Sleep, External };

    Task<void> _task;
    std::coroutine_handle<> _parked;
    SteadyTimePoint _wakeAt{SteadyTimePoint::max()};
    SteadyTimePoint _deadline{SteadyTimePoint::max()};
    std::optional<CancelReason> _cancelReason;
    int _fd{-1};
    Wait _wait{Wait::None};
    bool _queued{false};
  };

  class IoAwaiter {
   public:
    IoAwaiter(Scheduler& scheduler, int fd, EventBmp events) noexcept
        : _scheduler(scheduler), _fd(fd), _events(events) {}

    [[nodiscard]] bool await_ready() const noexcept { return false; }

    bool await_suspend(std::coroutine_handle<> handle);

    void await_resume() const;

   private:
    Scheduler& _scheduler;
    TaskState* _state{nullptr};
    int _fd;
    EventBmp _events;
  };

  class SleepAwaiter {
   public:
    SleepAwaiter(Scheduler& scheduler, SteadyTimePoint wakeAt) noexcept : _scheduler(scheduler), _wakeAt(wakeAt) {}

    [[nodiscard]] bool await_ready() const noexcept { return false; }

    bool await_suspend(std::coroutine_handle<> handle);

    void await_resume() const;

   private:
    Scheduler& _scheduler;
    TaskState* _state{nullptr};
    SteadyTimePoint _wakeAt;
  };

  explicit Scheduler(std::chrono::milliseconds pollInterval = std::chrono::milliseconds{500});

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;
  Scheduler(Scheduler&&) = delete;
  Scheduler& operator=(Scheduler&&) = delete;

  // Destroys the frames of unfinished tasks.
  ~Scheduler();

  // Registers a root task, first resumed at the next runOnce(). The state lives until the task completes.
  TaskState& spawn(Task<void> task);

  // Suspends the current task until fd is readable (or in error).
  IoAwaiter readable(int fd) noexcept { return {*this, fd, EventIn | EventRdHup}; }

  // Suspends the current task until fd is writable (or in error).
  IoAwaiter writable(int fd) noexcept { return {*this, fd, EventOut}; }

  SleepAwaiter sleep(SteadyClock::duration duration) noexcept { return {*this, SteadyClock::now() + duration}; }

  SleepAwaiter sleepUntil(SteadyTimePoint wakeAt) noexcept { return {*this, wakeAt}; }

  // State of the running task. Throws std::logic_error outside of a task.
  [[nodiscard]] TaskState& current() const;

  // Parks the current task, whose handle is given, until wake() is called on it.
  // Returns false, without parking, if the task is cancelled.
  [[nodiscard]] bool park(std::coroutine_handle<> handle);

  // Makes a parked task ready.
  void wake(TaskState& state) noexcept;

  // Throws TaskCancelled if the current task is cancelled.
  void throwIfCancelled() const;

  // The task is cancelled with CancelReason::Timeout when the time point is reached.
  void setDeadline(TaskState& state, SteadyTimePoint deadline) noexcept { state._deadline = deadline; }

  void clearDeadline(TaskState& state) noexcept { state._deadline = SteadyTimePoint::max(); }

  // Cancels a task. A parked task is made ready to observe the cancellation. No effect on a cancelled task.
  void cancel(TaskState& state, CancelReason reason) noexcept;

  void cancelAll(CancelReason reason) noexcept;

  // Runs one scheduling round: ready tasks, I/O readiness and timers. Blocks at most the poll interval.
  void runOnce();

  // Runs until all tasks completed.
  void drain();

  // Interrupts a blocking runOnce(). Thread-safe.
  void wakeup() const noexcept { _wakeupFd.send(); }

  [[nodiscard]] std::size_t nbTasks() const noexcept { return _tasks.size(); }

 private:
  void enqueue(TaskState& state) noexcept;

  // Removes the fd registration of a task waiting for I/O.
  void unregisterIo(TaskState& state) noexcept;

  void resumeReady();

  void fireTimers(SteadyTimePoint now) noexcept;

  [[nodiscard]] std::chrono::milliseconds computePollTimeout() const noexcept;

  void reapFinished();

  EventLoop _eventLoop;
  EventFd _wakeupFd;
  std::chrono::milliseconds _pollInterval;
  std::vector<std::unique_ptr<TaskState>> _tasks;
  std::deque<TaskState*> _ready;
  std::unordered_map<int, TaskState*> _fdWaiters;
  TaskState* _current{nullptr};
  bool _closing{false};
};

}  // namespace tinyweb
