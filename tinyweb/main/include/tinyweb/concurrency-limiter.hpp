#pragma once

#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <utility>

#include "tinyweb/scheduler.hpp"

namespace tinyweb {

// Counting semaphore of concurrency slots for tasks of one Scheduler.
// Slots are granted in request order: a released slot goes to the oldest waiter.
class ConcurrencyLimiter {
 public:
  class AcquireAwaiter;

  // Move-only ownership of one slot, released on destruction.
  class Permit {
   public:
    Permit() noexcept = default;

    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;

    Permit(Permit&& other) noexcept : _limiter(std::exchange(other._limiter, nullptr)) {}
    Permit& operator=(Permit&& other) noexcept {
      if (this != &other) {
        release();
        _limiter = std::exchange(other._limiter, nullptr);
      }
      return *this;
    }

    ~Permit() { release(); }

    explicit operator bool() const noexcept { return _limiter != nullptr; }

    void release() noexcept {
      if (_limiter != nullptr) {
        std::exchange(_limiter, nullptr)->release();
      }
    }

   private:
    friend class ConcurrencyLimiter;
    friend class ConcurrencyLimiter::AcquireAwaiter;

    explicit Permit(ConcurrencyLimiter* limiter) noexcept : _limiter(limiter) {}

    ConcurrencyLimiter* _limiter{nullptr};
  };

  class AcquireAwaiter {
   public:
    explicit AcquireAwaiter(ConcurrencyLimiter& limiter) noexcept : _limiter(limiter) {}

    AcquireAwaiter(const AcquireAwaiter&) = delete;
    AcquireAwaiter(AcquireAwaiter&&) = delete;
    AcquireAwaiter& operator=(const AcquireAwaiter&) = delete;
    AcquireAwaiter& operator=(AcquireAwaiter&&) = delete;

    ~AcquireAwaiter();

    bool await_ready() noexcept;

    bool await_suspend(std::coroutine_handle<> handle);

    // Throws TaskCancelled if the waiting task has been cancelled, releasing the slot it may have been granted.
    Permit await_resume();

   private:
    friend class ConcurrencyLimiter;

    ConcurrencyLimiter& _limiter;
    Scheduler::TaskState* _state{nullptr};
    bool _queued{false};
    bool _granted{false};
  };

  ConcurrencyLimiter(Scheduler& scheduler, uint32_t maxSlots) noexcept : _scheduler(scheduler), _maxSlots(maxSlots) {}

  ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
  ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

  // Awaitable returning a Permit, suspending the current task while all slots are taken.
  [[nodiscard]] AcquireAwaiter acquire() noexcept { return AcquireAwaiter(*this); }

  [[nodiscard]] uint32_t active() const noexcept { return _active; }

  [[nodiscard]] uint32_t maxSlots() const noexcept { return _maxSlots; }

  [[nodiscard]] std::size_t nbWaiters() const noexcept { return _waiters.size(); }

 private:
  void release() noexcept;

  void removeWaiter(AcquireAwaiter* waiter) noexcept;

  Scheduler& _scheduler;
  std::deque<AcquireAwaiter*> _waiters;
  uint32_t _maxSlots;
  uint32_t _active{0};
};

}  // namespace tinyweb
