#include "tinyweb/scheduler.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <chrono>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

#include "tinyweb/base-fd.hpp"
#include "tinyweb/task.hpp"
#include "tinyweb/timedef.hpp"

namespace tinyweb {

namespace {

using namespace std::chrono_literals;

struct Pipe {
  Pipe() {
    int fds[2];
    if (::pipe2(fds, O_NONBLOCK | O_CLOEXEC) != 0) {
      throw std::runtime_error("pipe2 failed");
    }
    readEnd = BaseFd(fds[0]);
    writeEnd = BaseFd(fds[1]);
  }

  BaseFd readEnd;
  BaseFd writeEnd;
};

struct Outcome {
  int steps{0};
  std::optional<CancelReason> cancelReason;
  bool finished{false};
};

Task<void> Increment(Outcome& outcome) {
  ++outcome.steps;
  outcome.finished = true;
  co_return;
}

Task<void> SleepThenFinish(Scheduler& scheduler, Outcome& outcome, SteadyClock::duration duration) {
  try {
    ++outcome.steps;
    co_await scheduler.sleep(duration);
    ++outcome.steps;
    outcome.finished = true;
  } catch (const TaskCancelled& ex) {
    outcome.cancelReason = ex.reason();
  }
}

Task<void> WaitReadable(Scheduler& scheduler, Outcome& outcome, int fd) {
  try {
    co_await scheduler.readable(fd);
    char ch{};
    if (::read(fd, &ch, 1) == 1) {
      ++outcome.steps;
    }
    outcome.finished = true;
  } catch (const TaskCancelled& ex) {
    outcome.cancelReason = ex.reason();
  }
}

Task<void> SleepAgainAfterCancellation(Scheduler& scheduler, Outcome& outcome) {
  try {
    co_await scheduler.sleep(1h);
  } catch (const TaskCancelled&) {
    ++outcome.steps;
  }
  try {
    co_await scheduler.sleep(1h);
  } catch (const TaskCancelled& ex) {
    ++outcome.steps;
    outcome.cancelReason = ex.reason();
  }
}

Task<void> ParkUntilWoken(Scheduler& scheduler, Outcome& outcome, std::optional<Scheduler::TaskState*>& parked) {
  struct ParkAwaiter {
    bool await_ready() const noexcept { return false; }
    bool await_suspend(std::coroutine_handle<> handle) { return scheduler.park(handle); }
    void await_resume() const { scheduler.throwIfCancelled(); }
    Scheduler& scheduler;
  };
  parked = &scheduler.current();
  co_await ParkAwaiter{scheduler};
  outcome.finished = true;
}

Task<void> Throwing() {
  throw std::runtime_error("handler bug");
  co_return;
}

void RunUntil(Scheduler& scheduler, const auto& pred, std::chrono::milliseconds maxDuration = 5s) {
  const auto limit = SteadyClock::now() + maxDuration;
  while (!pred() && SteadyClock::now() < limit) {
    scheduler.runOnce();
  }
}

}  // namespace

TEST(Scheduler, SpawnedTaskRunsAtNextRound) {
  Scheduler scheduler(10ms);
  Outcome outcome;
  scheduler.spawn(Increment(outcome));
  EXPECT_EQ(outcome.steps, 0);
  EXPECT_EQ(scheduler.nbTasks(), 1U);
  scheduler.runOnce();
  EXPECT_TRUE(outcome.finished);
  EXPECT_EQ(scheduler.nbTasks(), 0U);
}

TEST(Scheduler, SleepResumesAfterDuration) {
  Scheduler scheduler(500ms);
  Outcome outcome;
  const auto start = SteadyClock::now();
  scheduler.spawn(SleepThenFinish(scheduler, outcome, 30ms));
  RunUntil(scheduler, [&] { return outcome.finished; });
  EXPECT_TRUE(outcome.finished);
  EXPECT_EQ(outcome.steps, 2);
  EXPECT_GE(SteadyClock::now() - start, 30ms);
}

TEST(Scheduler, DeadlineCancelsWithTimeout) {
  Scheduler scheduler(500ms);
  Outcome outcome;
  auto& state = scheduler.spawn(SleepThenFinish(scheduler, outcome, 1h));
  scheduler.setDeadline(state, SteadyClock::now() + 20ms);
  RunUntil(scheduler, [&] { return scheduler.nbTasks() == 0; });
  EXPECT_FALSE(outcome.finished);
  EXPECT_EQ(outcome.cancelReason, CancelReason::Timeout);
}

TEST(Scheduler, ClearedDeadlineDoesNotFire) {
  Scheduler scheduler(500ms);
  Outcome outcome;
  auto& state = scheduler.spawn(SleepThenFinish(scheduler, outcome, 40ms));
  scheduler.setDeadline(state, SteadyClock::now() + 10ms);
  scheduler.clearDeadline(state);
  RunUntil(scheduler, [&] { return scheduler.nbTasks() == 0; });
  EXPECT_TRUE(outcome.finished);
  EXPECT_EQ(outcome.cancelReason, std::nullopt);
}

TEST(Scheduler, ReadableResumesOnData) {
  Scheduler scheduler(500ms);
  Pipe pipe;
  Outcome outcome;
  scheduler.spawn(WaitReadable(scheduler, outcome, pipe.readEnd.fd()));
  scheduler.runOnce();
  EXPECT_FALSE(outcome.finished);
  ASSERT_EQ(::write(pipe.writeEnd.fd(), "x", 1), 1);
  RunUntil(scheduler, [&] { return outcome.finished; });
  EXPECT_TRUE(outcome.finished);
  EXPECT_EQ(outcome.steps, 1);
}

TEST(Scheduler, CancelAllUnwindsParkedTasks) {
  Scheduler scheduler(500ms);
  Pipe pipe;
  std::vector<Outcome> outcomes(3);
  scheduler.spawn(WaitReadable(scheduler, outcomes[0], pipe.readEnd.fd()));
  scheduler.spawn(SleepThenFinish(scheduler, outcomes[1], 1h));
  scheduler.spawn(SleepThenFinish(scheduler, outcomes[2], 1h));
  scheduler.runOnce();
  EXPECT_EQ(scheduler.nbTasks(), 3U);

  scheduler.cancelAll(CancelReason::Shutdown);
  scheduler.drain();
  EXPECT_EQ(scheduler.nbTasks(), 0U);
  for (const Outcome& outcome : outcomes) {
    EXPECT_FALSE(outcome.finished);
    EXPECT_EQ(outcome.cancelReason, CancelReason::Shutdown);
  }

  // the fd has been unregistered and can be waited on again
  Outcome again;
  scheduler.spawn(WaitReadable(scheduler, again, pipe.readEnd.fd()));
  ASSERT_EQ(::write(pipe.writeEnd.fd(), "y", 1), 1);
  RunUntil(scheduler, [&] { return again.finished; });
  EXPECT_TRUE(again.finished);
}

TEST(Scheduler, CancelledTaskNeverParksAgain) {
  Scheduler scheduler(500ms);
  Outcome outcome;
  auto& state = scheduler.spawn(SleepAgainAfterCancellation(scheduler, outcome));
  scheduler.runOnce();
  scheduler.cancel(state, CancelReason::Timeout);
  EXPECT_TRUE(state.cancelled());
  scheduler.runOnce();
  EXPECT_EQ(scheduler.nbTasks(), 0U);
  EXPECT_EQ(outcome.steps, 2);
  EXPECT_EQ(outcome.cancelReason, CancelReason::Timeout);
}

TEST(Scheduler, ParkedTaskResumesOnWake) {
  Scheduler scheduler(10ms);
  Outcome outcome;
  std::optional<Scheduler::TaskState*> parked;
  scheduler.spawn(ParkUntilWoken(scheduler, outcome, parked));
  scheduler.runOnce();
  ASSERT_TRUE(parked);
  EXPECT_FALSE(outcome.finished);
  scheduler.runOnce();
  EXPECT_FALSE(outcome.finished);
  scheduler.wake(**parked);
  scheduler.runOnce();
  EXPECT_TRUE(outcome.finished);
}

TEST(Scheduler, FailingTaskIsReaped) {
  Scheduler scheduler(10ms);
  scheduler.spawn(Throwing());
  scheduler.runOnce();
  EXPECT_EQ(scheduler.nbTasks(), 0U);
}

TEST(Scheduler, CurrentOutsideOfTaskIsALogicError) {
  Scheduler scheduler;
  EXPECT_THROW(static_cast<void>(scheduler.current()), std::logic_error);
  EXPECT_THROW(scheduler.spawn(Task<void>{}), std::invalid_argument);
}

TEST(Scheduler, WakeupInterruptsBlockingPoll) {
  Scheduler scheduler(10s);
  Outcome outcome;
  scheduler.spawn(SleepThenFinish(scheduler, outcome, 1h));
  scheduler.runOnce();

  const auto start = SteadyClock::now();
  std::jthread waker([&scheduler] {
    std::this_thread::sleep_for(50ms);
    scheduler.wakeup();
  });
  scheduler.runOnce();
  EXPECT_LT(SteadyClock::now() - start, 5s);
  scheduler.cancelAll(CancelReason::Shutdown);
  scheduler.drain();
}

TEST(TaskCancelled, DescribesItsReason) {
  EXPECT_STREQ(TaskCancelled(CancelReason::Timeout).what(), "task cancelled: timeout");
  EXPECT_STREQ(TaskCancelled(CancelReason::Shutdown).what(), "task cancelled: shutdown");
}

}  // namespace tinyweb
