#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <vector>

namespace loom {

/**
 * Event-loop primitives the scheduler runs on.
 *
 * postMessage queues a callback for the next turn of the host loop with no
 * added latency. setTimeout arms a one-shot timer. All calls happen on the
 * host loop's thread.
 */
class SchedulerHost {
public:
  using Message = std::function<void()>;
  using TimeoutId = std::uint64_t;

  virtual ~SchedulerHost() = default;

  virtual double now() const = 0;
  virtual void postMessage(Message message) = 0;
  virtual TimeoutId setTimeout(Message callback, double delayMs) = 0;
  virtual void clearTimeout(TimeoutId id) = 0;
};

/**
 * Single-threaded host loop backed by std::chrono::steady_clock.
 *
 * Each turn fires the timers that are due, then runs one posted message.
 * Exceptions thrown by a message or timer propagate out of runOnce/run.
 */
class MessageLoopHost : public SchedulerHost {
public:
  MessageLoopHost();

  double now() const override;
  void postMessage(Message message) override;
  TimeoutId setTimeout(Message callback, double delayMs) override;
  void clearTimeout(TimeoutId id) override;

  bool runOnce();
  void run();

  bool hasPendingWork() const;

private:
  struct Timer {
    TimeoutId id{0};
    double dueTime{0.0};
    Message callback{};
  };

  bool fireDueTimers(double currentTime);

  std::chrono::steady_clock::time_point baseTime_;
  std::deque<Message> messages_{};
  std::vector<Timer> timers_{};
  TimeoutId nextTimeoutId_{1};
};

/**
 * Virtual-time host. Time only moves through advanceTime/flushAll, which
 * makes scheduling deterministic for tests and simulations.
 */
class MockSchedulerHost : public SchedulerHost {
public:
  MockSchedulerHost() = default;
  explicit MockSchedulerHost(double startTime);

  double now() const override;
  void postMessage(Message message) override;
  TimeoutId setTimeout(Message callback, double delayMs) override;
  void clearTimeout(TimeoutId id) override;

  // Moves the clock forward and fires every timer that became due.
  void advanceTime(double ms);

  bool flushMessage();
  void flushMessages();

  // Runs messages and timers until both queues are empty, jumping the clock
  // to each pending timer.
  void flushAll();

  std::size_t pendingMessageCount() const;
  std::size_t pendingTimerCount() const;
  double nextTimerDueTime() const;

private:
  struct Timer {
    TimeoutId id{0};
    double dueTime{0.0};
    Message callback{};
  };

  bool fireNextDueTimer();

  double currentTime_{0.0};
  std::deque<Message> messages_{};
  std::vector<Timer> timers_{};
  TimeoutId nextTimeoutId_{1};
};

} // namespace loom
