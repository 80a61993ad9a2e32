#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

namespace loom {

enum class SchedulerPriority : std::uint8_t {
  NoPriority = 0,
  ImmediatePriority = 1,
  UserBlockingPriority = 2,
  NormalPriority = 3,
  LowPriority = 4,
  IdlePriority = 5,
};

struct TaskHandle {
  std::uint64_t id{0};

  explicit operator bool() const {
    return id != 0;
  }

  bool operator==(const TaskHandle& other) const {
    return id == other.id;
  }

  bool operator!=(const TaskHandle& other) const {
    return id != other.id;
  }
};

struct TaskOptions {
  double delayMs{0.0};
  // Overrides the priority timeout when set; 0 expires the task at once.
  std::optional<double> timeoutMs{};
};

struct TaskResult;

// Invoked with didTimeout == true when the task's expiration time has passed.
using TaskCallback = std::function<TaskResult(bool)>;

/**
 * Outcome of one task callback invocation.
 *
 * Done finishes the task. Continue keeps the task in the queue (same id,
 * same expiration) and replaces its callback with `continuation`.
 */
struct TaskResult {
  enum class Kind : std::uint8_t {
    Done,
    Continue,
  };

  Kind kind{Kind::Done};
  TaskCallback continuation{};

  static TaskResult done() {
    return TaskResult{};
  }

  static TaskResult continueWith(TaskCallback next) {
    TaskResult result;
    result.kind = Kind::Continue;
    result.continuation = std::move(next);
    return result;
  }
};

enum class SchedulerState : std::uint8_t {
  Idle,
  HostCallbackScheduled,
  Performing,
};

/**
 * Scheduling surface consumed by the reconciler.
 */
class Scheduler {
public:
  virtual ~Scheduler() = default;

  virtual TaskHandle scheduleTask(
    SchedulerPriority priority,
    TaskCallback callback,
    const TaskOptions& options = {}) = 0;

  virtual void cancelTask(TaskHandle handle) = 0;

  virtual SchedulerPriority getCurrentPriorityLevel() const = 0;

  virtual SchedulerPriority runWithPriority(
    SchedulerPriority priority,
    const std::function<void()>& fn) = 0;

  virtual bool shouldYield() const = 0;

  virtual double now() const = 0;
};

} // namespace loom
