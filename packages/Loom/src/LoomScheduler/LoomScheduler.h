#pragma once

#include "LoomScheduler/Scheduler.h"
#include "LoomScheduler/SchedulerHost.h"
#include "LoomScheduler/SchedulerMinHeap.h"
#include "LoomScheduler/SchedulerPriorities.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>

namespace loom {

/**
 * Internal task representation for the scheduler
 * Implements HeapNode interface for use with SchedulerMinHeap
 */
struct SchedulerTask : public HeapNode {
  TaskCallback callback;
  SchedulerPriority priorityLevel;
  double startTime;
  double expirationTime;
  bool isCancelled{false};

  SchedulerTask(std::uint64_t taskId, TaskCallback cb, SchedulerPriority priority, double start, double expiration)
    : callback(std::move(cb)), priorityLevel(priority), startTime(start), expirationTime(expiration) {
    id = taskId;
    sortIndex = expiration;
  }
};

/**
 * Default Loom Scheduler Implementation
 *
 * - Min-heap based task queue ordered by expiration time
 * - Separate timer queue for delayed tasks, promoted by advanceTimers
 * - Time-slicing with a configurable frame interval
 * - Priority-based timeout calculation
 * - Host integration through SchedulerHost (zero-latency message + one timeout)
 *
 * The host must outlive the scheduler.
 */
class LoomScheduler : public Scheduler {
public:
  explicit LoomScheduler(SchedulerHost& host, SchedulerConfig config = {});
  ~LoomScheduler() override;

  LoomScheduler(const LoomScheduler&) = delete;
  LoomScheduler& operator=(const LoomScheduler&) = delete;

  // Scheduler interface implementation
  TaskHandle scheduleTask(
    SchedulerPriority priority,
    TaskCallback callback,
    const TaskOptions& options = {}) override;

  void cancelTask(TaskHandle handle) override;

  SchedulerPriority getCurrentPriorityLevel() const override;

  SchedulerPriority runWithPriority(
    SchedulerPriority priority,
    const std::function<void()>& fn) override;

  bool shouldYield() const override;

  double now() const override;

  // Additional Scheduler functionality
  void next(const std::function<void()>& fn);
  void forceFrameRate(double fps);
  void requestPaint();
  bool flushWork(bool hasTimeRemaining, double initialTime);
  void advanceTimers(double currentTime);
  void performWorkUntilDeadline();

  // Introspection
  SchedulerState getState() const;
  TaskHandle getFirstCallbackNode() const;
  bool isTaskPending(TaskHandle handle) const;
  std::size_t readyTaskCount() const;
  std::size_t delayedTaskCount() const;
  const SchedulerTask* peekReadyTask() const;
  const SchedulerTask* peekDelayedTask() const;
  double frameInterval() const;
  const SchedulerConfig& config() const;

private:
  SchedulerTask* createTask(
    SchedulerPriority priority,
    TaskCallback callback,
    double startTime,
    double expirationTime);
  void releaseTask(std::uint64_t taskId);

  bool shouldYieldToHost() const;
  void requestHostCallback();
  void schedulePerformWorkUntilDeadline();
  void requestHostTimeout(double delayMs);
  void cancelHostTimeout();
  void handleTimeout(double currentTime);
  bool workLoop(bool hasTimeRemaining, double initialTime);

  SchedulerHost& host_;
  SchedulerConfig config_;

  // Task queues
  SchedulerMinHeap<SchedulerTask> taskQueue_;
  SchedulerMinHeap<SchedulerTask> timerQueue_;

  // Tasks stay alive until popped from their heap
  std::unordered_map<std::uint64_t, std::unique_ptr<SchedulerTask>> tasks_;

  // Current state
  std::uint64_t nextTaskId_{1};
  SchedulerPriority currentPriorityLevel_{SchedulerPriority::NormalPriority};
  SchedulerTask* currentTask_{nullptr};

  // Scheduling state
  bool isHostCallbackScheduled_{false};
  bool isHostTimeoutScheduled_{false};
  bool isPerformingWork_{false};
  bool isMessageLoopRunning_{false};
  bool needsPaint_{false};
  SchedulerHost::TimeoutId hostTimeoutId_{0};
  // Bumped on every cancel; a firing timeout must still carry the latest one.
  std::uint64_t hostTimeoutToken_{0};

  // Time management
  double frameInterval_;
  double startTime_{-1.0};

  // Expires with the scheduler so queued host messages become no-ops.
  std::shared_ptr<bool> alive_;
};

} // namespace loom
