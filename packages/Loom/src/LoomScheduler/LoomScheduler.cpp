#include "LoomScheduler/LoomScheduler.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace loom {

LoomScheduler::LoomScheduler(SchedulerHost& host, SchedulerConfig config)
  : host_(host),
    config_(config),
    frameInterval_(config.frameIntervalMs),
    alive_(std::make_shared<bool>(true)) {
}

LoomScheduler::~LoomScheduler() {
  cancelHostTimeout();
  alive_.reset();
}

TaskHandle LoomScheduler::scheduleTask(
    SchedulerPriority priority,
    TaskCallback callback,
    const TaskOptions& options) {
  if (!callback) {
    throw std::invalid_argument("LoomScheduler::scheduleTask requires a callback");
  }

  if (!isValidPriority(priority)) {
    priority = SchedulerPriority::NormalPriority;
  }

  const double currentTime = now();
  double startTime = currentTime;

  // Handle delay option
  if (options.delayMs > 0.0) {
    startTime = currentTime + options.delayMs;
  }

  double timeout = config_.timeoutFor(priority);
  if (options.timeoutMs.has_value()) {
    timeout = *options.timeoutMs;
  }

  const double expirationTime = startTime + timeout;

  SchedulerTask* newTask = createTask(priority, std::move(callback), startTime, expirationTime);

  if (startTime > currentTime) {
    // This is a delayed task
    newTask->sortIndex = startTime;
    timerQueue_.push(newTask);

    // All ready tasks are drained and this is the earliest timer
    if (taskQueue_.peek() == nullptr && newTask == timerQueue_.peek()) {
      if (isHostTimeoutScheduled_) {
        cancelHostTimeout();
      }
      requestHostTimeout(startTime - currentTime);
    }
  } else {
    newTask->sortIndex = expirationTime;
    taskQueue_.push(newTask);

    if (!isHostCallbackScheduled_ && !isPerformingWork_) {
      isHostCallbackScheduled_ = true;
      requestHostCallback();
    }
  }

  return TaskHandle{newTask->id};
}

void LoomScheduler::cancelTask(TaskHandle handle) {
  if (!handle) {
    return;
  }

  // Null out the callback; the heaps drop the task lazily when it reaches the top.
  auto it = tasks_.find(handle.id);
  if (it == tasks_.end()) {
    return;
  }
  it->second->callback = nullptr;
  it->second->isCancelled = true;
}

SchedulerPriority LoomScheduler::getCurrentPriorityLevel() const {
  return currentPriorityLevel_;
}

SchedulerPriority LoomScheduler::runWithPriority(
    SchedulerPriority priority,
    const std::function<void()>& fn) {
  if (!isValidPriority(priority)) {
    priority = SchedulerPriority::NormalPriority;
  }

  const SchedulerPriority previousPriority = currentPriorityLevel_;
  currentPriorityLevel_ = priority;

  try {
    fn();
  } catch (...) {
    currentPriorityLevel_ = previousPriority;
    throw;
  }

  currentPriorityLevel_ = previousPriority;
  return previousPriority;
}

void LoomScheduler::next(const std::function<void()>& fn) {
  SchedulerPriority priority;
  switch (currentPriorityLevel_) {
    case SchedulerPriority::ImmediatePriority:
    case SchedulerPriority::UserBlockingPriority:
    case SchedulerPriority::NormalPriority:
      // Shift down to normal priority
      priority = SchedulerPriority::NormalPriority;
      break;
    default:
      // Anything lower than normal priority should remain at the current level.
      priority = currentPriorityLevel_;
      break;
  }

  runWithPriority(priority, fn);
}

bool LoomScheduler::shouldYield() const {
  return shouldYieldToHost();
}

bool LoomScheduler::shouldYieldToHost() const {
  if (enableAlwaysYieldScheduler) {
    return true;
  }

  if (enableRequestPaint && needsPaint_) {
    return true;
  }

  if (startTime_ < 0.0) {
    return false;
  }

  const double timeElapsed = now() - startTime_;
  return timeElapsed >= frameInterval_;
}

double LoomScheduler::now() const {
  return host_.now();
}

void LoomScheduler::forceFrameRate(double fps) {
  if (fps < 0.0 || fps > maxFrameRate) {
    std::cerr << "forceFrameRate takes a positive int between 0 and 125, "
              << "forcing frame rates higher than 125 fps is not supported" << std::endl;
    return;
  }

  if (fps > 0.0) {
    frameInterval_ = 1000.0 / fps;
  } else {
    // reset the framerate
    frameInterval_ = config_.frameIntervalMs;
  }
}

void LoomScheduler::requestPaint() {
  if (enableRequestPaint) {
    needsPaint_ = true;
  }
}

bool LoomScheduler::flushWork(bool hasTimeRemaining, double initialTime) {
  // We'll need a host callback the next time work is scheduled.
  isHostCallbackScheduled_ = false;

  if (isHostTimeoutScheduled_) {
    // We scheduled a timeout but it's no longer needed. Cancel it.
    cancelHostTimeout();
  }

  isPerformingWork_ = true;
  const SchedulerPriority previousPriority = currentPriorityLevel_;

  bool hasMoreWork = false;
  try {
    hasMoreWork = workLoop(hasTimeRemaining, initialTime);
  } catch (...) {
    currentTask_ = nullptr;
    currentPriorityLevel_ = previousPriority;
    isPerformingWork_ = false;
    throw;
  }

  currentTask_ = nullptr;
  currentPriorityLevel_ = previousPriority;
  isPerformingWork_ = false;

  return hasMoreWork;
}

void LoomScheduler::advanceTimers(double currentTime) {
  SchedulerTask* timer = timerQueue_.peek();
  while (timer != nullptr) {
    if (!timer->callback) {
      // Timer was cancelled.
      timerQueue_.pop();
      releaseTask(timer->id);
    } else if (timer->startTime <= currentTime) {
      // Timer fired. Transfer to the task queue.
      timerQueue_.pop();
      timer->sortIndex = timer->expirationTime;
      taskQueue_.push(timer);
    } else {
      // Remaining timers are pending.
      return;
    }
    timer = timerQueue_.peek();
  }
}

bool LoomScheduler::workLoop(bool hasTimeRemaining, double initialTime) {
  double currentTime = initialTime;
  advanceTimers(currentTime);
  currentTask_ = taskQueue_.peek();

  while (currentTask_ != nullptr) {
    if (currentTask_->expirationTime > currentTime && (!hasTimeRemaining || shouldYieldToHost())) {
      // This currentTask hasn't expired, and we've reached the deadline.
      break;
    }

    SchedulerTask* task = currentTask_;
    const std::uint64_t taskId = task->id;

    if (task->callback) {
      TaskCallback callback = std::move(task->callback);
      task->callback = nullptr;
      currentPriorityLevel_ = task->priorityLevel;

      const bool didUserCallbackTimeout = task->expirationTime <= currentTime;

      TaskResult result;
      try {
        result = callback(didUserCallbackTimeout);
      } catch (...) {
        SchedulerTask* head = taskQueue_.peek();
        if (head != nullptr && head->id == taskId) {
          taskQueue_.pop();
          releaseTask(taskId);
        }
        throw;
      }

      currentTime = now();

      switch (result.kind) {
        case TaskResult::Kind::Continue:
          if (result.continuation && !task->isCancelled) {
            // The task keeps its heap slot and expiration. Returning true
            // ends this slice; the host re-posts and the continuation runs
            // on the next turn.
            task->callback = std::move(result.continuation);
            advanceTimers(currentTime);
            return true;
          }
          [[fallthrough]];
        case TaskResult::Kind::Done: {
          // A re-entrant callback may already have moved the queue on.
          SchedulerTask* head = taskQueue_.peek();
          if (head != nullptr && head->id == taskId) {
            taskQueue_.pop();
            releaseTask(taskId);
          }
          advanceTimers(currentTime);
          break;
        }
      }
    } else {
      taskQueue_.pop();
      releaseTask(taskId);
    }

    currentTask_ = taskQueue_.peek();
  }

  // Return whether there's additional work
  if (currentTask_ != nullptr) {
    return true;
  }

  SchedulerTask* firstTimer = timerQueue_.peek();
  if (firstTimer != nullptr) {
    requestHostTimeout(firstTimer->startTime - currentTime);
  }
  return false;
}

void LoomScheduler::performWorkUntilDeadline() {
  if (!isMessageLoopRunning_) {
    return;
  }

  needsPaint_ = false;
  const double currentTime = now();
  // Keep track of the start time so we can measure how long the main thread
  // has been blocked.
  startTime_ = currentTime;

  bool hasMoreWork = true;
  try {
    hasMoreWork = flushWork(true, currentTime);
  } catch (...) {
    // Remaining tasks continue on the next turn; the error belongs to the host.
    schedulePerformWorkUntilDeadline();
    throw;
  }

  if (hasMoreWork) {
    schedulePerformWorkUntilDeadline();
  } else {
    isMessageLoopRunning_ = false;
  }
}

SchedulerState LoomScheduler::getState() const {
  if (isPerformingWork_) {
    return SchedulerState::Performing;
  }
  if (isHostCallbackScheduled_ || isMessageLoopRunning_) {
    return SchedulerState::HostCallbackScheduled;
  }
  return SchedulerState::Idle;
}

TaskHandle LoomScheduler::getFirstCallbackNode() const {
  const SchedulerTask* first = taskQueue_.peek();
  return first != nullptr ? TaskHandle{first->id} : TaskHandle{};
}

bool LoomScheduler::isTaskPending(TaskHandle handle) const {
  if (!handle) {
    return false;
  }
  auto it = tasks_.find(handle.id);
  return it != tasks_.end() && !it->second->isCancelled;
}

std::size_t LoomScheduler::readyTaskCount() const {
  return taskQueue_.size();
}

std::size_t LoomScheduler::delayedTaskCount() const {
  return timerQueue_.size();
}

const SchedulerTask* LoomScheduler::peekReadyTask() const {
  return taskQueue_.peek();
}

const SchedulerTask* LoomScheduler::peekDelayedTask() const {
  return timerQueue_.peek();
}

double LoomScheduler::frameInterval() const {
  return frameInterval_;
}

const SchedulerConfig& LoomScheduler::config() const {
  return config_;
}

SchedulerTask* LoomScheduler::createTask(
    SchedulerPriority priority,
    TaskCallback callback,
    double startTime,
    double expirationTime) {
  const std::uint64_t taskId = nextTaskId_++;

  auto taskPtr = std::make_unique<SchedulerTask>(
    taskId, std::move(callback), priority, startTime, expirationTime);

  SchedulerTask* rawPtr = taskPtr.get();
  tasks_.emplace(taskId, std::move(taskPtr));
  return rawPtr;
}

void LoomScheduler::releaseTask(std::uint64_t taskId) {
  tasks_.erase(taskId);
}

void LoomScheduler::requestHostCallback() {
  if (!isMessageLoopRunning_) {
    isMessageLoopRunning_ = true;
    schedulePerformWorkUntilDeadline();
  }
}

void LoomScheduler::schedulePerformWorkUntilDeadline() {
  std::weak_ptr<bool> alive = alive_;
  host_.postMessage([this, alive]() {
    if (alive.expired()) {
      return;
    }
    performWorkUntilDeadline();
  });
}

void LoomScheduler::requestHostTimeout(double delayMs) {
  // Only one host timeout is armed at a time.
  cancelHostTimeout();

  std::weak_ptr<bool> alive = alive_;
  const std::uint64_t token = hostTimeoutToken_;
  isHostTimeoutScheduled_ = true;
  hostTimeoutId_ = host_.setTimeout([this, alive, token]() {
    if (alive.expired()) {
      return;
    }
    if (token != hostTimeoutToken_) {
      // Cancelled or replaced after the host already dispatched it. The
      // timeout armed since then covers the current timer head.
      return;
    }
    handleTimeout(now());
  }, std::max(delayMs, 0.0));
}

void LoomScheduler::cancelHostTimeout() {
  ++hostTimeoutToken_;
  if (hostTimeoutId_ != 0) {
    host_.clearTimeout(hostTimeoutId_);
    hostTimeoutId_ = 0;
  }
  isHostTimeoutScheduled_ = false;
}

void LoomScheduler::handleTimeout(double currentTime) {
  isHostTimeoutScheduled_ = false;
  hostTimeoutId_ = 0;
  advanceTimers(currentTime);

  if (!isHostCallbackScheduled_) {
    if (taskQueue_.peek() != nullptr) {
      isHostCallbackScheduled_ = true;
      requestHostCallback();
    } else {
      SchedulerTask* firstTimer = timerQueue_.peek();
      if (firstTimer != nullptr) {
        requestHostTimeout(firstTimer->startTime - currentTime);
      }
    }
  }
}

} // namespace loom
