#include "LoomScheduler/SchedulerHost.h"

#include <algorithm>
#include <limits>
#include <thread>
#include <utility>

namespace loom {

namespace {

template<typename TimerList>
typename TimerList::iterator findEarliestTimer(TimerList& timers) {
  return std::min_element(timers.begin(), timers.end(), [](const auto& a, const auto& b) {
    if (a.dueTime != b.dueTime) {
      return a.dueTime < b.dueTime;
    }
    return a.id < b.id;
  });
}

template<typename TimerList>
void eraseTimer(TimerList& timers, SchedulerHost::TimeoutId id) {
  timers.erase(
    std::remove_if(timers.begin(), timers.end(), [id](const auto& timer) {
      return timer.id == id;
    }),
    timers.end());
}

} // namespace

MessageLoopHost::MessageLoopHost()
  : baseTime_(std::chrono::steady_clock::now()) {
}

double MessageLoopHost::now() const {
  const auto elapsed = std::chrono::steady_clock::now() - baseTime_;
  return std::chrono::duration<double, std::milli>(elapsed).count();
}

void MessageLoopHost::postMessage(Message message) {
  if (!message) {
    return;
  }
  messages_.push_back(std::move(message));
}

SchedulerHost::TimeoutId MessageLoopHost::setTimeout(Message callback, double delayMs) {
  const TimeoutId id = nextTimeoutId_++;
  timers_.push_back(Timer{id, now() + std::max(delayMs, 0.0), std::move(callback)});
  return id;
}

void MessageLoopHost::clearTimeout(TimeoutId id) {
  eraseTimer(timers_, id);
}

bool MessageLoopHost::fireDueTimers(double currentTime) {
  bool didFire = false;
  while (!timers_.empty()) {
    auto earliest = findEarliestTimer(timers_);
    if (earliest->dueTime > currentTime) {
      break;
    }
    Message callback = std::move(earliest->callback);
    timers_.erase(earliest);
    didFire = true;
    if (callback) {
      callback();
    }
  }
  return didFire;
}

bool MessageLoopHost::runOnce() {
  bool didWork = fireDueTimers(now());

  if (!messages_.empty()) {
    Message message = std::move(messages_.front());
    messages_.pop_front();
    didWork = true;
    message();
  }

  return didWork;
}

void MessageLoopHost::run() {
  while (hasPendingWork()) {
    if (runOnce()) {
      continue;
    }

    if (messages_.empty() && !timers_.empty()) {
      const double dueTime = findEarliestTimer(timers_)->dueTime;
      const double waitMs = dueTime - now();
      if (waitMs > 0.0) {
        std::this_thread::sleep_for(std::chrono::duration<double, std::milli>(waitMs));
      }
    }
  }
}

bool MessageLoopHost::hasPendingWork() const {
  return !messages_.empty() || !timers_.empty();
}

MockSchedulerHost::MockSchedulerHost(double startTime)
  : currentTime_(startTime) {
}

double MockSchedulerHost::now() const {
  return currentTime_;
}

void MockSchedulerHost::postMessage(Message message) {
  if (!message) {
    return;
  }
  messages_.push_back(std::move(message));
}

SchedulerHost::TimeoutId MockSchedulerHost::setTimeout(Message callback, double delayMs) {
  const TimeoutId id = nextTimeoutId_++;
  timers_.push_back(Timer{id, currentTime_ + std::max(delayMs, 0.0), std::move(callback)});
  return id;
}

void MockSchedulerHost::clearTimeout(TimeoutId id) {
  eraseTimer(timers_, id);
}

bool MockSchedulerHost::fireNextDueTimer() {
  if (timers_.empty()) {
    return false;
  }

  auto earliest = findEarliestTimer(timers_);
  if (earliest->dueTime > currentTime_) {
    return false;
  }

  Message callback = std::move(earliest->callback);
  timers_.erase(earliest);
  if (callback) {
    callback();
  }
  return true;
}

void MockSchedulerHost::advanceTime(double ms) {
  currentTime_ += ms;
  while (fireNextDueTimer()) {
  }
}

bool MockSchedulerHost::flushMessage() {
  if (messages_.empty()) {
    return false;
  }

  Message message = std::move(messages_.front());
  messages_.pop_front();
  message();
  return true;
}

void MockSchedulerHost::flushMessages() {
  while (flushMessage()) {
  }
}

void MockSchedulerHost::flushAll() {
  while (!messages_.empty() || !timers_.empty()) {
    flushMessages();
    if (timers_.empty()) {
      continue;
    }

    const double dueTime = findEarliestTimer(timers_)->dueTime;
    if (dueTime > currentTime_) {
      currentTime_ = dueTime;
    }
    fireNextDueTimer();
  }
}

std::size_t MockSchedulerHost::pendingMessageCount() const {
  return messages_.size();
}

std::size_t MockSchedulerHost::pendingTimerCount() const {
  return timers_.size();
}

double MockSchedulerHost::nextTimerDueTime() const {
  if (timers_.empty()) {
    return std::numeric_limits<double>::infinity();
  }

  double dueTime = std::numeric_limits<double>::infinity();
  for (const Timer& timer : timers_) {
    dueTime = std::min(dueTime, timer.dueTime);
  }
  return dueTime;
}

} // namespace loom
