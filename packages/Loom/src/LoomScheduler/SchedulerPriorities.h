#pragma once

#include "LoomScheduler/Scheduler.h"
#include "LoomScheduler/SchedulerFeatureFlags.h"

#include <cstdint>

namespace loom {

// Priority Level Constants
inline constexpr SchedulerPriority NoPriority = SchedulerPriority::NoPriority;
inline constexpr SchedulerPriority ImmediatePriority = SchedulerPriority::ImmediatePriority;
inline constexpr SchedulerPriority UserBlockingPriority = SchedulerPriority::UserBlockingPriority;
inline constexpr SchedulerPriority NormalPriority = SchedulerPriority::NormalPriority;
inline constexpr SchedulerPriority LowPriority = SchedulerPriority::LowPriority;
inline constexpr SchedulerPriority IdlePriority = SchedulerPriority::IdlePriority;

// Priority Level Utilities
constexpr bool isValidPriority(SchedulerPriority priority) {
  return priority >= SchedulerPriority::ImmediatePriority && priority <= SchedulerPriority::IdlePriority;
}

constexpr bool isHigherPriority(SchedulerPriority a, SchedulerPriority b) {
  return static_cast<std::uint8_t>(a) < static_cast<std::uint8_t>(b);
}

constexpr bool isLowerPriority(SchedulerPriority a, SchedulerPriority b) {
  return static_cast<std::uint8_t>(a) > static_cast<std::uint8_t>(b);
}

// Priority to timeout mapping (in milliseconds).
// Immediate work is already expired when scheduled; idle work never expires.
constexpr double priorityToTimeout(SchedulerPriority priority) {
  switch (priority) {
    case SchedulerPriority::ImmediatePriority:
      return immediatePriorityTimeout;
    case SchedulerPriority::UserBlockingPriority:
      return userBlockingPriorityTimeout;
    case SchedulerPriority::NormalPriority:
      return normalPriorityTimeout;
    case SchedulerPriority::LowPriority:
      return lowPriorityTimeout;
    case SchedulerPriority::IdlePriority:
      return maxSigned31BitInt;
    case SchedulerPriority::NoPriority:
    default:
      return normalPriorityTimeout;
  }
}

// Priority names for debugging
constexpr const char* priorityName(SchedulerPriority priority) {
  switch (priority) {
    case SchedulerPriority::NoPriority:
      return "NoPriority";
    case SchedulerPriority::ImmediatePriority:
      return "ImmediatePriority";
    case SchedulerPriority::UserBlockingPriority:
      return "UserBlockingPriority";
    case SchedulerPriority::NormalPriority:
      return "NormalPriority";
    case SchedulerPriority::LowPriority:
      return "LowPriority";
    case SchedulerPriority::IdlePriority:
      return "IdlePriority";
    default:
      return "Unknown";
  }
}

/**
 * Runtime scheduling policy. Defaults mirror the feature flags; tests and
 * embedders may tune the frame budget and the per-priority timeouts.
 */
struct SchedulerConfig {
  double frameIntervalMs{frameYieldMs};
  double immediateTimeoutMs{immediatePriorityTimeout};
  double userBlockingTimeoutMs{userBlockingPriorityTimeout};
  double normalTimeoutMs{normalPriorityTimeout};
  double lowTimeoutMs{lowPriorityTimeout};
  double idleTimeoutMs{maxSigned31BitInt};

  double timeoutFor(SchedulerPriority priority) const {
    switch (priority) {
      case SchedulerPriority::ImmediatePriority:
        return immediateTimeoutMs;
      case SchedulerPriority::UserBlockingPriority:
        return userBlockingTimeoutMs;
      case SchedulerPriority::LowPriority:
        return lowTimeoutMs;
      case SchedulerPriority::IdlePriority:
        return idleTimeoutMs;
      case SchedulerPriority::NormalPriority:
      case SchedulerPriority::NoPriority:
      default:
        return normalTimeoutMs;
    }
  }
};

} // namespace loom
