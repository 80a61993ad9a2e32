#pragma once

namespace loom {

// Feature flags for Scheduler behavior

// Time slice configuration
inline constexpr double frameYieldMs = 5.0; // 5ms default time slice

// Priority timeout constants (in milliseconds)
inline constexpr double immediatePriorityTimeout = -1.0;
inline constexpr double userBlockingPriorityTimeout = 250.0;
inline constexpr double normalPriorityTimeout = 5000.0;
inline constexpr double lowPriorityTimeout = 10000.0;
inline constexpr double maxSigned31BitInt = 1073741823.0;

// forceFrameRate accepts (0, maxFrameRate]
inline constexpr double maxFrameRate = 125.0;

// Paint request support
inline constexpr bool enableRequestPaint = true;

// Yield after every task regardless of the remaining frame budget
inline constexpr bool enableAlwaysYieldScheduler = false;

} // namespace loom
