#pragma once

namespace facebook {
namespace jsi {
class Runtime;
} // namespace jsi
} // namespace facebook

namespace loom {

class LoomScheduler;

// Publishes the scheduler as the global `LoomScheduler` object:
// scheduleCallback(priority, callback, {delay, timeout}), cancelCallback(id),
// shouldYield(), getCurrentPriorityLevel(), now() and the priority constants.
// A callback that returns a function continues as the same task.
//
// The scheduler must outlive every task scheduled through the binding.
void installSchedulerBinding(facebook::jsi::Runtime& jsRuntime, LoomScheduler& scheduler);

} // namespace loom
