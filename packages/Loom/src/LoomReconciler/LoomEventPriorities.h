#pragma once

#include "LoomReconciler/LoomFiberLane.h"
#include "LoomScheduler/Scheduler.h"

namespace loom {

using EventPriority = Lane;

inline constexpr EventPriority NoEventPriority = NoLane;
inline constexpr EventPriority DiscreteEventPriority = SyncLane;
inline constexpr EventPriority ContinuousEventPriority = InputContinuousLane;
inline constexpr EventPriority DefaultEventPriority = DefaultLane;
inline constexpr EventPriority IdleEventPriority = IdleLane;

constexpr bool isHigherEventPriority(EventPriority a, EventPriority b) {
  return a != NoEventPriority && a.bits() < b.bits();
}

constexpr EventPriority higherEventPriority(EventPriority a, EventPriority b) {
  return a != NoEventPriority && a.bits() < b.bits() ? a : b;
}

constexpr EventPriority lowerEventPriority(EventPriority a, EventPriority b) {
  return a == NoEventPriority || a.bits() > b.bits() ? a : b;
}

EventPriority lanesToEventPriority(Lanes lanes);
SchedulerPriority eventPriorityToSchedulerPriority(EventPriority priority);
EventPriority schedulerPriorityToEventPriority(SchedulerPriority priority);

} // namespace loom
