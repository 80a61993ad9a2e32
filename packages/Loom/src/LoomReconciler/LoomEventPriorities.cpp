#include "LoomReconciler/LoomEventPriorities.h"

namespace loom {

EventPriority lanesToEventPriority(Lanes lanes) {
  const Lane lane = getHighestPriorityLane(lanes);
  if (!isHigherEventPriority(DiscreteEventPriority, lane)) {
    return DiscreteEventPriority;
  }
  if (!isHigherEventPriority(ContinuousEventPriority, lane)) {
    return ContinuousEventPriority;
  }
  if (includesNonIdleWork(lane)) {
    return DefaultEventPriority;
  }
  return IdleEventPriority;
}

SchedulerPriority eventPriorityToSchedulerPriority(EventPriority priority) {
  if (priority == DiscreteEventPriority || priority == ContinuousEventPriority) {
    return SchedulerPriority::UserBlockingPriority;
  }
  if (priority == IdleEventPriority) {
    return SchedulerPriority::IdlePriority;
  }
  return SchedulerPriority::NormalPriority;
}

EventPriority schedulerPriorityToEventPriority(SchedulerPriority priority) {
  switch (priority) {
    case SchedulerPriority::ImmediatePriority:
      return DiscreteEventPriority;
    case SchedulerPriority::UserBlockingPriority:
      return ContinuousEventPriority;
    case SchedulerPriority::LowPriority:
    case SchedulerPriority::IdlePriority:
      return IdleEventPriority;
    case SchedulerPriority::NormalPriority:
    case SchedulerPriority::NoPriority:
    default:
      return DefaultEventPriority;
  }
}

} // namespace loom
