#pragma once

#include "LoomReconciler/LoomFiberLane.h"
#include "LoomScheduler/Scheduler.h"

namespace loom {

struct FiberRoot;

struct RootSchedulerState {
  FiberRoot* firstScheduledRoot{nullptr};
  FiberRoot* lastScheduledRoot{nullptr};
  bool didScheduleRootProcessing{false};
  bool isProcessingRootSchedule{false};
  bool mightHavePendingSyncWork{false};
  bool isFlushingWork{false};
  bool didScheduleMicrotask{false};
  // Immediate-priority task that stands in for a microtask.
  TaskHandle rootScheduleTask{};
  Lane currentEventTransitionLane{NoLane};
};

} // namespace loom
