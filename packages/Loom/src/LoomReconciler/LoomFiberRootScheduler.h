#pragma once

#include "LoomReconciler/LoomFiberLane.h"
#include "LoomScheduler/Scheduler.h"

namespace loom {

class LoomRuntime;
struct FiberRoot;

// Adds the root to the schedule and makes sure the schedule gets processed on
// an immediate-priority task.
void ensureRootIsScheduled(LoomRuntime& runtime, FiberRoot& root);
void ensureScheduleIsScheduled(LoomRuntime& runtime);
void flushSyncWorkOnAllRoots(LoomRuntime& runtime);
Lane requestTransitionLane(LoomRuntime& runtime);
bool didCurrentEventScheduleTransition(const LoomRuntime& runtime);

SchedulerPriority toSchedulerPriority(Lane lane);

// Entry points for different scheduling contexts
void performWorkOnRoot(LoomRuntime& runtime, FiberRoot& root, Lanes lanes, bool forceSync);
void performSyncWorkOnRoot(LoomRuntime& runtime, FiberRoot& root, Lanes lanes);
TaskResult performWorkOnRootViaSchedulerTask(
  LoomRuntime& runtime,
  FiberRoot& root,
  TaskHandle originalCallbackHandle,
  bool didTimeout);

} // namespace loom
