#include "LoomReconciler/LoomFiberRootScheduler.h"

#include "LoomReconciler/LoomEventPriorities.h"
#include "LoomReconciler/LoomFiberCommitWork.h"
#include "LoomReconciler/LoomFiberLane.h"
#include "LoomReconciler/LoomFiberRoot.h"
#include "LoomReconciler/LoomFiberWorkLoop.h"
#include "LoomRuntime/LoomRuntime.h"
#include "shared/LoomFeatureFlags.h"

#include <exception>
#include <memory>
#include <stdexcept>
#include <utility>

namespace loom {

namespace {

RootSchedulerState& getState(LoomRuntime& runtime) {
  return runtime.rootSchedulerState();
}

const RootSchedulerState& getState(const LoomRuntime& runtime) {
  return runtime.rootSchedulerState();
}

void processRootSchedule(LoomRuntime& runtime);
void processRootScheduleInMicrotask(LoomRuntime& runtime);
void ensureScheduleProcessing(LoomRuntime& runtime);
void flushSyncWorkAcrossRoots(LoomRuntime& runtime);
Lanes scheduleTaskForRootDuringMicrotask(LoomRuntime& runtime, FiberRoot& root, double currentTime);

void addRootToSchedule(LoomRuntime& runtime, FiberRoot& root) {
  RootSchedulerState& state = getState(runtime);
  if (&root == state.lastScheduledRoot || root.next != nullptr || state.firstScheduledRoot == &root) {
    return;
  }

  root.next = nullptr;
  if (state.lastScheduledRoot == nullptr) {
    state.firstScheduledRoot = state.lastScheduledRoot = &root;
  } else {
    state.lastScheduledRoot->next = &root;
    state.lastScheduledRoot = &root;
  }
}

Lanes getWorkInProgressLanesFor(const LoomRuntime& runtime, const FiberRoot& root) {
  return getWorkInProgressRoot(runtime) == &root ? getWorkInProgressRootRenderLanes(runtime) : NoLanes;
}

void scheduleRootTask(LoomRuntime& runtime, FiberRoot& root, Lane lane) {
  const SchedulerPriority priority = toSchedulerPriority(lane);
  LoomRuntime* runtimePtr = &runtime;
  FiberRoot* rootPtr = &root;
  auto callbackHandleBox = std::make_shared<TaskHandle>();
  const TaskHandle handle = runtime.scheduleTask(priority, [runtimePtr, rootPtr, callbackHandleBox](bool didTimeout) {
    return performWorkOnRootViaSchedulerTask(*runtimePtr, *rootPtr, *callbackHandleBox, didTimeout);
  });
  *callbackHandleBox = handle;

  root.callbackNode = handle;
  root.callbackPriority = lane;
}

void processRootSchedule(LoomRuntime& runtime) {
  RootSchedulerState& state = getState(runtime);
  if (state.isProcessingRootSchedule) {
    return;
  }

  state.isProcessingRootSchedule = true;
  state.mightHavePendingSyncWork = false;

  try {
    while (state.didScheduleRootProcessing) {
      state.didScheduleRootProcessing = false;

      const double currentTime = runtime.now();
      FiberRoot* prev = nullptr;
      FiberRoot* root = state.firstScheduledRoot;

      while (root != nullptr) {
        FiberRoot* const next = root->next;
        const Lanes scheduledLanes = scheduleTaskForRootDuringMicrotask(runtime, *root, currentTime);

        if (scheduledLanes == NoLanes) {
          // This root has no more pending work. Remove it from the schedule.
          root->next = nullptr;
          if (prev == nullptr) {
            state.firstScheduledRoot = next;
          } else {
            prev->next = next;
          }
          if (next == nullptr) {
            state.lastScheduledRoot = prev;
          }
        } else {
          prev = root;
          if (includesSyncLane(scheduledLanes)) {
            state.mightHavePendingSyncWork = true;
          }
        }

        root = next;
      }

      state.lastScheduledRoot = prev;

      // At the end of the microtask, flush any pending synchronous work.
      flushSyncWorkAcrossRoots(runtime);
    }
  } catch (...) {
    state.isProcessingRootSchedule = false;
    state.currentEventTransitionLane = NoLane;
    throw;
  }

  // Reset Event Transition Lane so that we allocate a new one next time.
  state.currentEventTransitionLane = NoLane;
  state.isProcessingRootSchedule = false;
}

void processRootScheduleInMicrotask(LoomRuntime& runtime) {
  RootSchedulerState& state = getState(runtime);
  state.didScheduleMicrotask = false;
  state.rootScheduleTask = {};
  processRootSchedule(runtime);
}

void ensureScheduleProcessing(LoomRuntime& runtime) {
  RootSchedulerState& state = getState(runtime);
  if (state.didScheduleRootProcessing) {
    return;
  }

  state.didScheduleRootProcessing = true;
  ensureScheduleIsScheduled(runtime);
}

void flushSyncWorkAcrossRoots(LoomRuntime& runtime) {
  RootSchedulerState& state = getState(runtime);
  if (state.isFlushingWork) {
    // Prevent reentrancy.
    return;
  }

  if (!state.mightHavePendingSyncWork) {
    // Fast path. There's no sync work to do.
    return;
  }

  if (isAlreadyRendering(runtime)) {
    // Picked up once the current render or commit returns.
    return;
  }

  state.isFlushingWork = true;

  try {
    bool didPerformSomeWork = false;
    do {
      didPerformSomeWork = false;
      FiberRoot* root = state.firstScheduledRoot;
      while (root != nullptr) {
        FiberRoot* const next = root->next;
        const Lanes nextLanes = getNextLanes(*root, getWorkInProgressLanesFor(runtime, *root));
        if (includesSyncLane(nextLanes)) {
          // This root has pending sync work. Flush it now.
          didPerformSomeWork = true;
          performSyncWorkOnRoot(runtime, *root, nextLanes);
        }
        root = next;
      }
    } while (didPerformSomeWork);
  } catch (...) {
    state.isFlushingWork = false;
    throw;
  }

  state.isFlushingWork = false;
  state.mightHavePendingSyncWork = false;
}

Lanes scheduleTaskForRootDuringMicrotask(LoomRuntime& runtime, FiberRoot& root, double currentTime) {
  // This function is always called inside a microtask, or at the very end of a
  // rendering task right before we yield to the main thread. It should never be
  // called synchronously.

  // Check if any lanes are being starved by other work. If so, mark them as
  // expired so we know to work on those next.
  markStarvedLanesAsExpired(root, currentTime);

  const Lanes nextLanes = getNextLanes(root, getWorkInProgressLanesFor(runtime, root));

  const TaskHandle existingCallbackNode = root.callbackNode;
  if (nextLanes == NoLanes) {
    // Fast path: There's nothing to work on.
    if (existingCallbackNode) {
      runtime.cancelTask(existingCallbackNode);
    }
    root.callbackNode = {};
    root.callbackPriority = NoLane;
    return NoLanes;
  }

  // Schedule a new callback in the host environment.
  if (includesSyncLane(nextLanes)) {
    // Synchronous work is always flushed at the end of the microtask, so we
    // don't need to schedule an additional task.
    if (existingCallbackNode) {
      runtime.cancelTask(existingCallbackNode);
    }
    root.callbackNode = {};
    root.callbackPriority = SyncLane;
    return nextLanes;
  }

  // We use the highest priority lane to represent the priority of the callback.
  const Lane newCallbackPriority = getHighestPriorityLane(nextLanes);
  if (existingCallbackNode && root.callbackPriority == newCallbackPriority) {
    // The priority hasn't changed. We can reuse the existing task.
    return nextLanes;
  }

  // Cancel the existing callback. We'll schedule a new one below.
  if (existingCallbackNode) {
    runtime.cancelTask(existingCallbackNode);
  }

  scheduleRootTask(runtime, root, newCallbackPriority);
  return nextLanes;
}

} // namespace

SchedulerPriority toSchedulerPriority(Lane lane) {
  if (lane == NoLane) {
    return SchedulerPriority::NormalPriority;
  }
  return eventPriorityToSchedulerPriority(lanesToEventPriority(lane));
}

TaskResult performWorkOnRootViaSchedulerTask(
    LoomRuntime& runtime,
    FiberRoot& root,
    TaskHandle originalCallbackHandle,
    bool didTimeout) {
  // This is the entry point for every concurrent task, i.e. anything that
  // goes through Scheduler.
  if (root.callbackNode != originalCallbackHandle) {
    // A newer task replaced this one.
    return TaskResult::done();
  }

  markStarvedLanesAsExpired(root, runtime.now());

  const Lanes lanes = getNextLanes(root, getWorkInProgressLanesFor(runtime, root));
  if (lanes == NoLanes) {
    // No more work on this root.
    root.callbackNode = {};
    root.callbackPriority = NoLane;
    return TaskResult::done();
  }

  // An expired task is rendered synchronously so it cannot be starved by
  // further yields.
  const bool forceSync = didTimeout;
  performWorkOnRoot(runtime, root, lanes, forceSync);

  scheduleTaskForRootDuringMicrotask(runtime, root, runtime.now());
  if (root.callbackNode && root.callbackNode == originalCallbackHandle) {
    // The task node scheduled for this root is the same one that's currently
    // executed. Need to return a continuation.
    LoomRuntime* runtimePtr = &runtime;
    FiberRoot* rootPtr = &root;
    return TaskResult::continueWith([runtimePtr, rootPtr, originalCallbackHandle](bool continuationDidTimeout) {
      return performWorkOnRootViaSchedulerTask(*runtimePtr, *rootPtr, originalCallbackHandle, continuationDidTimeout);
    });
  }
  return TaskResult::done();
}

void performWorkOnRoot(LoomRuntime& runtime, FiberRoot& root, Lanes lanes, bool forceSync) {
  if (isAlreadyRendering(runtime)) {
    throw std::logic_error("Should not already be working.");
  }

  // We disable time-slicing in some cases: if the work has been CPU-bound
  // for too long ("expired" work, to prevent starvation), or we're in
  // sync-updates-by-default mode.
  const bool shouldTimeSlice =
      enableTimeSlicing && !forceSync && !includesSyncLane(lanes) && !includesExpiredLane(root, lanes);

  RootExitStatus exitStatus = shouldTimeSlice
      ? renderRootConcurrent(runtime, root, lanes)
      : renderRootSync(runtime, root, lanes);

  if (exitStatus == RootExitStatus::InProgress) {
    // Render yielded. The scheduler task continues it.
    return;
  }

  if (exitStatus == RootExitStatus::Errored) {
    if (enableRenderErrorRecovery) {
      // Something may have been mutated in the middle of the render. Try
      // rendering one more time, synchronously, from the current tree.
      exitStatus = renderRootSync(runtime, root, lanes);
    }
    if (exitStatus == RootExitStatus::Errored) {
      exitStatus = RootExitStatus::FatalErrored;
    }
  }

  switch (exitStatus) {
    case RootExitStatus::Completed: {
      // We now have a consistent tree. The next step is to commit it.
      root.finishedWork = runtime.fiberArena().get(root.current).alternate;
      root.finishedLanes = lanes;
      commitRoot(runtime, root);
      break;
    }
    case RootExitStatus::FatalErrored: {
      WorkLoopState& workLoopState = runtime.workLoopState();
      std::exception_ptr error = std::move(workLoopState.workInProgressRootFatalError);
      workLoopState.workInProgressRootFatalError = nullptr;

      // Don't retry these lanes until another update arrives.
      markRootSuspended(root, lanes);
      ensureRootIsScheduled(runtime, root);

      if (root.onUncaughtError) {
        root.onUncaughtError(root, error);
      }
      break;
    }
    case RootExitStatus::InProgress:
    case RootExitStatus::Errored:
      break;
  }
}

void performSyncWorkOnRoot(LoomRuntime& runtime, FiberRoot& root, Lanes lanes) {
  // This is the entry point for synchronous tasks that don't go
  // through Scheduler.
  performWorkOnRoot(runtime, root, lanes, true);
}

void ensureRootIsScheduled(LoomRuntime& runtime, FiberRoot& root) {
  // This function is called whenever a root receives an update. It does two
  // things 1) it ensures the root is in the root schedule, and 2) it ensures
  // there's a pending task to process the root schedule.
  addRootToSchedule(runtime, root);

  // Any root could have sync work; processing the schedule decides.
  getState(runtime).mightHavePendingSyncWork = true;

  ensureScheduleProcessing(runtime);
}

void ensureScheduleIsScheduled(LoomRuntime& runtime) {
  RootSchedulerState& state = getState(runtime);
  if (state.didScheduleMicrotask) {
    return;
  }

  state.didScheduleMicrotask = true;
  LoomRuntime* runtimePtr = &runtime;
  state.rootScheduleTask = runtime.scheduleTask(SchedulerPriority::ImmediatePriority, [runtimePtr](bool) {
    processRootScheduleInMicrotask(*runtimePtr);
    return TaskResult::done();
  });
}

void flushSyncWorkOnAllRoots(LoomRuntime& runtime) {
  flushSyncWorkAcrossRoots(runtime);
}

Lane requestTransitionLane(LoomRuntime& runtime) {
  // All transitions within the same event are assigned the same lane.
  RootSchedulerState& state = getState(runtime);
  if (state.currentEventTransitionLane == NoLane) {
    state.currentEventTransitionLane = claimNextTransitionLane(runtime.workLoopState().nextTransitionLane);
  }
  return state.currentEventTransitionLane;
}

bool didCurrentEventScheduleTransition(const LoomRuntime& runtime) {
  return getState(runtime).currentEventTransitionLane != NoLane;
}

} // namespace loom
