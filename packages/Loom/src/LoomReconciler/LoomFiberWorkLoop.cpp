#include "LoomReconciler/LoomFiberWorkLoop.h"

#include "LoomReconciler/LoomElement.h"
#include "LoomReconciler/LoomEventPriorities.h"
#include "LoomReconciler/LoomFiberChild.h"
#include "LoomReconciler/LoomFiberClassUpdateQueue.h"
#include "LoomReconciler/LoomFiberConcurrentUpdates.h"
#include "LoomReconciler/LoomFiberFlags.h"
#include "LoomReconciler/LoomFiberRoot.h"
#include "LoomReconciler/LoomFiberRootScheduler.h"
#include "LoomReconciler/LoomHostConfig.h"
#include "LoomRuntime/LoomRuntime.h"
#include "shared/LoomFeatureFlags.h"
#include "shared/LoomGlobalError.h"

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace loom {

namespace {

inline WorkLoopState& getState(LoomRuntime& runtime) {
  return runtime.workLoopState();
}

inline const WorkLoopState& getState(const LoomRuntime& runtime) {
  return runtime.workLoopState();
}

FiberId bailoutOnAlreadyFinishedWork(
    LoomRuntime& runtime,
    FiberId current,
    FiberNode& workInProgress,
    Lanes renderLanes) {
  markSkippedUpdateLanes(runtime, workInProgress.lanes);

  // Check if the children have any pending work.
  if (!includesSomeLane(renderLanes, workInProgress.childLanes)) {
    // The children don't have any work either. We can skip them.
    return NoFiber;
  }

  // This fiber doesn't have work, but its subtree does. Clone the child
  // fibers and continue.
  return cloneChildFibers(runtime.fiberArena(), current, workInProgress);
}

void reconcileChildren(
    LoomRuntime& runtime,
    const FiberNode* current,
    FiberNode& workInProgress,
    const Elements& nextChildren,
    Lanes renderLanes) {
  FiberArena& arena = runtime.fiberArena();
  if (current == nullptr) {
    // If this is a fresh new component that hasn't been rendered yet, we
    // won't update its child set by applying minimal side-effects.
    mountChildFibers(arena, workInProgress, nextChildren, renderLanes);
  } else {
    reconcileChildFibers(arena, current->child, workInProgress, nextChildren, renderLanes);
  }
}

FiberId updateHostRoot(LoomRuntime& runtime, FiberId current, FiberNode& workInProgress, Lanes renderLanes) {
  const FiberNode* currentFiber = runtime.fiberArena().tryGet(current);
  if (currentFiber == nullptr) {
    throw std::logic_error("Should have a current fiber. This is a bug in Loom.");
  }

  const StatePtr prevState = workInProgress.memoizedState;
  const PropsPtr nextProps = workInProgress.pendingProps != nullptr ? workInProgress.pendingProps : emptyProps();
  processUpdateQueue(runtime, workInProgress, *nextProps, renderLanes);

  const StatePtr nextState = workInProgress.memoizedState;
  if (nextState == prevState) {
    return bailoutOnAlreadyFinishedWork(runtime, current, workInProgress, renderLanes);
  }

  const Elements* nextChildren = nextState != nullptr ? getValue<Elements>(*nextState, "children") : nullptr;
  reconcileChildren(runtime, currentFiber, workInProgress, nextChildren != nullptr ? *nextChildren : Elements{}, renderLanes);
  return workInProgress.child;
}

FiberId finishClassComponent(
    LoomRuntime& runtime,
    FiberId current,
    FiberNode& workInProgress,
    bool shouldUpdate,
    Lanes renderLanes) {
  if (!shouldUpdate) {
    return bailoutOnAlreadyFinishedWork(runtime, current, workInProgress, renderLanes);
  }

  workInProgress.flags = static_cast<FiberFlags>(workInProgress.flags | PerformedWork);

  const Component& instance = *workInProgress.component;
  const Elements nextChildren = instance.render(*workInProgress.pendingProps, *workInProgress.memoizedState);
  reconcileChildren(runtime, runtime.fiberArena().tryGet(current), workInProgress, nextChildren, renderLanes);
  return workInProgress.child;
}

FiberId updateClassComponent(LoomRuntime& runtime, FiberId current, FiberNode& workInProgress, Lanes renderLanes) {
  if (workInProgress.component == nullptr) {
    throw std::logic_error("Class component fiber has no component.");
  }
  if (workInProgress.pendingProps == nullptr) {
    workInProgress.pendingProps = emptyProps();
  }

  const Component& instance = *workInProgress.component;
  const Props& nextProps = *workInProgress.pendingProps;

  if (!runtime.fiberArena().isLive(current)) {
    // In the initial pass we might need to construct the instance.
    workInProgress.memoizedState = std::make_shared<const ValueMap>(instance.getInitialState(nextProps));
    initializeUpdateQueue(workInProgress);
    processUpdateQueue(runtime, workInProgress, nextProps, renderLanes);
    return finishClassComponent(runtime, current, workInProgress, true, renderLanes);
  }

  const PropsPtr oldProps = workInProgress.memoizedProps != nullptr ? workInProgress.memoizedProps : emptyProps();
  const StatePtr oldState = workInProgress.memoizedState;

  const UpdateQueueResult result = processUpdateQueue(runtime, workInProgress, nextProps, renderLanes);
  const StatePtr newState = workInProgress.memoizedState;

  if (oldProps == workInProgress.pendingProps && oldState == newState && !result.hasForceUpdate) {
    return bailoutOnAlreadyFinishedWork(runtime, current, workInProgress, renderLanes);
  }

  const bool shouldUpdate = result.hasForceUpdate ||
      instance.shouldUpdate(*oldProps, oldState != nullptr ? *oldState : ValueMap{}, nextProps, *newState);
  return finishClassComponent(runtime, current, workInProgress, shouldUpdate, renderLanes);
}

FiberId updateHostComponent(LoomRuntime& runtime, FiberId current, FiberNode& workInProgress, Lanes renderLanes) {
  const Elements& nextChildren = getChildren(workInProgress.pendingProps.get());
  reconcileChildren(runtime, runtime.fiberArena().tryGet(current), workInProgress, nextChildren, renderLanes);
  return workInProgress.child;
}

void markUpdate(FiberNode& workInProgress) {
  workInProgress.flags = static_cast<FiberFlags>(workInProgress.flags | UpdateFlag | Snapshot);
}

void handleThrow(LoomRuntime& runtime, std::exception_ptr thrownValue) {
  WorkLoopState& state = getState(runtime);
  state.workInProgressRootExitStatus = RootExitStatus::Errored;
  state.workInProgressRootFatalError = std::move(thrownValue);
  // Nothing of the shadow tree survives an error; the lanes are re-rendered
  // from the current tree.
  resetWorkInProgressStack(runtime);
}

void finishRenderPass(LoomRuntime& runtime) {
  WorkLoopState& state = getState(runtime);
  if (state.workInProgress != NoFiber) {
    return;
  }
  // Set this to null to indicate there's no in-progress render.
  state.workInProgressRoot = nullptr;
  state.workInProgressRootRenderLanes = NoLanes;

  // It's safe to process the queue now that the render phase is complete.
  finishQueueingConcurrentUpdates(runtime);
}

} // namespace

ExecutionContext getExecutionContext(const LoomRuntime& runtime) {
  return getState(runtime).executionContext;
}

void setExecutionContext(LoomRuntime& runtime, ExecutionContext context) {
  getState(runtime).executionContext = context;
}

bool isAlreadyRendering(const LoomRuntime& runtime) {
  return (getState(runtime).executionContext & (RenderContext | CommitContext)) != NoContext;
}

FiberRoot* getWorkInProgressRoot(const LoomRuntime& runtime) {
  return getState(runtime).workInProgressRoot;
}

FiberId getWorkInProgressFiber(const LoomRuntime& runtime) {
  return getState(runtime).workInProgress;
}

Lanes getWorkInProgressRootRenderLanes(const LoomRuntime& runtime) {
  return getState(runtime).workInProgressRootRenderLanes;
}

Lanes getWorkInProgressRootSkippedLanes(const LoomRuntime& runtime) {
  return getState(runtime).workInProgressRootSkippedLanes;
}

double getCurrentTime(const LoomRuntime& runtime) {
  return runtime.now();
}

Lane requestUpdateLane(LoomRuntime& runtime, FiberId fiber) {
  (void)fiber;
  const WorkLoopState& state = getState(runtime);

  if ((state.executionContext & RenderContext) != NoContext && state.workInProgressRootRenderLanes != NoLanes) {
    // This is a render phase update. Give it the highest lane that is
    // already being rendered.
    return getHighestPriorityLane(state.workInProgressRootRenderLanes);
  }

  if (state.transitionDepth > 0) {
    return requestTransitionLane(runtime);
  }

  // Updates originating inside certain event handlers use the priority that
  // was set for the event.
  const EventPriority updatePriority = state.currentUpdatePriority;
  if (updatePriority != NoEventPriority) {
    return updatePriority;
  }

  // This update originated outside Loom. Ask the host what kind of event it is.
  return hostconfig::getCurrentEventPriority(runtime);
}

void scheduleUpdateOnRoot(LoomRuntime& runtime, FiberRoot& root, FiberId fiber, Lane lane, double eventTime) {
#ifndef NDEBUG
  if (!runtime.fiberArena().isLive(fiber)) {
    reportDevWarning("An update was scheduled from a fiber that is no longer mounted.");
  }
#else
  (void)fiber;
#endif

  throwIfInfiniteUpdateLoopDetected(runtime);

  // Mark that the root has a pending update.
  markRootUpdated(root, lane);
  if (lane != NoLane) {
    const int index = laneToIndex(lane);
    if (root.expirationTimes[index] == NoTimestamp) {
      root.expirationTimes[index] = computeExpirationTime(lane, eventTime);
    }
  }

  WorkLoopState& state = getState(runtime);
  if ((state.executionContext & RenderContext) != NoContext && &root == state.workInProgressRoot) {
    // A render phase update. The lane stays pending on the root and is part
    // of the remaining lanes the commit reschedules.
    return;
  }

  ensureRootIsScheduled(runtime, root);
}

void markSkippedUpdateLanes(LoomRuntime& runtime, Lanes lanes) {
  WorkLoopState& state = getState(runtime);
  state.workInProgressRootSkippedLanes = mergeLanes(state.workInProgressRootSkippedLanes, lanes);
}

void throwIfInfiniteUpdateLoopDetected(LoomRuntime& runtime) {
  WorkLoopState& state = getState(runtime);
  if (state.nestedUpdateCount > nestedUpdateLimit) {
    state.nestedUpdateCount = 0;
    state.rootWithNestedUpdates = nullptr;
    throw std::logic_error(
      "Maximum update depth exceeded. This can happen when an update callback "
      "repeatedly schedules a synchronous update. Loom limits the number of "
      "nested updates to prevent infinite loops.");
  }
}

FiberId prepareFreshStack(LoomRuntime& runtime, FiberRoot& root, Lanes lanes) {
  root.finishedWork = NoFiber;
  root.finishedLanes = NoLanes;

  resetWorkInProgressStack(runtime);

  WorkLoopState& state = getState(runtime);
  state.workInProgressRootExitStatus = RootExitStatus::InProgress;
  state.workInProgressRootFatalError = nullptr;
  state.workInProgressRootSkippedLanes = NoLanes;

  finishQueueingConcurrentUpdates(runtime);

  // Abandoned shadow nodes and subtrees deleted by earlier commits go away
  // before the new pass allocates.
  FiberArena& arena = runtime.fiberArena();
  arena.collectGarbage(runtime.currentRootFibers());

  const FiberNode& current = arena.get(root.current);
  const FiberId rootWorkInProgress = createWorkInProgress(arena, root.current, current.pendingProps);

  state.workInProgressRoot = &root;
  state.workInProgress = rootWorkInProgress;
  state.workInProgressRootRenderLanes = lanes;
  return rootWorkInProgress;
}

void resetWorkInProgressStack(LoomRuntime& runtime) {
  WorkLoopState& state = getState(runtime);
  state.workInProgress = NoFiber;
  state.workInProgressRoot = nullptr;
  state.workInProgressRootRenderLanes = NoLanes;
}

void performUnitOfWork(LoomRuntime& runtime, FiberId unitOfWork) {
  WorkLoopState& state = getState(runtime);
  FiberNode& fiber = runtime.fiberArena().get(unitOfWork);

  // The current, flushed, state of this fiber is the alternate. Ideally
  // nothing should rely on this, but relying on it here means that we don't
  // need an additional field on the work in progress.
  const FiberId current = fiber.alternate;

  const FiberId next = beginWork(runtime, current, unitOfWork, state.workInProgressRootRenderLanes);

  fiber.memoizedProps = fiber.pendingProps;
  if (next == NoFiber) {
    // If this doesn't spawn new work, complete the current work.
    completeUnitOfWork(runtime, unitOfWork);
  } else {
    state.workInProgress = next;
  }
}

void completeUnitOfWork(LoomRuntime& runtime, FiberId unitOfWork) {
  // Attempt to complete the current unit of work, then move to the next
  // sibling. If there are no more siblings, return to the parent fiber.
  WorkLoopState& state = getState(runtime);
  FiberArena& arena = runtime.fiberArena();
  FiberId completedWork = unitOfWork;

  do {
    FiberNode& node = arena.get(completedWork);
    completeWork(runtime, node.alternate, completedWork, state.workInProgressRootRenderLanes);

    if (node.sibling != NoFiber) {
      // If there is more work to do in this returnFiber, do that next.
      state.workInProgress = node.sibling;
      return;
    }

    // Otherwise, return to the parent
    completedWork = node.returnFiber;
    // Update the next thing we're working on in case something throws.
    state.workInProgress = completedWork;
  } while (completedWork != NoFiber);

  // We've reached the root.
  if (state.workInProgressRootExitStatus == RootExitStatus::InProgress) {
    state.workInProgressRootExitStatus = RootExitStatus::Completed;
  }
}

void workLoopSync(LoomRuntime& runtime) {
  // Perform work without checking if we need to yield between fiber.
  WorkLoopState& state = getState(runtime);
  while (state.workInProgress != NoFiber) {
    performUnitOfWork(runtime, state.workInProgress);
  }
}

void workLoopConcurrent(LoomRuntime& runtime) {
  // Perform work until Scheduler asks us to yield
  WorkLoopState& state = getState(runtime);
  while (state.workInProgress != NoFiber && !runtime.shouldYield()) {
    performUnitOfWork(runtime, state.workInProgress);
  }
}

RootExitStatus renderRootSync(LoomRuntime& runtime, FiberRoot& root, Lanes lanes) {
  WorkLoopState& state = getState(runtime);
  const ExecutionContext prevExecutionContext = state.executionContext;
  state.executionContext |= RenderContext;

  // If the root or lanes have changed, throw out the existing stack
  // and prepare a fresh one. Otherwise we'll continue where we left off.
  if (state.workInProgressRoot != &root || state.workInProgressRootRenderLanes != lanes) {
    prepareFreshStack(runtime, root, lanes);
  }

  try {
    workLoopSync(runtime);
  } catch (...) {
    handleThrow(runtime, std::current_exception());
  }

  state.executionContext = prevExecutionContext;

  const RootExitStatus exitStatus = state.workInProgressRootExitStatus;
  finishRenderPass(runtime);
  return exitStatus;
}

RootExitStatus renderRootConcurrent(LoomRuntime& runtime, FiberRoot& root, Lanes lanes) {
  WorkLoopState& state = getState(runtime);
  const ExecutionContext prevExecutionContext = state.executionContext;
  state.executionContext |= RenderContext;

  if (state.workInProgressRoot != &root || state.workInProgressRootRenderLanes != lanes) {
    prepareFreshStack(runtime, root, lanes);
  }

  try {
    workLoopConcurrent(runtime);
  } catch (...) {
    handleThrow(runtime, std::current_exception());
  }

  state.executionContext = prevExecutionContext;

  if (state.workInProgress != NoFiber) {
    // Still work remaining.
    return RootExitStatus::InProgress;
  }

  const RootExitStatus exitStatus = state.workInProgressRootExitStatus;
  finishRenderPass(runtime);
  return exitStatus;
}

FiberId beginWork(LoomRuntime& runtime, FiberId current, FiberId workInProgress, Lanes renderLanes) {
  FiberArena& arena = runtime.fiberArena();
  FiberNode& fiber = arena.get(workInProgress);

  if (const FiberNode* currentFiber = arena.tryGet(current)) {
    const bool didReceiveUpdate = currentFiber->memoizedProps != fiber.pendingProps;
    const bool hasScheduledUpdate = includesSomeLane(renderLanes, currentFiber->lanes);
    if (!didReceiveUpdate && !hasScheduledUpdate) {
      // No pending updates or context. Bail out now.
      return bailoutOnAlreadyFinishedWork(runtime, current, fiber, renderLanes);
    }
  }

  // Before entering the begin phase, clear pending update priority.
  fiber.lanes = NoLanes;

  switch (fiber.tag) {
    case WorkTag::HostRoot:
      return updateHostRoot(runtime, current, fiber, renderLanes);
    case WorkTag::ClassComponent:
      return updateClassComponent(runtime, current, fiber, renderLanes);
    case WorkTag::HostComponent:
      return updateHostComponent(runtime, current, fiber, renderLanes);
  }

  throw std::logic_error(
    std::string("Unknown unit of work tag (") + workTagName(fiber.tag) + "). This error is likely caused by a bug in Loom.");
}

void completeWork(LoomRuntime& runtime, FiberId current, FiberId workInProgress, Lanes renderLanes) {
  (void)renderLanes;
  FiberArena& arena = runtime.fiberArena();
  FiberNode& fiber = arena.get(workInProgress);

  switch (fiber.tag) {
    case WorkTag::HostComponent: {
      const FiberNode* currentFiber = arena.tryGet(current);
      if (currentFiber != nullptr && currentFiber->memoizedProps != fiber.memoizedProps) {
        // If we get updated because one of our children updated, we don't
        // have newProps so we'll have to reuse them.
        markUpdate(fiber);
      }
      break;
    }
    case WorkTag::HostRoot:
    case WorkTag::ClassComponent:
      break;
  }

  bubbleProperties(runtime, fiber);
}

void bubbleProperties(LoomRuntime& runtime, FiberNode& completedWork) {
  FiberArena& arena = runtime.fiberArena();
  const FiberNode* current = arena.tryGet(completedWork.alternate);
  const bool didBailout = current != nullptr && current->child == completedWork.child;

  Lanes newChildLanes = NoLanes;
  std::uint32_t subtreeFlags = NoFlags;

  for (FiberId child = completedWork.child; child != NoFiber; child = arena.get(child).sibling) {
    const FiberNode& node = arena.get(child);
    newChildLanes = mergeLanes(newChildLanes, mergeLanes(node.lanes, node.childLanes));
    if (!didBailout) {
      subtreeFlags |= node.subtreeFlags;
      subtreeFlags |= node.flags;
    }
  }

  // The children of a bailed out fiber still carry the flags of the commit
  // that produced them; only their lanes are live.
  completedWork.subtreeFlags = static_cast<FiberFlags>(subtreeFlags);
  completedWork.childLanes = newChildLanes;
}

} // namespace loom
