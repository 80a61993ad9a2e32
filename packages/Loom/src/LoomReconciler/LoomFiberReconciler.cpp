#include "LoomReconciler/LoomFiberReconciler.h"

#include "LoomReconciler/LoomFiberRootScheduler.h"
#include "LoomReconciler/LoomFiberWorkLoop.h"
#include "LoomRuntime/LoomRuntime.h"
#include "shared/LoomGlobalError.h"

#include <utility>
#include <vector>

namespace loom {

namespace {

Lane enqueueClassUpdate(
    LoomRuntime& runtime,
    const FiberHandle& instance,
    UpdateTag tag,
    UpdatePayload payload,
    UpdateCallback callback) {
  FiberArena& arena = runtime.fiberArena();
  if (arena.resolve(instance) == nullptr) {
#ifndef NDEBUG
    reportDevWarning(
      "Can't perform a Loom state update on a component that has been unmounted. "
      "The update is ignored.");
#endif
    return NoLane;
  }

  const FiberId fiber = instance.id;
  const Lane lane = requestUpdateLane(runtime, fiber);
  const double eventTime = getCurrentTime(runtime);

  Update update = createUpdate(eventTime, lane);
  update.tag = tag;
  update.payload = std::move(payload);
  update.callback = std::move(callback);

  FiberRoot* root = enqueueUpdate(runtime, fiber, std::move(update), lane);
  if (root == nullptr) {
    return NoLane;
  }

  scheduleUpdateOnRoot(runtime, *root, fiber, lane, eventTime);
  return lane;
}

FiberId findFiberByKey(const FiberArena& arena, FiberId rootFiber, const std::string& key) {
  std::vector<FiberId> stack;
  const FiberNode& hostRoot = arena.get(rootFiber);
  if (hostRoot.child != NoFiber) {
    stack.push_back(hostRoot.child);
  }

  while (!stack.empty()) {
    const FiberId id = stack.back();
    stack.pop_back();

    const FiberNode& node = arena.get(id);
    if (node.key == key) {
      return id;
    }
    if (node.sibling != NoFiber) {
      stack.push_back(node.sibling);
    }
    if (node.child != NoFiber) {
      stack.push_back(node.child);
    }
  }
  return NoFiber;
}

} // namespace

FiberRoot& createContainer(
    LoomRuntime& runtime,
    std::shared_ptr<void> containerInfo,
    UncaughtErrorHandler onUncaughtError) {
  return createFiberRoot(runtime, std::move(containerInfo), std::move(onUncaughtError));
}

Lane updateContainer(LoomRuntime& runtime, FiberRoot& root, Elements children, UpdateCallback callback) {
  const FiberId current = root.current;
  const Lane lane = requestUpdateLane(runtime, current);
  const double eventTime = getCurrentTime(runtime);

  Update update = createUpdate(eventTime, lane);
  ValueMap payload;
  payload["children"] = std::move(children);
  update.payload = std::move(payload);
  update.callback = std::move(callback);

  FiberRoot* scheduledRoot = enqueueUpdate(runtime, current, std::move(update), lane);
  if (scheduledRoot != nullptr) {
    scheduleUpdateOnRoot(runtime, *scheduledRoot, current, lane, eventTime);
  }
  return lane;
}

Lane enqueueSetState(
    LoomRuntime& runtime,
    const FiberHandle& instance,
    UpdatePayload payload,
    UpdateCallback callback) {
  return enqueueClassUpdate(runtime, instance, UpdateTag::UpdateState, std::move(payload), std::move(callback));
}

Lane enqueueReplaceState(
    LoomRuntime& runtime,
    const FiberHandle& instance,
    UpdatePayload payload,
    UpdateCallback callback) {
  return enqueueClassUpdate(runtime, instance, UpdateTag::ReplaceState, std::move(payload), std::move(callback));
}

Lane enqueueForceUpdate(LoomRuntime& runtime, const FiberHandle& instance, UpdateCallback callback) {
  return enqueueClassUpdate(runtime, instance, UpdateTag::ForceUpdate, UpdatePayload{}, std::move(callback));
}

void flushSync(LoomRuntime& runtime, const std::function<void()>& fn) {
  WorkLoopState& state = runtime.workLoopState();
#ifndef NDEBUG
  if (isAlreadyRendering(runtime)) {
    reportDevWarning(
      "flushSync was called from inside a render or commit. Loom cannot flush "
      "when already rendering; the work is flushed once the current pass ends.");
  }
#endif

  const ExecutionContext prevExecutionContext = state.executionContext;
  const EventPriority previousPriority = state.currentUpdatePriority;
  state.executionContext |= BatchedContext;
  state.currentUpdatePriority = DiscreteEventPriority;

  try {
    if (fn) {
      fn();
    }
  } catch (...) {
    state.currentUpdatePriority = previousPriority;
    state.executionContext = prevExecutionContext;
    throw;
  }

  state.currentUpdatePriority = previousPriority;
  state.executionContext = prevExecutionContext;

  // Flush the immediate callbacks that were scheduled during this batch.
  if (!isAlreadyRendering(runtime)) {
    flushSyncWorkOnAllRoots(runtime);
  }
}

void batchedUpdates(LoomRuntime& runtime, const std::function<void()>& fn) {
  WorkLoopState& state = runtime.workLoopState();
  const ExecutionContext prevExecutionContext = state.executionContext;
  state.executionContext |= BatchedContext;

  try {
    fn();
  } catch (...) {
    state.executionContext = prevExecutionContext;
    throw;
  }

  state.executionContext = prevExecutionContext;
  if (state.executionContext == NoContext) {
    flushSyncWorkOnAllRoots(runtime);
  }
}

void startTransition(LoomRuntime& runtime, const std::function<void()>& fn) {
  WorkLoopState& state = runtime.workLoopState();
  ++state.transitionDepth;
  try {
    fn();
  } catch (...) {
    --state.transitionDepth;
    throw;
  }
  --state.transitionDepth;
}

void runWithEventPriority(LoomRuntime& runtime, EventPriority priority, const std::function<void()>& fn) {
  WorkLoopState& state = runtime.workLoopState();
  const EventPriority previousPriority = state.currentUpdatePriority;
  state.currentUpdatePriority = priority;
  try {
    fn();
  } catch (...) {
    state.currentUpdatePriority = previousPriority;
    throw;
  }
  state.currentUpdatePriority = previousPriority;
}

EventPriority getCurrentUpdatePriority(const LoomRuntime& runtime) {
  return runtime.workLoopState().currentUpdatePriority;
}

FiberHandle findCurrentFiberByKey(const LoomRuntime& runtime, const FiberRoot& root, const std::string& key) {
  const FiberArena& arena = runtime.fiberArena();
  const FiberId fiber = findFiberByKey(arena, root.current, key);
  if (fiber == NoFiber) {
    return FiberHandle{};
  }
  return arena.handleOf(fiber);
}

StatePtr getCurrentState(const LoomRuntime& runtime, const FiberRoot& root, const std::string& key) {
  const FiberArena& arena = runtime.fiberArena();
  const FiberId fiber = findFiberByKey(arena, root.current, key);
  if (fiber == NoFiber) {
    return nullptr;
  }
  return arena.get(fiber).memoizedState;
}

} // namespace loom
