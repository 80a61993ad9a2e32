#pragma once

#include "LoomReconciler/LoomElement.h"
#include "LoomReconciler/LoomEventPriorities.h"
#include "LoomReconciler/LoomFiber.h"
#include "LoomReconciler/LoomFiberClassUpdateQueue.h"
#include "LoomReconciler/LoomFiberLane.h"
#include "LoomReconciler/LoomFiberRoot.h"

#include <functional>
#include <memory>
#include <string>

namespace loom {

class LoomRuntime;

FiberRoot& createContainer(
  LoomRuntime& runtime,
  std::shared_ptr<void> containerInfo,
  UncaughtErrorHandler onUncaughtError = {});

// Renders `children` into the root. Returns the lane the update was given.
Lane updateContainer(
  LoomRuntime& runtime,
  FiberRoot& root,
  Elements children,
  UpdateCallback callback = {});

// Class component updates. A handle whose fiber was released is ignored and
// NoLane is returned.
Lane enqueueSetState(
  LoomRuntime& runtime,
  const FiberHandle& instance,
  UpdatePayload payload,
  UpdateCallback callback = {});
Lane enqueueReplaceState(
  LoomRuntime& runtime,
  const FiberHandle& instance,
  UpdatePayload payload,
  UpdateCallback callback = {});
Lane enqueueForceUpdate(
  LoomRuntime& runtime,
  const FiberHandle& instance,
  UpdateCallback callback = {});

// Runs `fn` at discrete priority, then flushes all synchronous work before
// returning.
void flushSync(LoomRuntime& runtime, const std::function<void()>& fn = {});

// Runs `fn` with updates batched; sync work is flushed when the outermost
// batch exits.
void batchedUpdates(LoomRuntime& runtime, const std::function<void()>& fn);

// Updates scheduled inside `fn` get a transition lane.
void startTransition(LoomRuntime& runtime, const std::function<void()>& fn);

void runWithEventPriority(LoomRuntime& runtime, EventPriority priority, const std::function<void()>& fn);
EventPriority getCurrentUpdatePriority(const LoomRuntime& runtime);

// Depth-first search of the root's current tree.
FiberHandle findCurrentFiberByKey(const LoomRuntime& runtime, const FiberRoot& root, const std::string& key);
StatePtr getCurrentState(const LoomRuntime& runtime, const FiberRoot& root, const std::string& key);

} // namespace loom
