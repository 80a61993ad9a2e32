#include "LoomReconciler/LoomFiberClassUpdateQueue.h"

#include "LoomReconciler/LoomFiberConcurrentUpdates.h"
#include "LoomReconciler/LoomFiberFlags.h"
#include "LoomReconciler/LoomFiberWorkLoop.h"
#include "LoomRuntime/LoomRuntime.h"

#include <exception>
#include <utility>

namespace loom {

namespace {

ValueMap resolvePartialState(const UpdatePayload& payload, const ValueMap& prevState, const Props& props, bool& hasPayload) {
  hasPayload = true;
  if (const auto* partial = std::get_if<ValueMap>(&payload)) {
    return *partial;
  }
  if (const auto* updater = std::get_if<Updater>(&payload)) {
    if (*updater) {
      return (*updater)(prevState, props);
    }
  }
  hasPayload = false;
  return {};
}

} // namespace

void initializeUpdateQueue(FiberNode& fiber) {
  auto queue = std::make_shared<UpdateQueue>();
  queue->baseState = fiber.memoizedState;
  queue->shared = std::make_shared<SharedQueue>();
  fiber.updateQueue = std::move(queue);
}

void cloneUpdateQueue(const FiberNode& current, FiberNode& workInProgress) {
  if (workInProgress.updateQueue == nullptr || workInProgress.updateQueue != current.updateQueue) {
    return;
  }

  const UpdateQueue& currentQueue = *current.updateQueue;
  auto clone = std::make_shared<UpdateQueue>();
  clone->baseState = currentQueue.baseState;
  clone->baseUpdates = currentQueue.baseUpdates;
  clone->shared = currentQueue.shared;
  workInProgress.updateQueue = std::move(clone);
}

Update createUpdate(double eventTime, Lane lane) {
  Update update;
  update.eventTime = eventTime;
  update.lane = lane;
  update.tag = UpdateTag::UpdateState;
  return update;
}

FiberRoot* enqueueUpdate(LoomRuntime& runtime, FiberId fiberId, Update update, Lane lane) {
  FiberNode* fiber = runtime.fiberArena().tryGet(fiberId);
  if (fiber == nullptr || fiber->updateQueue == nullptr) {
    // Only occurs if the fiber has been unmounted.
    return nullptr;
  }

  return enqueueConcurrentClassUpdate(runtime, fiberId, fiber->updateQueue->shared, std::move(update), lane);
}

ValueMap getStateFromUpdate(
    const Update& update,
    const ValueMap& prevState,
    const Props& props,
    bool& hasForceUpdate) {
  switch (update.tag) {
    case UpdateTag::ReplaceState: {
      bool hasPayload = false;
      ValueMap nextState = resolvePartialState(update.payload, prevState, props, hasPayload);
      return hasPayload ? nextState : prevState;
    }
    case UpdateTag::UpdateState: {
      bool hasPayload = false;
      ValueMap partialState = resolvePartialState(update.payload, prevState, props, hasPayload);
      if (!hasPayload) {
        // Null and undefined are treated as no-ops.
        return prevState;
      }
      // Merge the partial state and the previous state.
      ValueMap nextState = prevState;
      for (auto& entry : partialState) {
        nextState[entry.first] = std::move(entry.second);
      }
      return nextState;
    }
    case UpdateTag::ForceUpdate:
      hasForceUpdate = true;
      return prevState;
  }
  return prevState;
}

UpdateQueueResult processUpdateQueue(
    LoomRuntime& runtime,
    FiberNode& workInProgress,
    const Props& props,
    Lanes renderLanes) {
  UpdateQueueResult result;

  FiberArena& arena = runtime.fiberArena();
  FiberNode* current = arena.tryGet(workInProgress.alternate);
  if (current != nullptr) {
    cloneUpdateQueue(*current, workInProgress);
  }

  // This is always non-null on a ClassComponent or HostRoot
  UpdateQueue& queue = *workInProgress.updateQueue;

  // Check if there are pending updates. If so, transfer them to the base queue.
  if (!queue.shared->pending.empty()) {
    std::vector<Update> pendingQueue = std::move(queue.shared->pending);
    queue.shared->pending.clear();

    // If there's a current queue, and it's different from the base queue, then
    // we need to transfer the updates to that queue, too, so they survive if
    // this render is thrown away.
    if (current != nullptr && current->updateQueue != nullptr && current->updateQueue.get() != &queue) {
      std::vector<Update>& currentBaseUpdates = current->updateQueue->baseUpdates;
      currentBaseUpdates.insert(currentBaseUpdates.end(), pendingQueue.begin(), pendingQueue.end());
    }

    for (Update& update : pendingQueue) {
      queue.baseUpdates.push_back(std::move(update));
    }
  }

  if (queue.baseUpdates.empty()) {
    return result;
  }

  // Iterate through the list of updates to compute the result.
  ValueMap newState = queue.baseState != nullptr ? *queue.baseState : ValueMap{};
  Lanes newLanes = NoLanes;

  StatePtr newBaseState{};
  std::vector<Update> newBaseUpdates;

  for (const Update& update : queue.baseUpdates) {
    const Lane updateLane = update.lane;
    const bool shouldSkipUpdate = !isSubsetOfLanes(renderLanes, updateLane);

    if (shouldSkipUpdate) {
      // Priority is insufficient. Skip this update. If this is the first
      // skipped update, the previous update/state is the new base
      // update/state.
      if (newBaseUpdates.empty()) {
        newBaseState = std::make_shared<const ValueMap>(newState);
      }
      newBaseUpdates.push_back(update);
      // Update the remaining priority in the queue.
      newLanes = mergeLanes(newLanes, updateLane);
      continue;
    }

    if (!newBaseUpdates.empty()) {
      // This update is going to be committed so we never want uncommit it.
      // Using NoLane works because 0 is a subset of all bitmasks, so this
      // will never be skipped by the check above.
      Update clone;
      clone.eventTime = update.eventTime;
      clone.lane = NoLane;
      clone.tag = update.tag;
      clone.payload = update.payload;
      newBaseUpdates.push_back(std::move(clone));
    }

    // Process this update.
    newState = getStateFromUpdate(update, newState, props, result.hasForceUpdate);
    if (update.callback) {
      workInProgress.flags = static_cast<FiberFlags>(workInProgress.flags | Callback);
      queue.callbacks.push_back(update.callback);
    }
  }

  auto finalState = std::make_shared<const ValueMap>(std::move(newState));
  if (newBaseUpdates.empty()) {
    newBaseState = finalState;
  }

  queue.baseState = std::move(newBaseState);
  queue.baseUpdates = std::move(newBaseUpdates);

  // Set the remaining expiration time to be whatever is remaining in the queue.
  // This should be fine because the only two other things that contribute to
  // expiration time are props and context. We're already in the middle of the
  // begin phase by the time we start processing the queue, so we've already
  // dealt with the props.
  markSkippedUpdateLanes(runtime, newLanes);
  workInProgress.lanes = newLanes;
  workInProgress.memoizedState = std::move(finalState);

  result.skippedLanes = newLanes;
  return result;
}

std::exception_ptr commitCallbacks(UpdateQueue& queue) {
  std::vector<UpdateCallback> callbacks = std::move(queue.callbacks);
  queue.callbacks.clear();

  std::exception_ptr firstError;
  for (const UpdateCallback& callback : callbacks) {
    try {
      callback();
    } catch (...) {
      if (!firstError) {
        firstError = std::current_exception();
      }
    }
  }
  return firstError;
}

} // namespace loom
