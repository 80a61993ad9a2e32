#include "LoomReconciler/LoomFiberConcurrentUpdates.h"

#include "LoomReconciler/LoomFiberRoot.h"
#include "LoomRuntime/LoomRuntime.h"

#include <utility>

namespace loom {

namespace {

ConcurrentUpdatesState& getState(LoomRuntime& runtime) {
  return runtime.concurrentUpdatesState();
}

void markFiberLanes(FiberArena& arena, FiberNode& fiber, Lane lane) {
  fiber.lanes = mergeLanes(fiber.lanes, lane);
  if (FiberNode* alternate = arena.tryGet(fiber.alternate)) {
    alternate->lanes = mergeLanes(alternate->lanes, lane);
  }
}

void enqueueUpdateInternal(
    LoomRuntime& runtime,
    FiberId fiberId,
    std::shared_ptr<SharedQueue> queue,
    Update update,
    Lane lane) {
  FiberArena& arena = runtime.fiberArena();
  ConcurrentUpdatesState& state = getState(runtime);

  ConcurrentUpdate entry;
  entry.fiber = arena.handleOf(fiberId);
  entry.queue = std::move(queue);
  entry.update = std::move(update);
  entry.lane = lane;
  state.concurrentQueues.push_back(std::move(entry));

  state.concurrentlyUpdatedLanes = mergeLanes(state.concurrentlyUpdatedLanes, lane);

  // The fiber's `lane` field is used in some places to check if any work is
  // scheduled, to perform an eager bailout, so we need to update it
  // immediately.
  markFiberLanes(arena, arena.get(fiberId), lane);
}

} // namespace

FiberRoot* enqueueConcurrentClassUpdate(
    LoomRuntime& runtime,
    FiberId fiber,
    std::shared_ptr<SharedQueue> queue,
    Update update,
    Lane lane) {
  enqueueUpdateInternal(runtime, fiber, std::move(queue), std::move(update), lane);
  return getRootForUpdatedFiber(runtime, fiber);
}

void finishQueueingConcurrentUpdates(LoomRuntime& runtime) {
  ConcurrentUpdatesState& state = getState(runtime);
  std::vector<ConcurrentUpdate> queues = std::move(state.concurrentQueues);
  state.concurrentQueues.clear();
  state.concurrentlyUpdatedLanes = NoLanes;

  FiberArena& arena = runtime.fiberArena();
  for (ConcurrentUpdate& entry : queues) {
    FiberNode* fiber = arena.resolve(entry.fiber);
    if (fiber == nullptr) {
      // The fiber was released before the update was processed.
      continue;
    }

    if (entry.queue != nullptr) {
      entry.queue->pending.push_back(std::move(entry.update));
    }

    if (entry.lane != NoLane) {
      markUpdateLaneFromFiberToRoot(runtime, entry.fiber.id, entry.lane);
    }
  }
}

Lanes getConcurrentlyUpdatedLanes(const LoomRuntime& runtime) {
  return runtime.concurrentUpdatesState().concurrentlyUpdatedLanes;
}

void markUpdateLaneFromFiberToRoot(LoomRuntime& runtime, FiberId sourceFiberId, Lane lane) {
  FiberArena& arena = runtime.fiberArena();
  FiberNode* sourceFiber = arena.tryGet(sourceFiberId);
  if (sourceFiber == nullptr) {
    return;
  }

  // Update the source fiber's lanes
  markFiberLanes(arena, *sourceFiber, lane);

  // Walk the parent path to the root and update the child lanes.
  FiberNode* parent = arena.tryGet(sourceFiber->returnFiber);
  while (parent != nullptr) {
    parent->childLanes = mergeLanes(parent->childLanes, lane);
    if (FiberNode* alternate = arena.tryGet(parent->alternate)) {
      alternate->childLanes = mergeLanes(alternate->childLanes, lane);
    }
    parent = arena.tryGet(parent->returnFiber);
  }
}

FiberRoot* getRootForUpdatedFiber(LoomRuntime& runtime, FiberId sourceFiberId) {
  FiberArena& arena = runtime.fiberArena();
  FiberNode* node = arena.tryGet(sourceFiberId);
  if (node == nullptr) {
    return nullptr;
  }

  FiberNode* parent = arena.tryGet(node->returnFiber);
  while (parent != nullptr) {
    node = parent;
    parent = arena.tryGet(node->returnFiber);
  }

  return node->tag == WorkTag::HostRoot ? node->root : nullptr;
}

} // namespace loom
