#pragma once

#include "LoomReconciler/LoomFiber.h"
#include "LoomReconciler/LoomFiberClassUpdateQueue.h"
#include "LoomReconciler/LoomFiberLane.h"

#include <memory>
#include <vector>

namespace loom {

class LoomRuntime;
struct FiberRoot;

struct ConcurrentUpdate {
  FiberHandle fiber{};
  std::shared_ptr<SharedQueue> queue{};
  Update update{};
  Lane lane{NoLane};
};

// Updates received while a render may be in progress. They are appended to
// their queues only when no render is reading them.
struct ConcurrentUpdatesState {
  std::vector<ConcurrentUpdate> concurrentQueues{};
  Lanes concurrentlyUpdatedLanes{NoLanes};
};

FiberRoot* enqueueConcurrentClassUpdate(
  LoomRuntime& runtime,
  FiberId fiber,
  std::shared_ptr<SharedQueue> queue,
  Update update,
  Lane lane);

void finishQueueingConcurrentUpdates(LoomRuntime& runtime);
Lanes getConcurrentlyUpdatedLanes(const LoomRuntime& runtime);

void markUpdateLaneFromFiberToRoot(LoomRuntime& runtime, FiberId sourceFiber, Lane lane);
FiberRoot* getRootForUpdatedFiber(LoomRuntime& runtime, FiberId sourceFiber);

} // namespace loom
