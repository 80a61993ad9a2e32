#pragma once

#include "LoomReconciler/LoomElement.h"
#include "LoomReconciler/LoomFiber.h"
#include "LoomReconciler/LoomFiberLane.h"

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <variant>
#include <vector>

namespace loom {

class LoomRuntime;
struct FiberRoot;

enum class UpdateTag : std::uint8_t {
  UpdateState = 0,
  ReplaceState = 1,
  ForceUpdate = 2,
};

using Updater = std::function<ValueMap(const ValueMap& prevState, const Props& props)>;
using UpdatePayload = std::variant<std::monostate, ValueMap, Updater>;
using UpdateCallback = std::function<void()>;

struct Update {
  double eventTime{0.0};
  Lane lane{NoLane};
  UpdateTag tag{UpdateTag::UpdateState};
  UpdatePayload payload{};
  UpdateCallback callback{};
};

// Updates enqueued since the last render, shared by a fiber and its alternate.
struct SharedQueue {
  std::vector<Update> pending{};
};

struct UpdateQueue {
  StatePtr baseState{};
  // Updates skipped by an earlier pass, in submission order.
  std::vector<Update> baseUpdates{};
  std::shared_ptr<SharedQueue> shared{};
  // Completion callbacks collected during render, run after commit.
  std::vector<UpdateCallback> callbacks{};
};

struct UpdateQueueResult {
  bool hasForceUpdate{false};
  Lanes skippedLanes{NoLanes};
};

void initializeUpdateQueue(FiberNode& fiber);

// Gives the shadow fiber its own queue object when it still shares the
// current fiber's queue.
void cloneUpdateQueue(const FiberNode& current, FiberNode& workInProgress);

Update createUpdate(double eventTime, Lane lane);

// Buffers the update and returns the root that owns `fiber`, or nullptr when
// the fiber is no longer mounted.
FiberRoot* enqueueUpdate(LoomRuntime& runtime, FiberId fiber, Update update, Lane lane);

UpdateQueueResult processUpdateQueue(
  LoomRuntime& runtime,
  FiberNode& workInProgress,
  const Props& props,
  Lanes renderLanes);

ValueMap getStateFromUpdate(
  const Update& update,
  const ValueMap& prevState,
  const Props& props,
  bool& hasForceUpdate);

// Runs and clears the collected callbacks. Every callback runs even if an
// earlier one throws; the first error is returned.
std::exception_ptr commitCallbacks(UpdateQueue& queue);

} // namespace loom
