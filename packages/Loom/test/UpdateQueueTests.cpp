#include "LoomReconciler/LoomFiberClassUpdateQueue.h"
#include "LoomReconciler/LoomFiberConcurrentUpdates.h"
#include "LoomReconciler/LoomFiberFlags.h"
#include "LoomReconciler/LoomFiberWorkLoop.h"
#include "LoomRuntime/LoomRuntime.h"
#include "LoomScheduler/SchedulerHost.h"

#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace loom::test {

namespace {

Updater append(std::string suffix) {
  return [suffix](const ValueMap& prevState, const Props& props) {
    (void)props;
    ValueMap next;
    next["text"] = getValueOr<std::string>(prevState, "text", "") + suffix;
    return next;
  };
}

std::string textOf(const StatePtr& state) {
  return state != nullptr ? getValueOr<std::string>(*state, "text", "<none>") : "<null>";
}

Update makeUpdate(Lane lane, UpdatePayload payload, UpdateCallback callback = {}) {
  Update update = createUpdate(0.0, lane);
  update.payload = std::move(payload);
  update.callback = std::move(callback);
  return update;
}

FiberId createStatefulFiber(FiberArena& arena, const std::string& text) {
  const FiberId id = createFiber(arena, WorkTag::ClassComponent, emptyProps(), "");
  FiberNode& fiber = arena.get(id);
  ValueMap state;
  state["text"] = text;
  fiber.memoizedState = std::make_shared<const ValueMap>(std::move(state));
  initializeUpdateQueue(fiber);
  return id;
}

void testSkippedUpdatesRebaseInSubmissionOrder() {
  MockSchedulerHost host;
  LoomRuntime runtime(host);
  FiberArena& arena = runtime.fiberArena();
  const FiberId id = createStatefulFiber(arena, "");
  FiberNode& fiber = arena.get(id);
  UpdateQueue& queue = *fiber.updateQueue;

  std::vector<std::string> callbacks;
  queue.shared->pending.push_back(makeUpdate(DefaultLane, append("1")));
  queue.shared->pending.push_back(makeUpdate(SyncLane, append("2"), [&callbacks] {
    callbacks.push_back("2");
  }));
  queue.shared->pending.push_back(makeUpdate(DefaultLane, append("3"), [&callbacks] {
    callbacks.push_back("3");
  }));

  // A sync pass applies only the sync update, on top of the state it saw.
  UpdateQueueResult result = processUpdateQueue(runtime, fiber, *emptyProps(), SyncLane);
  assert(textOf(fiber.memoizedState) == "2");
  assert(result.skippedLanes == DefaultLane);
  assert(!result.hasForceUpdate);
  assert(fiber.lanes == DefaultLane);
  assert(getWorkInProgressRootSkippedLanes(runtime) == DefaultLane);
  assert(queue.shared->pending.empty());
  // The base state is the state before the first skipped update, and every
  // update after it is kept so it is re-applied in order.
  assert(textOf(queue.baseState) == "");
  assert(queue.baseUpdates.size() == 3);
  assert(queue.baseUpdates[1].lane == NoLane);
  assert(hasFlag(fiber.flags, Callback));

  assert(commitCallbacks(queue) == nullptr);
  assert((callbacks == std::vector<std::string>{"2"}));

  fiber.flags = NoFlags;
  result = processUpdateQueue(runtime, fiber, *emptyProps(), DefaultLane);
  assert(textOf(fiber.memoizedState) == "123");
  assert(result.skippedLanes == NoLanes);
  assert(fiber.lanes == NoLanes);
  assert(queue.baseUpdates.empty());
  assert(queue.baseState == fiber.memoizedState);

  // The rebased copy of a committed update does not run its callback again.
  assert(commitCallbacks(queue) == nullptr);
  assert((callbacks == std::vector<std::string>{"2", "3"}));
}

void testReprocessingAppliedQueueIsStable() {
  MockSchedulerHost host;
  LoomRuntime runtime(host);
  FiberArena& arena = runtime.fiberArena();
  const FiberId id = createStatefulFiber(arena, "");
  FiberNode& fiber = arena.get(id);
  UpdateQueue& queue = *fiber.updateQueue;

  int ran = 0;
  queue.shared->pending.push_back(makeUpdate(DefaultLane, append("1")));
  queue.shared->pending.push_back(makeUpdate(SyncLane, append("2"), [&ran] {
    ++ran;
  }));
  queue.shared->pending.push_back(makeUpdate(DefaultLane, append("3")));

  const UpdateQueueResult first = processUpdateQueue(runtime, fiber, *emptyProps(), SyncLane);
  assert(commitCallbacks(queue) == nullptr);
  const std::string firstState = textOf(fiber.memoizedState);
  const std::string firstBaseState = textOf(queue.baseState);
  std::vector<Lane> firstBaseLanes;
  for (const Update& update : queue.baseUpdates) {
    firstBaseLanes.push_back(update.lane);
  }

  // Nothing new is pending; the skipped updates stay skipped.
  const UpdateQueueResult second = processUpdateQueue(runtime, fiber, *emptyProps(), SyncLane);
  std::vector<Lane> secondBaseLanes;
  for (const Update& update : queue.baseUpdates) {
    secondBaseLanes.push_back(update.lane);
  }

  assert(firstState == "2");
  assert(textOf(fiber.memoizedState) == firstState);
  assert(textOf(queue.baseState) == firstBaseState);
  assert((firstBaseLanes == std::vector<Lane>{DefaultLane, NoLane, DefaultLane}));
  assert(secondBaseLanes == firstBaseLanes);
  assert(second.skippedLanes == first.skippedLanes);
  assert(second.skippedLanes == DefaultLane);
  assert(fiber.lanes == DefaultLane);
  assert(!second.hasForceUpdate);

  // The rebased copy carries no callback, so nothing is queued twice.
  assert(queue.callbacks.empty());
  assert(ran == 1);
}

void testStateFromUpdate() {
  ValueMap prev;
  prev["a"] = 1;
  prev["b"] = 2;
  const Props props;

  ValueMap partial;
  partial["b"] = 20;
  partial["c"] = 30;

  bool force = false;
  Update merge = makeUpdate(DefaultLane, partial);
  ValueMap merged = getStateFromUpdate(merge, prev, props, force);
  assert(getValueOr<int>(merged, "a", 0) == 1);
  assert(getValueOr<int>(merged, "b", 0) == 20);
  assert(getValueOr<int>(merged, "c", 0) == 30);

  Update replace = makeUpdate(DefaultLane, partial);
  replace.tag = UpdateTag::ReplaceState;
  ValueMap replaced = getStateFromUpdate(replace, prev, props, force);
  assert(replaced.count("a") == 0);
  assert(getValueOr<int>(replaced, "b", 0) == 20);

  Update empty = makeUpdate(DefaultLane, UpdatePayload{});
  ValueMap unchanged = getStateFromUpdate(empty, prev, props, force);
  assert(unchanged.size() == 2);
  assert(!force);

  Update forceUpdate = makeUpdate(DefaultLane, UpdatePayload{});
  forceUpdate.tag = UpdateTag::ForceUpdate;
  getStateFromUpdate(forceUpdate, prev, props, force);
  assert(force);

  PropsPtr withStep = makeProps({{"step", 5}});
  Update functional = makeUpdate(DefaultLane, Updater([](const ValueMap& state, const Props& nextProps) {
    ValueMap next;
    next["a"] = getValueOr<int>(state, "a", 0) + getValueOr<int>(nextProps.values, "step", 0);
    return next;
  }));
  force = false;
  ValueMap computed = getStateFromUpdate(functional, prev, *withStep, force);
  assert(getValueOr<int>(computed, "a", 0) == 6);
  assert(getValueOr<int>(computed, "b", 0) == 2);
}

void testDiscardedRenderKeepsUpdates() {
  MockSchedulerHost host;
  LoomRuntime runtime(host);
  FiberArena& arena = runtime.fiberArena();
  const FiberId current = createStatefulFiber(arena, "a");

  arena.get(current).updateQueue->shared->pending.push_back(makeUpdate(DefaultLane, append("b")));

  FiberId workInProgress = createWorkInProgress(arena, current, emptyProps());
  assert(arena.get(workInProgress).updateQueue == arena.get(current).updateQueue);

  processUpdateQueue(runtime, arena.get(workInProgress), *emptyProps(), SyncLane);
  // The shadow fiber got its own queue; the current one kept the update.
  assert(arena.get(workInProgress).updateQueue != arena.get(current).updateQueue);
  assert(arena.get(current).updateQueue->baseUpdates.size() == 1);
  assert(textOf(arena.get(workInProgress).memoizedState) == "a");

  // Throw the shadow fiber away and render again from the current one.
  workInProgress = createWorkInProgress(arena, current, emptyProps());
  processUpdateQueue(runtime, arena.get(workInProgress), *emptyProps(), DefaultLane);
  assert(textOf(arena.get(workInProgress).memoizedState) == "ab");
  assert(textOf(arena.get(current).memoizedState) == "a");
}

void testCommitCallbacksRunsEveryCallback() {
  UpdateQueue queue;
  std::vector<std::string> ran;
  queue.callbacks.push_back([&ran] {
    ran.push_back("first");
    throw std::runtime_error("first failed");
  });
  queue.callbacks.push_back([&ran] {
    ran.push_back("second");
    throw std::runtime_error("second failed");
  });
  queue.callbacks.push_back([&ran] {
    ran.push_back("third");
  });

  std::exception_ptr error = commitCallbacks(queue);
  assert(error != nullptr);
  assert((ran == std::vector<std::string>{"first", "second", "third"}));
  assert(queue.callbacks.empty());

  bool sawFirst = false;
  try {
    std::rethrow_exception(error);
  } catch (const std::runtime_error& ex) {
    sawFirst = std::string(ex.what()) == "first failed";
  }
  assert(sawFirst);
}

void testEnqueueBuffersUntilFinished() {
  MockSchedulerHost host;
  LoomRuntime runtime(host);
  FiberArena& arena = runtime.fiberArena();
  const FiberId detached = createStatefulFiber(arena, "");
  const FiberId withoutQueue = createFiber(arena, WorkTag::HostComponent, emptyProps(), "");

  assert(enqueueUpdate(runtime, withoutQueue, makeUpdate(DefaultLane, append("x")), DefaultLane) == nullptr);

  // A fiber outside any root is buffered but has no root to schedule.
  assert(enqueueUpdate(runtime, detached, makeUpdate(DefaultLane, append("x")), DefaultLane) == nullptr);
  assert(arena.get(detached).lanes == DefaultLane);
  assert(getConcurrentlyUpdatedLanes(runtime) == DefaultLane);
  assert(arena.get(detached).updateQueue->shared->pending.empty());

  finishQueueingConcurrentUpdates(runtime);
  assert(arena.get(detached).updateQueue->shared->pending.size() == 1);
  assert(getConcurrentlyUpdatedLanes(runtime) == NoLanes);
}

} // namespace

bool runUpdateQueueTests() {
  testSkippedUpdatesRebaseInSubmissionOrder();
  testReprocessingAppliedQueueIsStable();
  testStateFromUpdate();
  testDiscardedRenderKeepsUpdates();
  testCommitCallbacksRunsEveryCallback();
  testEnqueueBuffersUntilFinished();
  return true;
}

} // namespace loom::test
