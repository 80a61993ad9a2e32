#include "LoomReconciler/LoomEventPriorities.h"
#include "LoomReconciler/LoomFiberLane.h"
#include "LoomReconciler/LoomFiberRoot.h"
#include "LoomReconciler/LoomFiberRootScheduler.h"

#include <cassert>
#include <stdexcept>
#include <string>

namespace loom::test {

namespace {

FiberRoot makeRoot() {
  FiberRoot root{};
  root.expirationTimes.fill(NoTimestamp);
  return root;
}

void testSetOperations() {
  const Lanes both = mergeLanes(SyncLane, DefaultLane);
  assert(both.bits() == 0b10001u);
  assert(both == (SyncLane | DefaultLane));
  assert(intersectLanes(both, DefaultLane) == DefaultLane);
  assert(removeLanes(both, SyncLane) == DefaultLane);
  assert(includesSomeLane(both, SyncLane));
  assert(!includesSomeLane(both, InputContinuousLane));
  assert(isSubsetOfLanes(both, DefaultLane));
  assert(!isSubsetOfLanes(DefaultLane, both));
  // The empty set is a subset of everything.
  assert(isSubsetOfLanes(SyncLane, NoLane));
  assert(both.count() == 2);
  assert(NoLanes.isEmpty());
  assert(TransitionLanes.count() == 16);
  assert(RetryLanes.count() == 5);

  Lanes accumulated = NoLanes;
  accumulated |= IdleLane;
  accumulated |= SyncLane;
  accumulated &= IdleLane;
  assert(accumulated == IdleLane);

  assert(getHighestPriorityLane(both) == SyncLane);
  assert(getHighestPriorityLane(NoLanes) == NoLane);
  assert(laneToIndex(DefaultLane) == 4);
  assert(Lanes::fromIndex(4) == DefaultLane);
  assert(pickArbitraryLaneIndex(IdleLane | SyncLane) == 29);

  bool threw = false;
  try {
    Lanes::fromBits(1u << 31);
  } catch (const std::out_of_range&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    Lanes::fromIndex(TotalLanes);
  } catch (const std::out_of_range&) {
    threw = true;
  }
  assert(threw);

  assert(std::string(laneName(SyncLane)) == "Sync");
  assert(std::string(laneName(TransitionLane3)) == "Transition");
  assert(std::string(laneName(RetryLane2)) == "Retry");
  assert(std::string(laneName(SyncLane | DefaultLane)) == "Mixed");
}

void testHighestPriorityLanesBatchesTransitions() {
  assert(getHighestPriorityLanes(SyncLane | DefaultLane) == SyncLane);
  assert(getHighestPriorityLanes(DefaultLane | TransitionLane1) == DefaultLane);
  const Lanes transitions = TransitionLane2 | TransitionLane5 | RetryLane1;
  assert(getHighestPriorityLanes(transitions) == (TransitionLane2 | TransitionLane5));
  assert(getHighestPriorityLanes(RetryLane1 | RetryLane3 | IdleLane) == (RetryLane1 | RetryLane3));
  assert(getHighestPriorityLanes(IdleLane | OffscreenLane) == IdleLane);
  assert(includesOnlyTransitions(TransitionLane1 | TransitionLane2));
  assert(!includesOnlyTransitions(TransitionLane1 | DefaultLane));
  assert(!includesOnlyTransitions(NoLanes));
  assert(isTransitionLane(TransitionLane16));
}

void testGetNextLanes() {
  FiberRoot root = makeRoot();
  assert(getNextLanes(root, NoLanes) == NoLanes);

  markRootUpdated(root, DefaultLane);
  markRootUpdated(root, IdleLane);
  assert(getNextLanes(root, NoLanes) == DefaultLane);

  // Lower or equal priority work never interrupts a render in progress.
  markRootUpdated(root, TransitionLane1);
  assert(getNextLanes(root, DefaultLane) == DefaultLane);

  // Higher priority work does.
  markRootUpdated(root, SyncLane);
  assert(getNextLanes(root, DefaultLane) == SyncLane);

  // A default update does not interrupt a transition.
  FiberRoot transitionRoot = makeRoot();
  markRootUpdated(transitionRoot, TransitionLane1);
  markRootUpdated(transitionRoot, DefaultLane);
  assert(getNextLanes(transitionRoot, TransitionLane1) == TransitionLane1);
  assert(getNextLanes(transitionRoot, NoLanes) == DefaultLane);

  // Idle work waits for all non-idle work, even suspended work.
  FiberRoot idleRoot = makeRoot();
  markRootUpdated(idleRoot, IdleLane);
  markRootUpdated(idleRoot, DefaultLane);
  markRootSuspended(idleRoot, DefaultLane);
  assert(getNextLanes(idleRoot, NoLanes) == NoLanes);
  markRootPinged(idleRoot, DefaultLane);
  assert(getNextLanes(idleRoot, NoLanes) == DefaultLane);

  markRootFinished(idleRoot, IdleLane);
  assert(idleRoot.pendingLanes == IdleLane);
  assert(idleRoot.suspendedLanes == NoLanes);
  assert(getNextLanes(idleRoot, NoLanes) == IdleLane);
}

void testSuspendedLanesAreUnblockedByUpdates() {
  FiberRoot root = makeRoot();
  markRootUpdated(root, DefaultLane);
  root.expirationTimes[laneToIndex(DefaultLane)] = 100.0;
  markRootSuspended(root, DefaultLane);
  assert(root.suspendedLanes == DefaultLane);
  assert(root.expirationTimes[laneToIndex(DefaultLane)] == NoTimestamp);

  // Idle updates do not wake suspended work.
  markRootUpdated(root, IdleLane);
  assert(root.suspendedLanes == DefaultLane);

  markRootUpdated(root, SyncLane);
  assert(root.suspendedLanes == NoLanes);
  assert(getNextLanes(root, NoLanes) == SyncLane);
}

void testExpiration() {
  assert(computeExpirationTime(SyncLane, 10.0) == 260.0);
  assert(computeExpirationTime(InputContinuousLane, 10.0) == 260.0);
  assert(computeExpirationTime(DefaultLane, 10.0) == 5010.0);
  assert(computeExpirationTime(TransitionLane4, 10.0) == 5010.0);
  assert(computeExpirationTime(RetryLane1, 10.0) == NoTimestamp);
  assert(computeExpirationTime(IdleLane, 10.0) == NoTimestamp);

  FiberRoot root = makeRoot();
  markRootUpdated(root, DefaultLane);
  markRootUpdated(root, RetryLane1);

  markStarvedLanesAsExpired(root, 0.0);
  assert(root.expirationTimes[laneToIndex(DefaultLane)] == 5000.0);
  assert(root.expirationTimes[laneToIndex(RetryLane1)] == NoTimestamp);
  assert(root.expiredLanes == NoLanes);

  markStarvedLanesAsExpired(root, 4999.0);
  assert(!includesExpiredLane(root, DefaultLane));

  markStarvedLanesAsExpired(root, 5000.0);
  assert(includesExpiredLane(root, DefaultLane));
  assert(!includesExpiredLane(root, RetryLane1));

  markRootFinished(root, RetryLane1);
  assert(root.expiredLanes == NoLanes);
  assert(root.expirationTimes[laneToIndex(DefaultLane)] == NoTimestamp);
  assert(root.pendingLanes == RetryLane1);
}

void testTransitionLanesCycle() {
  Lane next = TransitionLane1;
  assert(claimNextTransitionLane(next) == TransitionLane1);
  assert(claimNextTransitionLane(next) == TransitionLane2);
  for (int i = 0; i < 13; ++i) {
    claimNextTransitionLane(next);
  }
  assert(claimNextTransitionLane(next) == TransitionLane16);
  // The lanes wrap around once all sixteen were handed out.
  assert(claimNextTransitionLane(next) == TransitionLane1);
}

void testEventPriorities() {
  assert(lanesToEventPriority(SyncLane | DefaultLane) == DiscreteEventPriority);
  assert(lanesToEventPriority(InputContinuousLane) == ContinuousEventPriority);
  assert(lanesToEventPriority(TransitionLane2) == DefaultEventPriority);
  assert(lanesToEventPriority(RetryLane1) == DefaultEventPriority);
  assert(lanesToEventPriority(IdleLane) == IdleEventPriority);

  assert(eventPriorityToSchedulerPriority(DiscreteEventPriority) == SchedulerPriority::UserBlockingPriority);
  assert(eventPriorityToSchedulerPriority(ContinuousEventPriority) == SchedulerPriority::UserBlockingPriority);
  assert(eventPriorityToSchedulerPriority(DefaultEventPriority) == SchedulerPriority::NormalPriority);
  assert(eventPriorityToSchedulerPriority(IdleEventPriority) == SchedulerPriority::IdlePriority);

  assert(schedulerPriorityToEventPriority(SchedulerPriority::ImmediatePriority) == DiscreteEventPriority);
  assert(schedulerPriorityToEventPriority(SchedulerPriority::UserBlockingPriority) == ContinuousEventPriority);
  assert(schedulerPriorityToEventPriority(SchedulerPriority::NormalPriority) == DefaultEventPriority);
  assert(schedulerPriorityToEventPriority(SchedulerPriority::LowPriority) == IdleEventPriority);

  assert(toSchedulerPriority(SyncLane) == SchedulerPriority::UserBlockingPriority);
  assert(toSchedulerPriority(DefaultLane) == SchedulerPriority::NormalPriority);
  assert(toSchedulerPriority(TransitionLane1) == SchedulerPriority::NormalPriority);
  assert(toSchedulerPriority(IdleLane) == SchedulerPriority::IdlePriority);
  assert(toSchedulerPriority(NoLane) == SchedulerPriority::NormalPriority);

  assert(isHigherEventPriority(DiscreteEventPriority, DefaultEventPriority));
  assert(!isHigherEventPriority(NoEventPriority, DefaultEventPriority));
  assert(higherEventPriority(IdleEventPriority, ContinuousEventPriority) == ContinuousEventPriority);
  assert(lowerEventPriority(IdleEventPriority, ContinuousEventPriority) == IdleEventPriority);
}

} // namespace

bool runLoomFiberLaneTests() {
  testSetOperations();
  testHighestPriorityLanesBatchesTransitions();
  testGetNextLanes();
  testSuspendedLanesAreUnblockedByUpdates();
  testExpiration();
  testTransitionLanesCycle();
  testEventPriorities();
  return true;
}

} // namespace loom::test
