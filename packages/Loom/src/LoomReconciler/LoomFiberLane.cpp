#include "LoomReconciler/LoomFiberLane.h"

#include "LoomReconciler/LoomFiberRoot.h"
#include "shared/LoomFeatureFlags.h"

#include <iostream>

namespace loom {

namespace {

int indexOfHighestBit(std::uint32_t bits) {
  int index = -1;
  while (bits != 0) {
    bits >>= 1;
    ++index;
  }
  return index;
}

} // namespace

int Lanes::count() const {
  int total = 0;
  std::uint32_t remaining = bits_;
  while (remaining != 0) {
    remaining &= remaining - 1;
    ++total;
  }
  return total;
}

Lanes getHighestPriorityLanes(Lanes lanes) {
  const Lane lane = getHighestPriorityLane(lanes);
  if (lane == SyncLane || lane == InputContinuousLane || lane == DefaultLane) {
    return lane;
  }
  if (lane.includesSome(TransitionLanes)) {
    return lanes.intersect(TransitionLanes);
  }
  if (lane.includesSome(RetryLanes)) {
    return lanes.intersect(RetryLanes);
  }
  if (lane == IdleLane || lane == OffscreenLane) {
    return lane;
  }
#ifndef NDEBUG
  if (!lanes.isEmpty()) {
    std::cerr << "Should have found matching lanes. This is a bug in Loom." << std::endl;
  }
#endif
  // This shouldn't be reachable, but as a fallback, return the entire bitmask.
  return lanes;
}

int pickArbitraryLaneIndex(Lanes lanes) {
  return indexOfHighestBit(lanes.bits());
}

int laneToIndex(Lane lane) {
  return pickArbitraryLaneIndex(lane);
}

const char* laneName(Lane lane) {
  if (lane == NoLane) {
    return "NoLane";
  }
  if (lane == SyncLane) {
    return "Sync";
  }
  if (lane == InputContinuousLane) {
    return "InputContinuous";
  }
  if (lane == DefaultLane) {
    return "Default";
  }
  if (lane.isSubsetOf(TransitionLanes)) {
    return "Transition";
  }
  if (lane.isSubsetOf(RetryLanes)) {
    return "Retry";
  }
  if (lane == IdleLane) {
    return "Idle";
  }
  if (lane == OffscreenLane) {
    return "Offscreen";
  }
  return "Mixed";
}

Lanes getNextLanes(const FiberRoot& root, Lanes wipLanes) {
  // Early bailout if there's no pending work left.
  const Lanes pendingLanes = root.pendingLanes;
  if (pendingLanes == NoLanes) {
    return NoLanes;
  }

  Lanes nextLanes = NoLanes;

  const Lanes suspendedLanes = root.suspendedLanes;
  const Lanes pingedLanes = root.pingedLanes;

  // Do not work on any idle work until all the non-idle work has finished,
  // even if the work is suspended.
  const Lanes nonIdlePendingLanes = pendingLanes.intersect(NonIdleLanes);
  if (nonIdlePendingLanes != NoLanes) {
    const Lanes nonIdleUnblockedLanes = nonIdlePendingLanes.remove(suspendedLanes);
    if (nonIdleUnblockedLanes != NoLanes) {
      nextLanes = getHighestPriorityLanes(nonIdleUnblockedLanes);
    } else {
      const Lanes nonIdlePingedLanes = nonIdlePendingLanes.intersect(pingedLanes);
      if (nonIdlePingedLanes != NoLanes) {
        nextLanes = getHighestPriorityLanes(nonIdlePingedLanes);
      }
    }
  } else {
    // The only remaining work is Idle.
    const Lanes unblockedLanes = pendingLanes.remove(suspendedLanes);
    if (unblockedLanes != NoLanes) {
      nextLanes = getHighestPriorityLanes(unblockedLanes);
    } else {
      const Lanes idlePingedLanes = pendingLanes.intersect(pingedLanes);
      if (idlePingedLanes != NoLanes) {
        nextLanes = getHighestPriorityLanes(idlePingedLanes);
      }
    }
  }

  if (nextLanes == NoLanes) {
    // This should only be reachable if we're suspended
    return NoLanes;
  }

  // If we're already in the middle of a render, switching lanes will interrupt
  // it and we'll lose our progress. We should only do this if the new lanes are
  // higher priority.
  if (wipLanes != NoLanes && wipLanes != nextLanes && !wipLanes.includesSome(suspendedLanes)) {
    const Lane nextLane = getHighestPriorityLane(nextLanes);
    const Lane wipLane = getHighestPriorityLane(wipLanes);
    if (nextLane.bits() >= wipLane.bits() ||
        // Default priority updates should not interrupt transition updates.
        (nextLane == DefaultLane && wipLane.includesSome(TransitionLanes))) {
      // Keep working on the existing in-progress tree. Do not interrupt.
      return wipLanes;
    }
  }

  return nextLanes;
}

double computeExpirationTime(Lane lane, double currentTime) {
  if (lane == SyncLane || lane == InputContinuousLane) {
    return currentTime + 250.0;
  }
  if (lane == DefaultLane) {
    return currentTime + 5000.0;
  }
  if (lane.includesSome(TransitionLanes)) {
    return enableTransitionExpiration ? currentTime + 5000.0 : NoTimestamp;
  }
  // Retry, idle and offscreen work never expires.
  return NoTimestamp;
}

void markStarvedLanesAsExpired(FiberRoot& root, double currentTime) {
  const Lanes pendingLanes = root.pendingLanes;
  const Lanes suspendedLanes = root.suspendedLanes;
  const Lanes pingedLanes = root.pingedLanes;

  // Iterate through the pending lanes and check if we've reached their
  // expiration time. If so, we'll assume the update is being starved and mark
  // it as expired to force it to finish.
  Lanes lanes = pendingLanes.remove(RetryLanes);
  while (lanes != NoLanes) {
    const int index = pickArbitraryLaneIndex(lanes);
    const Lane lane = Lanes::fromIndex(index);

    const double expirationTime = root.expirationTimes[index];
    if (expirationTime == NoTimestamp) {
      // Found a pending lane with no expiration time. If it's not suspended, or
      // if it's pinged, assume it's CPU-bound. Compute a new expiration time
      // using the current time.
      if (!lane.includesSome(suspendedLanes) || lane.includesSome(pingedLanes)) {
        root.expirationTimes[index] = computeExpirationTime(lane, currentTime);
      }
    } else if (expirationTime <= currentTime) {
      // This lane expired
      root.expiredLanes |= lane;
    }

    lanes = lanes.remove(lane);
  }
}

bool includesExpiredLane(const FiberRoot& root, Lanes lanes) {
  return lanes.includesSome(root.expiredLanes);
}

void markRootUpdated(FiberRoot& root, Lane updateLane) {
  root.pendingLanes |= updateLane;

  // An update may unblock suspended work. Idle updates are excluded so they
  // cannot keep waking up suspended work of a higher priority.
  if (updateLane != IdleLane) {
    root.suspendedLanes = NoLanes;
    root.pingedLanes = NoLanes;
  }
}

void markRootSuspended(FiberRoot& root, Lanes suspendedLanes) {
  root.suspendedLanes |= suspendedLanes;
  root.pingedLanes = root.pingedLanes.remove(suspendedLanes);

  // The suspended lanes are no longer CPU-bound. Clear their expiration times.
  Lanes lanes = suspendedLanes;
  while (lanes != NoLanes) {
    const int index = pickArbitraryLaneIndex(lanes);
    root.expirationTimes[index] = NoTimestamp;
    lanes = lanes.remove(Lanes::fromIndex(index));
  }
}

void markRootPinged(FiberRoot& root, Lanes pingedLanes) {
  root.pingedLanes |= root.suspendedLanes.intersect(pingedLanes);
}

void markRootFinished(FiberRoot& root, Lanes remainingLanes) {
  const Lanes noLongerPendingLanes = root.pendingLanes.remove(remainingLanes);

  root.pendingLanes = remainingLanes;

  // Let's try everything again
  root.suspendedLanes = NoLanes;
  root.pingedLanes = NoLanes;

  root.expiredLanes &= remainingLanes;

  Lanes lanes = noLongerPendingLanes;
  while (lanes != NoLanes) {
    const int index = pickArbitraryLaneIndex(lanes);
    root.expirationTimes[index] = NoTimestamp;
    lanes = lanes.remove(Lanes::fromIndex(index));
  }
}

Lane claimNextTransitionLane(Lane& nextTransitionLane) {
  // Cycle through the lanes, assigning each new transition to the next lane.
  const Lane lane = nextTransitionLane;
  const std::uint32_t shifted = nextTransitionLane.bits() << 1;
  nextTransitionLane = Lanes::fromBits(shifted & Lanes::LaneMask);
  if (!nextTransitionLane.includesSome(TransitionLanes)) {
    nextTransitionLane = TransitionLane1;
  }
  return lane;
}

} // namespace loom
