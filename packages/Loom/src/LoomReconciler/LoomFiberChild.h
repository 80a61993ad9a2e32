#pragma once

#include "LoomReconciler/LoomElement.h"
#include "LoomReconciler/LoomFiber.h"
#include "LoomReconciler/LoomFiberLane.h"

namespace loom {

// Gives `workInProgress` shadow copies of the current children, unchanged.
FiberId cloneChildFibers(FiberArena& arena, FiberId current, FiberNode& workInProgress);

// First render of a subtree: no Placement or deletion is tracked because the
// parent is placed as a whole.
FiberId mountChildFibers(
  FiberArena& arena,
  FiberNode& workInProgress,
  const Elements& nextChildren,
  Lanes renderLanes);

FiberId reconcileChildFibers(
  FiberArena& arena,
  FiberId currentFirstChild,
  FiberNode& workInProgress,
  const Elements& nextChildren,
  Lanes renderLanes);

} // namespace loom
