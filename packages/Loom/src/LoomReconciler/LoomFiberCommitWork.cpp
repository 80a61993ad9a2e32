#include "LoomReconciler/LoomFiberCommitWork.h"

#include "LoomReconciler/LoomEventPriorities.h"
#include "LoomReconciler/LoomFiberClassUpdateQueue.h"
#include "LoomReconciler/LoomFiberConcurrentUpdates.h"
#include "LoomReconciler/LoomFiberFlags.h"
#include "LoomReconciler/LoomFiberLane.h"
#include "LoomReconciler/LoomFiberRoot.h"
#include "LoomReconciler/LoomFiberRootScheduler.h"
#include "LoomReconciler/LoomFiberWorkLoop.h"
#include "LoomReconciler/LoomHostConfig.h"
#include "LoomRuntime/LoomRuntime.h"

#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

namespace loom {

namespace {

struct CommitContextState {
  LoomRuntime& runtime;
  FiberRoot& root;
  FiberArena& arena;
  // Host fibers that were placed or updated, in mutation order.
  std::vector<FiberId> mutatedHostFibers{};
};

bool isHostComponent(const FiberNode& fiber) {
  return fiber.tag == WorkTag::HostComponent;
}

void commitBeforeMutationEffectsOnFiber(CommitContextState& ctx, FiberId fiberId) {
  FiberNode& fiber = ctx.arena.get(fiberId);
  if (hasFlag(fiber.flags, Snapshot) && isHostComponent(fiber)) {
    hostconfig::beforeMutation(ctx.runtime, ctx.root, fiber);
  }

  if (!hasFlag(fiber.subtreeFlags, BeforeMutationMask)) {
    return;
  }
  for (FiberId child = fiber.child; child != NoFiber; child = ctx.arena.get(child).sibling) {
    commitBeforeMutationEffectsOnFiber(ctx, child);
  }
}

void recordMutation(CommitContextState& ctx, FiberId fiberId) {
  if (ctx.mutatedHostFibers.empty() || ctx.mutatedHostFibers.back() != fiberId) {
    ctx.mutatedHostFibers.push_back(fiberId);
  }
}

// Inserts every host node of a freshly mounted subtree, parents first.
void commitPlacementOfNewSubtree(CommitContextState& ctx, FiberId fiberId) {
  FiberNode& fiber = ctx.arena.get(fiberId);
  if (isHostComponent(fiber)) {
    hostconfig::mutate(ctx.runtime, ctx.root, fiber, Placement);
    recordMutation(ctx, fiberId);
  }
  for (FiberId child = fiber.child; child != NoFiber; child = ctx.arena.get(child).sibling) {
    commitPlacementOfNewSubtree(ctx, child);
  }
}

// A moved subtree keeps its host nodes; only the top-level ones move.
void commitPlacementOfMovedSubtree(CommitContextState& ctx, FiberId fiberId) {
  FiberNode& fiber = ctx.arena.get(fiberId);
  if (isHostComponent(fiber)) {
    hostconfig::mutate(ctx.runtime, ctx.root, fiber, Placement);
    recordMutation(ctx, fiberId);
    return;
  }
  for (FiberId child = fiber.child; child != NoFiber; child = ctx.arena.get(child).sibling) {
    commitPlacementOfMovedSubtree(ctx, child);
  }
}

void commitPlacement(CommitContextState& ctx, FiberId fiberId) {
  const FiberNode& fiber = ctx.arena.get(fiberId);
  if (ctx.arena.isLive(fiber.alternate)) {
    commitPlacementOfMovedSubtree(ctx, fiberId);
  } else {
    commitPlacementOfNewSubtree(ctx, fiberId);
  }
}

// Removes the host nodes of a deleted subtree, children before parents.
void commitDeletionEffects(CommitContextState& ctx, FiberId deletedId) {
  FiberNode* deleted = ctx.arena.tryGet(deletedId);
  if (deleted == nullptr) {
    return;
  }

  for (FiberId child = deleted->child; child != NoFiber;) {
    const FiberNode* node = ctx.arena.tryGet(child);
    if (node == nullptr) {
      break;
    }
    const FiberId next = node->sibling;
    commitDeletionEffects(ctx, child);
    child = next;
  }

  if (isHostComponent(*deleted)) {
    hostconfig::mutate(ctx.runtime, ctx.root, *deleted, Deletion);
  }
}

void commitMutationEffectsOnFiber(CommitContextState& ctx, FiberId fiberId) {
  FiberNode& fiber = ctx.arena.get(fiberId);

  // Deletions effects can be scheduled on any fiber type. They need to happen
  // before the children effects have fired.
  if (!fiber.deletions.empty()) {
    const std::vector<FiberId> deletions = std::move(fiber.deletions);
    fiber.deletions.clear();
    for (FiberId deletion : deletions) {
      commitDeletionEffects(ctx, deletion);
    }
  }

  if (hasFlag(fiber.flags, Placement)) {
    commitPlacement(ctx, fiberId);
  }

  if (hasFlag(fiber.flags, UpdateFlag) && isHostComponent(fiber) && ctx.arena.isLive(fiber.alternate)) {
    hostconfig::mutate(ctx.runtime, ctx.root, fiber, UpdateFlag);
    recordMutation(ctx, fiberId);
  }

  if (!hasFlag(fiber.subtreeFlags, MutationMask)) {
    return;
  }
  for (FiberId child = fiber.child; child != NoFiber; child = ctx.arena.get(child).sibling) {
    commitMutationEffectsOnFiber(ctx, child);
  }
}

void commitLayoutEffectsOnFiber(CommitContextState& ctx, FiberId fiberId) {
  FiberNode& fiber = ctx.arena.get(fiberId);
  if (hasFlag(fiber.subtreeFlags, Callback)) {
    for (FiberId child = fiber.child; child != NoFiber; child = ctx.arena.get(child).sibling) {
      commitLayoutEffectsOnFiber(ctx, child);
    }
  }

  if (hasFlag(fiber.flags, Callback) && fiber.updateQueue != nullptr) {
    std::exception_ptr error = commitCallbacks(*fiber.updateQueue);
    if (error && ctx.root.onUncaughtError) {
      ctx.root.onUncaughtError(ctx.root, error);
    }
  }
}

void commitAfterMutationEffects(CommitContextState& ctx, FiberId finishedWork) {
  for (FiberId fiberId : ctx.mutatedHostFibers) {
    if (FiberNode* fiber = ctx.arena.tryGet(fiberId)) {
      hostconfig::afterMutation(ctx.runtime, ctx.root, *fiber);
    }
  }
  commitLayoutEffectsOnFiber(ctx, finishedWork);
}

void updateNestedUpdateCount(LoomRuntime& runtime, FiberRoot& root) {
  WorkLoopState& state = runtime.workLoopState();
  if (includesSyncLane(root.pendingLanes)) {
    // Count the number of times the root synchronously re-renders without
    // finishing. If there are too many, it indicates an infinite update loop.
    if (&root == state.rootWithNestedUpdates) {
      ++state.nestedUpdateCount;
    } else {
      state.nestedUpdateCount = 0;
      state.rootWithNestedUpdates = &root;
    }
  } else {
    state.nestedUpdateCount = 0;
  }
}

bool isHostParent(const FiberNode& fiber) {
  return isHostFiber(fiber);
}

} // namespace

void commitRoot(LoomRuntime& runtime, FiberRoot& root) {
  const FiberId finishedWorkId = root.finishedWork;
  if (finishedWorkId == NoFiber) {
    return;
  }

  WorkLoopState& state = runtime.workLoopState();
  if ((state.executionContext & (RenderContext | CommitContext)) != NoContext) {
    throw std::logic_error("commitRoot should not run during render or commit context");
  }
  if (finishedWorkId == root.current) {
    throw std::logic_error("Cannot commit the same tree twice");
  }

  FiberArena& arena = runtime.fiberArena();
  FiberNode& finishedWork = arena.get(finishedWorkId);
  const Lanes lanes = root.finishedLanes;

  root.finishedWork = NoFiber;
  root.finishedLanes = NoLanes;

  // Check which lanes no longer have any work scheduled on them, and mark
  // those as finished.
  Lanes remainingLanes = mergeLanes(finishedWork.lanes, finishedWork.childLanes);
  remainingLanes = mergeLanes(remainingLanes, getConcurrentlyUpdatedLanes(runtime));
  // Lanes that were pending but not part of this render stay pending.
  remainingLanes = mergeLanes(remainingLanes, root.pendingLanes.remove(lanes));
  markRootFinished(root, remainingLanes);

  CommitContextState ctx{runtime, root, arena};

  const EventPriority previousUpdatePriority = state.currentUpdatePriority;
  const ExecutionContext prevExecutionContext = state.executionContext;
  state.currentUpdatePriority = DiscreteEventPriority;
  state.executionContext |= CommitContext;

  try {
    // The commit phase is broken into several sub-phases. We do a separate
    // pass of the effect list for each phase: all mutation effects come
    // before all layout effects, and so on.
    commitBeforeMutationEffectsOnFiber(ctx, finishedWorkId);

    commitMutationEffectsOnFiber(ctx, finishedWorkId);

    // The work-in-progress tree is now the current tree.
    root.current = finishedWorkId;
    hostconfig::resetAfterCommit(runtime, root);

    commitAfterMutationEffects(ctx, finishedWorkId);
  } catch (...) {
    state.executionContext = prevExecutionContext;
    state.currentUpdatePriority = previousUpdatePriority;
    throw;
  }

  state.executionContext = prevExecutionContext;
  state.currentUpdatePriority = previousUpdatePriority;

  updateNestedUpdateCount(runtime, root);

  // Deleted subtrees are unreachable now. A render in progress on another
  // root still owns fibers outside every current tree.
  if (getWorkInProgressRoot(runtime) == nullptr) {
    arena.collectGarbage(runtime.currentRootFibers());
  }

  // Always call this before exiting `commitRoot`, to ensure that any
  // additional work on this root is scheduled.
  ensureRootIsScheduled(runtime, root);

  // If layout work was scheduled, flush it now.
  flushSyncWorkOnAllRoots(runtime);
}

FiberId getHostParentFiber(const FiberArena& arena, FiberId fiber) {
  FiberId parent = arena.get(fiber).returnFiber;
  while (parent != NoFiber) {
    const FiberNode& node = arena.get(parent);
    if (isHostParent(node)) {
      return parent;
    }
    parent = node.returnFiber;
  }
  throw std::logic_error("Expected to find a host parent. This error is likely caused by a bug in Loom.");
}

FiberId getHostSiblingFiber(const FiberArena& arena, FiberId fiber) {
  // We're going to search forward into the tree until we find a sibling host
  // node. Unfortunately, if multiple insertions are done in a row we have to
  // search past them. This leads to exponential search for the next sibling.
  FiberId node = fiber;
  while (true) {
    // If we didn't find anything, let's try the next sibling.
    while (arena.get(node).sibling == NoFiber) {
      const FiberId parent = arena.get(node).returnFiber;
      if (parent == NoFiber || isHostParent(arena.get(parent))) {
        // If we pop out of the root or hit the parent the fiber we are the
        // last sibling.
        return NoFiber;
      }
      node = parent;
    }
    node = arena.get(node).sibling;

    bool skipped = false;
    while (!isHostComponent(arena.get(node))) {
      const FiberNode& current = arena.get(node);
      // If it is not host node and, we might have a host node inside it.
      // Try to search down until we find one.
      if (hasFlag(current.flags, Placement) || current.child == NoFiber) {
        // If we don't have a child, try the siblings instead.
        skipped = true;
        break;
      }
      node = current.child;
    }
    if (skipped) {
      continue;
    }

    // Check if this host node is stable or about to be placed.
    if (!hasFlag(arena.get(node).flags, Placement)) {
      // Found it!
      return node;
    }
  }
}

} // namespace loom
