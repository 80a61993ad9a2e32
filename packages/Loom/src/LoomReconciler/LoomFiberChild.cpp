#include "LoomReconciler/LoomFiberChild.h"

#include "LoomReconciler/LoomFiberFlags.h"

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace loom {

namespace {

PropsPtr propsOf(const Element& element) {
  return element.props != nullptr ? element.props : emptyProps();
}

bool matchesElement(const FiberNode& fiber, const Element& element) {
  if (fiber.tag != element.tag) {
    return false;
  }
  if (element.tag == WorkTag::ClassComponent) {
    return fiber.component == element.component;
  }
  return fiber.type == element.type;
}

std::string makeIndexKey(std::size_t index) {
  return "#" + std::to_string(index);
}

std::string fiberMapKey(const FiberNode& fiber) {
  if (!fiber.key.empty()) {
    return fiber.key;
  }
  return makeIndexKey(fiber.index);
}

std::string childMapKey(const Element& element, std::size_t index) {
  if (!element.key.empty()) {
    return element.key;
  }
  return makeIndexKey(index);
}

void deleteChild(FiberNode& returnFiber, FiberId childToDelete, bool shouldTrackSideEffects) {
  if (!shouldTrackSideEffects || childToDelete == NoFiber) {
    return;
  }
  returnFiber.deletions.push_back(childToDelete);
  returnFiber.flags = static_cast<FiberFlags>(returnFiber.flags | ChildDeletion);
}

FiberId useFiber(FiberArena& arena, FiberId fiber, PropsPtr pendingProps) {
  // We currently set sibling to null and index to 0 here because it is easy
  // to forget to do before returning it.
  const FiberId clone = createWorkInProgress(arena, fiber, std::move(pendingProps));
  FiberNode& node = arena.get(clone);
  node.index = 0;
  node.sibling = NoFiber;
  return clone;
}

int placeChild(
    FiberArena& arena,
    FiberNode& returnFiber,
    FiberNode& child,
    int lastPlacedIndex,
    std::size_t newIndex,
    bool shouldTrackSideEffects) {
  child.index = static_cast<std::uint32_t>(newIndex);
  child.returnFiber = returnFiber.id;
  child.sibling = NoFiber;

  if (!shouldTrackSideEffects) {
    return lastPlacedIndex;
  }

  const FiberNode* current = arena.tryGet(child.alternate);
  if (current != nullptr) {
    const int oldIndex = static_cast<int>(current->index);
    if (oldIndex < lastPlacedIndex) {
      // This is a move.
      child.flags = static_cast<FiberFlags>(child.flags | Placement);
      return lastPlacedIndex;
    }
    // This item can stay in place.
    return oldIndex;
  }

  // This is an insertion.
  child.flags = static_cast<FiberFlags>(child.flags | Placement);
  return lastPlacedIndex;
}

FiberId reconcileChildrenArray(
    FiberArena& arena,
    FiberId currentFirstChild,
    FiberNode& workInProgress,
    const Elements& nextChildren,
    Lanes renderLanes,
    bool shouldTrackSideEffects) {
  std::unordered_map<std::string, FiberId> existingChildren;
  std::vector<FiberId> duplicateChildren;
  for (FiberId child = currentFirstChild; child != NoFiber; child = arena.get(child).sibling) {
    if (!existingChildren.emplace(fiberMapKey(arena.get(child)), child).second) {
      duplicateChildren.push_back(child);
    }
  }

  FiberId firstNewChild = NoFiber;
  FiberId previousNewChild = NoFiber;
  int lastPlacedIndex = 0;

  for (std::size_t index = 0; index < nextChildren.size(); ++index) {
    const Element& element = nextChildren[index];
    const std::string lookupKey = childMapKey(element, index);

    FiberId newFiber = NoFiber;
    auto iter = existingChildren.find(lookupKey);
    if (iter != existingChildren.end()) {
      const FiberId matchedExisting = iter->second;
      existingChildren.erase(iter);
      if (matchesElement(arena.get(matchedExisting), element)) {
        newFiber = useFiber(arena, matchedExisting, propsOf(element));
      } else {
        deleteChild(workInProgress, matchedExisting, shouldTrackSideEffects);
      }
    }

    if (newFiber == NoFiber) {
      newFiber = createFiberFromElement(arena, element, renderLanes);
    }

    FiberNode& placed = arena.get(newFiber);
    lastPlacedIndex = placeChild(arena, workInProgress, placed, lastPlacedIndex, index, shouldTrackSideEffects);

    if (firstNewChild == NoFiber) {
      firstNewChild = newFiber;
    } else {
      arena.get(previousNewChild).sibling = newFiber;
    }
    previousNewChild = newFiber;
  }

  if (shouldTrackSideEffects) {
    // Any existing children that weren't consumed above were deleted.
    for (FiberId child = currentFirstChild; child != NoFiber; child = arena.get(child).sibling) {
      auto iter = existingChildren.find(fiberMapKey(arena.get(child)));
      if (iter != existingChildren.end() && iter->second == child) {
        deleteChild(workInProgress, child, shouldTrackSideEffects);
      }
    }
    for (FiberId child : duplicateChildren) {
      deleteChild(workInProgress, child, shouldTrackSideEffects);
    }
  }

  workInProgress.child = firstNewChild;
  return firstNewChild;
}

} // namespace

FiberId cloneChildFibers(FiberArena& arena, FiberId current, FiberNode& workInProgress) {
  const FiberNode* currentFiber = arena.tryGet(current);
  if (currentFiber == nullptr || currentFiber->child == NoFiber) {
    workInProgress.child = NoFiber;
    return NoFiber;
  }

  const FiberId currentChild = currentFiber->child;
  if (workInProgress.child != NoFiber && workInProgress.child != currentChild) {
    throw std::logic_error("The child of a work-in-progress fiber must be a clone of the current child.");
  }

  const FiberNode& firstCurrent = arena.get(currentChild);
  const FiberId firstNewChild = createWorkInProgress(arena, currentChild, firstCurrent.pendingProps);
  workInProgress.child = firstNewChild;
  arena.get(firstNewChild).returnFiber = workInProgress.id;

  FiberId previousNewChild = firstNewChild;
  FiberId previousCurrentChild = currentChild;
  while (arena.get(previousCurrentChild).sibling != NoFiber) {
    previousCurrentChild = arena.get(previousCurrentChild).sibling;
    const FiberNode& currentSibling = arena.get(previousCurrentChild);
    const FiberId cloned = createWorkInProgress(arena, previousCurrentChild, currentSibling.pendingProps);
    arena.get(cloned).returnFiber = workInProgress.id;
    arena.get(previousNewChild).sibling = cloned;
    previousNewChild = cloned;
  }

  arena.get(previousNewChild).sibling = NoFiber;
  return firstNewChild;
}

FiberId mountChildFibers(
    FiberArena& arena,
    FiberNode& workInProgress,
    const Elements& nextChildren,
    Lanes renderLanes) {
  return reconcileChildrenArray(arena, NoFiber, workInProgress, nextChildren, renderLanes, false);
}

FiberId reconcileChildFibers(
    FiberArena& arena,
    FiberId currentFirstChild,
    FiberNode& workInProgress,
    const Elements& nextChildren,
    Lanes renderLanes) {
  return reconcileChildrenArray(arena, currentFirstChild, workInProgress, nextChildren, renderLanes, true);
}

} // namespace loom
