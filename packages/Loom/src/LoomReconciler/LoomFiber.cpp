#include "LoomReconciler/LoomFiber.h"

#include "LoomReconciler/LoomFiberRoot.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace loom {

namespace {

[[noreturn]] void throwInvalidFiber(FiberId id) {
  throw std::out_of_range("FiberArena: fiber " + std::to_string(id) + " is not live");
}

} // namespace

FiberId FiberArena::allocate() {
  FiberId id;
  if (!freeList_.empty()) {
    id = freeList_.back();
    freeList_.pop_back();
    FiberNode& node = nodes_[id];
    const std::uint32_t generation = node.generation;
    node = FiberNode{};
    node.generation = generation;
  } else {
    id = static_cast<FiberId>(nodes_.size());
    nodes_.emplace_back();
  }

  FiberNode& node = nodes_[id];
  node.id = id;
  node.inUse = true;
  ++liveCount_;
  return id;
}

void FiberArena::release(FiberId id) {
  if (!isLive(id)) {
    return;
  }

  FiberNode& node = nodes_[id];
  const std::uint32_t generation = node.generation + 1;
  node = FiberNode{};
  node.id = id;
  node.generation = generation;
  node.inUse = false;
  freeList_.push_back(id);
  --liveCount_;
}

FiberNode& FiberArena::get(FiberId id) {
  if (!isLive(id)) {
    throwInvalidFiber(id);
  }
  return nodes_[id];
}

const FiberNode& FiberArena::get(FiberId id) const {
  if (!isLive(id)) {
    throwInvalidFiber(id);
  }
  return nodes_[id];
}

FiberNode* FiberArena::tryGet(FiberId id) {
  return isLive(id) ? &nodes_[id] : nullptr;
}

const FiberNode* FiberArena::tryGet(FiberId id) const {
  return isLive(id) ? &nodes_[id] : nullptr;
}

bool FiberArena::isLive(FiberId id) const {
  return id != NoFiber && id < nodes_.size() && nodes_[id].inUse;
}

FiberHandle FiberArena::handleOf(FiberId id) const {
  if (!isLive(id)) {
    return FiberHandle{};
  }
  return FiberHandle{id, nodes_[id].generation};
}

FiberNode* FiberArena::resolve(const FiberHandle& handle) {
  FiberNode* node = tryGet(handle.id);
  if (node == nullptr || node->generation != handle.generation) {
    return nullptr;
  }
  return node;
}

std::size_t FiberArena::collectGarbage(const std::vector<FiberId>& currentRoots) {
  std::vector<bool> marked(nodes_.size(), false);
  std::vector<FiberId> stack;

  for (FiberId rootId : currentRoots) {
    if (isLive(rootId)) {
      stack.push_back(rootId);
    }
  }

  while (!stack.empty()) {
    const FiberId id = stack.back();
    stack.pop_back();
    if (marked[id]) {
      continue;
    }
    marked[id] = true;

    const FiberNode& node = nodes_[id];
    // The alternate is kept for reuse, but its own links may be stale.
    if (isLive(node.alternate)) {
      marked[node.alternate] = true;
    }
    if (isLive(node.child)) {
      stack.push_back(node.child);
    }
    if (isLive(node.sibling)) {
      stack.push_back(node.sibling);
    }
  }

  std::size_t released = 0;
  for (FiberId id = 0; id < nodes_.size(); ++id) {
    if (nodes_[id].inUse && !marked[id]) {
      release(id);
      ++released;
    }
  }
  return released;
}

std::size_t FiberArena::liveCount() const {
  return liveCount_;
}

std::size_t FiberArena::capacity() const {
  return nodes_.size();
}

FiberId createFiber(FiberArena& arena, WorkTag tag, PropsPtr pendingProps, std::string key) {
  const FiberId id = arena.allocate();
  FiberNode& fiber = arena.get(id);
  fiber.tag = tag;
  fiber.key = std::move(key);
  fiber.pendingProps = std::move(pendingProps);
  fiber.flags = NoFlags;
  fiber.subtreeFlags = NoFlags;
  fiber.lanes = NoLanes;
  fiber.childLanes = NoLanes;
  return id;
}

FiberId createHostRootFiber(FiberArena& arena, FiberRoot& root) {
  const FiberId id = createFiber(arena, WorkTag::HostRoot, emptyProps(), std::string{});
  arena.get(id).root = &root;
  return id;
}

FiberId createFiberFromElement(FiberArena& arena, const Element& element, Lanes lanes) {
  const FiberId id = createFiber(arena, element.tag, element.props, element.key);
  FiberNode& fiber = arena.get(id);
  fiber.type = element.type;
  fiber.component = element.component;
  fiber.lanes = lanes;
  return id;
}

FiberId createWorkInProgress(FiberArena& arena, FiberId currentId, PropsPtr pendingProps) {
  FiberNode& current = arena.get(currentId);

  FiberId workInProgressId = current.alternate;
  if (!arena.isLive(workInProgressId)) {
    workInProgressId = createFiber(arena, current.tag, std::move(pendingProps), current.key);
    // `current` stays valid: arena slots never move.
    FiberNode& workInProgress = arena.get(workInProgressId);
    workInProgress.type = current.type;
    workInProgress.component = current.component;
    workInProgress.stateNode = current.stateNode;
    workInProgress.root = current.root;

    workInProgress.alternate = currentId;
    current.alternate = workInProgressId;
  } else {
    FiberNode& workInProgress = arena.get(workInProgressId);
    workInProgress.pendingProps = std::move(pendingProps);
    workInProgress.type = current.type;
    workInProgress.component = current.component;
    workInProgress.stateNode = current.stateNode;
    workInProgress.root = current.root;

    // We already have an alternate. Reset the effect tag.
    workInProgress.flags = NoFlags;
    workInProgress.subtreeFlags = NoFlags;
    workInProgress.deletions.clear();
  }

  FiberNode& workInProgress = arena.get(workInProgressId);
  workInProgress.childLanes = current.childLanes;
  workInProgress.lanes = current.lanes;

  workInProgress.child = current.child;
  workInProgress.memoizedProps = current.memoizedProps;
  workInProgress.memoizedState = current.memoizedState;
  workInProgress.updateQueue = current.updateQueue;

  workInProgress.sibling = current.sibling;
  workInProgress.index = current.index;
  workInProgress.returnFiber = current.returnFiber;

  return workInProgressId;
}

bool isHostFiber(const FiberNode& fiber) {
  return fiber.tag == WorkTag::HostComponent || fiber.tag == WorkTag::HostRoot;
}

} // namespace loom
