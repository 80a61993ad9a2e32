#pragma once

#include "LoomReconciler/LoomElement.h"
#include "LoomReconciler/LoomFiberFlags.h"
#include "LoomReconciler/LoomFiberLane.h"
#include "LoomReconciler/LoomWorkTags.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace loom {

struct FiberRoot;
struct UpdateQueue;

using FiberId = std::uint32_t;
inline constexpr FiberId NoFiber = std::numeric_limits<FiberId>::max();

/**
 * Generation-checked reference to a fiber, safe to hold across commits.
 * Resolving it fails once the fiber has been released.
 */
struct FiberHandle {
  FiberId id{NoFiber};
  std::uint32_t generation{0};

  explicit operator bool() const {
    return id != NoFiber;
  }

  bool operator==(const FiberHandle& other) const {
    return id == other.id && generation == other.generation;
  }

  bool operator!=(const FiberHandle& other) const {
    return !(*this == other);
  }
};

struct FiberNode {
  // Instance
  WorkTag tag{WorkTag::HostComponent};
  std::string key{};
  std::string type{};
  ComponentPtr component{};
  // Renderer-owned instance for host components.
  std::shared_ptr<void> stateNode{};
  // Set on HostRoot fibers only.
  FiberRoot* root{nullptr};

  // Tree links
  FiberId returnFiber{NoFiber};
  FiberId child{NoFiber};
  FiberId sibling{NoFiber};
  std::uint32_t index{0};

  PropsPtr pendingProps{};
  PropsPtr memoizedProps{};
  StatePtr memoizedState{};
  std::shared_ptr<UpdateQueue> updateQueue{};

  // Effects
  FiberFlags flags{NoFlags};
  FiberFlags subtreeFlags{NoFlags};
  std::vector<FiberId> deletions{};

  Lanes lanes{NoLanes};
  Lanes childLanes{NoLanes};

  FiberId alternate{NoFiber};

  // Arena bookkeeping
  FiberId id{NoFiber};
  std::uint32_t generation{0};
  bool inUse{false};
};

/**
 * Owns every fiber of a runtime. Fibers are addressed by FiberId and stay at
 * a stable address for as long as they are live; released slots are reused
 * with a bumped generation.
 */
class FiberArena {
public:
  FiberArena() = default;

  FiberArena(const FiberArena&) = delete;
  FiberArena& operator=(const FiberArena&) = delete;

  FiberId allocate();
  void release(FiberId id);

  FiberNode& get(FiberId id);
  const FiberNode& get(FiberId id) const;
  FiberNode* tryGet(FiberId id);
  const FiberNode* tryGet(FiberId id) const;
  bool isLive(FiberId id) const;

  FiberHandle handleOf(FiberId id) const;
  FiberNode* resolve(const FiberHandle& handle);

  // Releases every fiber that is neither in a current tree nor the alternate
  // of a current-tree fiber. Returns the number of fibers released.
  std::size_t collectGarbage(const std::vector<FiberId>& currentRoots);

  std::size_t liveCount() const;
  std::size_t capacity() const;

private:
  std::deque<FiberNode> nodes_{};
  std::vector<FiberId> freeList_{};
  std::size_t liveCount_{0};
};

FiberId createFiber(FiberArena& arena, WorkTag tag, PropsPtr pendingProps, std::string key);
FiberId createHostRootFiber(FiberArena& arena, FiberRoot& root);
FiberId createFiberFromElement(FiberArena& arena, const Element& element, Lanes lanes);

// Returns the shadow counterpart of `current`, reusing its alternate if any.
FiberId createWorkInProgress(FiberArena& arena, FiberId current, PropsPtr pendingProps);

bool isHostFiber(const FiberNode& fiber);

} // namespace loom
