#pragma once

#include "LoomReconciler/LoomFiber.h"

namespace loom {

class LoomRuntime;
struct FiberRoot;

// Applies `root.finishedWork` to the host and makes it the current tree.
// Never yields.
void commitRoot(LoomRuntime& runtime, FiberRoot& root);

// Nearest ancestor that can hold host children (a HostComponent or the
// HostRoot).
FiberId getHostParentFiber(const FiberArena& arena, FiberId fiber);

// First host node after `fiber` under the same host parent that is already
// in the host tree, or NoFiber when `fiber` has to be appended.
FiberId getHostSiblingFiber(const FiberArena& arena, FiberId fiber);

} // namespace loom
