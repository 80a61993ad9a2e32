#pragma once

#include "LoomReconciler/LoomEventPriorities.h"
#include "LoomReconciler/LoomFiber.h"
#include "LoomReconciler/LoomFiberLane.h"

#include <cstddef>
#include <cstdint>
#include <exception>

namespace loom {

struct FiberRoot;

using ExecutionContext = std::uint8_t;

inline constexpr ExecutionContext NoContext = 0b000;
inline constexpr ExecutionContext BatchedContext = 0b001;
inline constexpr ExecutionContext RenderContext = 0b010;
inline constexpr ExecutionContext CommitContext = 0b100;

enum class RootExitStatus : std::uint8_t {
  InProgress = 0,
  Completed = 1,
  Errored = 2,
  FatalErrored = 3,
};

struct WorkLoopState {
  // Describes where we are in the Loom execution stack
  ExecutionContext executionContext{NoContext};

  // The root we're working on
  FiberRoot* workInProgressRoot{nullptr};
  // The fiber we're working on
  FiberId workInProgress{NoFiber};
  // The lanes we're rendering
  Lanes workInProgressRootRenderLanes{NoLanes};

  RootExitStatus workInProgressRootExitStatus{RootExitStatus::InProgress};
  std::exception_ptr workInProgressRootFatalError{};

  // Lanes skipped during this render because of insufficient priority.
  Lanes workInProgressRootSkippedLanes{NoLanes};

  // Guards against infinite synchronous re-render loops triggered from commit.
  std::size_t nestedUpdateCount{0};
  FiberRoot* rootWithNestedUpdates{nullptr};

  EventPriority currentUpdatePriority{NoEventPriority};
  std::size_t transitionDepth{0};
  Lane nextTransitionLane{TransitionLane1};
};

} // namespace loom
