#pragma once

#include "LoomReconciler/LoomFiber.h"
#include "LoomReconciler/LoomFiberLane.h"
#include "LoomReconciler/LoomFiberWorkLoopState.h"

namespace loom {

class LoomRuntime;
struct FiberRoot;

ExecutionContext getExecutionContext(const LoomRuntime& runtime);
void setExecutionContext(LoomRuntime& runtime, ExecutionContext context);
bool isAlreadyRendering(const LoomRuntime& runtime);

FiberRoot* getWorkInProgressRoot(const LoomRuntime& runtime);
FiberId getWorkInProgressFiber(const LoomRuntime& runtime);
Lanes getWorkInProgressRootRenderLanes(const LoomRuntime& runtime);
Lanes getWorkInProgressRootSkippedLanes(const LoomRuntime& runtime);

double getCurrentTime(const LoomRuntime& runtime);

Lane requestUpdateLane(LoomRuntime& runtime, FiberId fiber);

// Entry point for every state change: marks the lane pending on `root` and
// makes sure a task will process it.
void scheduleUpdateOnRoot(LoomRuntime& runtime, FiberRoot& root, FiberId fiber, Lane lane, double eventTime);

void markSkippedUpdateLanes(LoomRuntime& runtime, Lanes lanes);

// Throws once commits keep scheduling synchronous work on the same root.
void throwIfInfiniteUpdateLoopDetected(LoomRuntime& runtime);

FiberId prepareFreshStack(LoomRuntime& runtime, FiberRoot& root, Lanes lanes);
void resetWorkInProgressStack(LoomRuntime& runtime);

void performUnitOfWork(LoomRuntime& runtime, FiberId unitOfWork);
void completeUnitOfWork(LoomRuntime& runtime, FiberId unitOfWork);

void workLoopSync(LoomRuntime& runtime);
void workLoopConcurrent(LoomRuntime& runtime);

RootExitStatus renderRootSync(LoomRuntime& runtime, FiberRoot& root, Lanes lanes);
RootExitStatus renderRootConcurrent(LoomRuntime& runtime, FiberRoot& root, Lanes lanes);

FiberId beginWork(LoomRuntime& runtime, FiberId current, FiberId workInProgress, Lanes renderLanes);
void completeWork(LoomRuntime& runtime, FiberId current, FiberId workInProgress, Lanes renderLanes);
void bubbleProperties(LoomRuntime& runtime, FiberNode& completedWork);

} // namespace loom
