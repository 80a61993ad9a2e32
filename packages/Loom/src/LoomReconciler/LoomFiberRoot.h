#pragma once

#include "LoomReconciler/LoomFiber.h"
#include "LoomReconciler/LoomFiberLane.h"
#include "LoomScheduler/Scheduler.h"

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>

namespace loom {

class LoomRuntime;
struct FiberRoot;

using UncaughtErrorHandler = std::function<void(FiberRoot& root, std::exception_ptr error)>;

struct FiberRoot {
  // Renderer-owned container.
  std::shared_ptr<void> containerInfo{};

  // Current HostRoot fiber. Its alternate is the shadow HostRoot while a
  // render is in progress.
  FiberId current{NoFiber};
  FiberId finishedWork{NoFiber};
  Lanes finishedLanes{NoLanes};

  Lanes pendingLanes{NoLanes};
  Lanes suspendedLanes{NoLanes};
  Lanes pingedLanes{NoLanes};
  Lanes expiredLanes{NoLanes};
  LaneMap expirationTimes{};

  // At most one scheduler task per root.
  TaskHandle callbackNode{};
  Lane callbackPriority{NoLane};

  // Scheduled-roots list
  FiberRoot* next{nullptr};

  UncaughtErrorHandler onUncaughtError{};

  std::uint32_t rootId{0};
};

FiberRoot& createFiberRoot(
  LoomRuntime& runtime,
  std::shared_ptr<void> containerInfo,
  UncaughtErrorHandler onUncaughtError = {});

void defaultOnUncaughtError(FiberRoot& root, std::exception_ptr error);

} // namespace loom
