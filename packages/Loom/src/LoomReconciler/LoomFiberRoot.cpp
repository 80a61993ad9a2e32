#include "LoomReconciler/LoomFiberRoot.h"

#include "LoomReconciler/LoomFiberClassUpdateQueue.h"
#include "LoomRuntime/LoomRuntime.h"
#include "shared/LoomGlobalError.h"

#include <utility>

namespace loom {

FiberRoot& createFiberRoot(
    LoomRuntime& runtime,
    std::shared_ptr<void> containerInfo,
    UncaughtErrorHandler onUncaughtError) {
  FiberRoot& root = runtime.addRoot();
  root.containerInfo = std::move(containerInfo);
  root.expirationTimes.fill(NoTimestamp);
  root.onUncaughtError = onUncaughtError ? std::move(onUncaughtError) : UncaughtErrorHandler(defaultOnUncaughtError);

  FiberArena& arena = runtime.fiberArena();
  const FiberId uninitializedFiber = createHostRootFiber(arena, root);
  root.current = uninitializedFiber;

  FiberNode& fiber = arena.get(uninitializedFiber);
  ValueMap initialState;
  initialState["children"] = Elements{};
  fiber.memoizedState = std::make_shared<const ValueMap>(std::move(initialState));
  initializeUpdateQueue(fiber);

  return root;
}

void defaultOnUncaughtError(FiberRoot& root, std::exception_ptr error) {
  (void)root;
  reportGlobalError(error);
}

} // namespace loom
