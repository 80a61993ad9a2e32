#include "LoomReconciler/LoomHostConfig.h"

#include "LoomRuntime/LoomRuntime.h"

namespace loom {

void HostConfig::beforeMutation(FiberRoot& root, FiberNode& fiber) {
  (void)root;
  (void)fiber;
}

void HostConfig::afterMutation(FiberRoot& root, FiberNode& fiber) {
  (void)root;
  (void)fiber;
}

void HostConfig::resetAfterCommit(FiberRoot& root) {
  (void)root;
}

EventPriority HostConfig::getCurrentEventPriority() const {
  return DefaultEventPriority;
}

void NoopHostConfig::mutate(FiberRoot& root, FiberNode& fiber, FiberFlags flags) {
  (void)root;
  (void)fiber;
  (void)flags;
}

namespace hostconfig {

void beforeMutation(LoomRuntime& runtime, FiberRoot& root, FiberNode& fiber) {
  runtime.hostConfig().beforeMutation(root, fiber);
}

void mutate(LoomRuntime& runtime, FiberRoot& root, FiberNode& fiber, FiberFlags flags) {
  runtime.hostConfig().mutate(root, fiber, flags);
}

void afterMutation(LoomRuntime& runtime, FiberRoot& root, FiberNode& fiber) {
  runtime.hostConfig().afterMutation(root, fiber);
}

void resetAfterCommit(LoomRuntime& runtime, FiberRoot& root) {
  runtime.hostConfig().resetAfterCommit(root);
}

EventPriority getCurrentEventPriority(LoomRuntime& runtime) {
  return runtime.hostConfig().getCurrentEventPriority();
}

} // namespace hostconfig

} // namespace loom
