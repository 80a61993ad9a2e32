#pragma once

#include "LoomReconciler/LoomEventPriorities.h"
#include "LoomReconciler/LoomFiber.h"
#include "LoomReconciler/LoomFiberFlags.h"

namespace loom {

class LoomRuntime;
struct FiberRoot;

/**
 * Renderer collaborator. Commit drives it in three ordered phases; it never
 * sees a partially rendered tree.
 */
class HostConfig {
public:
  HostConfig() = default;
  virtual ~HostConfig() = default;

  // Before any mutation, for fibers flagged Snapshot.
  virtual void beforeMutation(FiberRoot& root, FiberNode& fiber);

  // Applies Placement, UpdateFlag or Deletion for one host fiber.
  virtual void mutate(FiberRoot& root, FiberNode& fiber, FiberFlags flags) = 0;

  // After the finished tree became current, for placed or updated fibers.
  virtual void afterMutation(FiberRoot& root, FiberNode& fiber);

  virtual void resetAfterCommit(FiberRoot& root);

  virtual EventPriority getCurrentEventPriority() const;
};

// Host that renders nothing. Used until a renderer is attached.
class NoopHostConfig : public HostConfig {
public:
  void mutate(FiberRoot& root, FiberNode& fiber, FiberFlags flags) override;
};

namespace hostconfig {

void beforeMutation(LoomRuntime& runtime, FiberRoot& root, FiberNode& fiber);
void mutate(LoomRuntime& runtime, FiberRoot& root, FiberNode& fiber, FiberFlags flags);
void afterMutation(LoomRuntime& runtime, FiberRoot& root, FiberNode& fiber);
void resetAfterCommit(LoomRuntime& runtime, FiberRoot& root);
EventPriority getCurrentEventPriority(LoomRuntime& runtime);

} // namespace hostconfig

} // namespace loom
