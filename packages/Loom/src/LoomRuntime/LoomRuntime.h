#pragma once

#include "LoomReconciler/LoomFiber.h"
#include "LoomReconciler/LoomFiberConcurrentUpdates.h"
#include "LoomReconciler/LoomFiberRootSchedulerState.h"
#include "LoomReconciler/LoomFiberWorkLoopState.h"
#include "LoomScheduler/LoomScheduler.h"
#include "LoomScheduler/Scheduler.h"
#include "LoomScheduler/SchedulerHost.h"
#include "LoomScheduler/SchedulerPriorities.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace loom {

class HostConfig;
struct FiberRoot;

/**
 * Owns everything one reconciler instance needs: the scheduler, the fiber
 * arena, the roots, and the work-loop and root-scheduler state. Several
 * runtimes may coexist; each is single-threaded.
 *
 * The scheduler host must outlive the runtime.
 */
class LoomRuntime {
public:
  explicit LoomRuntime(SchedulerHost& host, SchedulerConfig config = {});
  ~LoomRuntime();

  LoomRuntime(const LoomRuntime&) = delete;
  LoomRuntime& operator=(const LoomRuntime&) = delete;

  WorkLoopState& workLoopState();
  const WorkLoopState& workLoopState() const;
  RootSchedulerState& rootSchedulerState();
  const RootSchedulerState& rootSchedulerState() const;
  ConcurrentUpdatesState& concurrentUpdatesState();
  const ConcurrentUpdatesState& concurrentUpdatesState() const;

  FiberArena& fiberArena();
  const FiberArena& fiberArena() const;

  FiberRoot& addRoot();
  const std::vector<std::unique_ptr<FiberRoot>>& roots() const;
  std::vector<FiberId> currentRootFibers() const;

  void setHostConfig(std::shared_ptr<HostConfig> hostConfig);
  HostConfig& hostConfig();

  LoomScheduler& scheduler();
  const LoomScheduler& scheduler() const;

  TaskHandle scheduleTask(
    SchedulerPriority priority,
    TaskCallback callback,
    const TaskOptions& options = {});

  void cancelTask(TaskHandle handle);

  SchedulerPriority getCurrentPriorityLevel() const;

  SchedulerPriority runWithPriority(
    SchedulerPriority priority,
    const std::function<void()>& fn);

  bool shouldYield() const;

  [[nodiscard]] double now() const;

private:
  std::shared_ptr<HostConfig> ensureHostConfig();

  LoomScheduler scheduler_;
  std::shared_ptr<HostConfig> hostConfig_{};
  FiberArena fiberArena_{};
  std::vector<std::unique_ptr<FiberRoot>> roots_{};
  WorkLoopState workLoopState_{};
  RootSchedulerState rootSchedulerState_{};
  ConcurrentUpdatesState concurrentUpdatesState_{};
};

} // namespace loom
