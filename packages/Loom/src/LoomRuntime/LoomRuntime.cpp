#include "LoomRuntime/LoomRuntime.h"

#include "LoomReconciler/LoomFiberRoot.h"
#include "LoomReconciler/LoomHostConfig.h"

#include <utility>

namespace loom {

LoomRuntime::LoomRuntime(SchedulerHost& host, SchedulerConfig config)
  : scheduler_(host, std::move(config)) {}

LoomRuntime::~LoomRuntime() = default;

WorkLoopState& LoomRuntime::workLoopState() {
  return workLoopState_;
}

const WorkLoopState& LoomRuntime::workLoopState() const {
  return workLoopState_;
}

RootSchedulerState& LoomRuntime::rootSchedulerState() {
  return rootSchedulerState_;
}

const RootSchedulerState& LoomRuntime::rootSchedulerState() const {
  return rootSchedulerState_;
}

ConcurrentUpdatesState& LoomRuntime::concurrentUpdatesState() {
  return concurrentUpdatesState_;
}

const ConcurrentUpdatesState& LoomRuntime::concurrentUpdatesState() const {
  return concurrentUpdatesState_;
}

FiberArena& LoomRuntime::fiberArena() {
  return fiberArena_;
}

const FiberArena& LoomRuntime::fiberArena() const {
  return fiberArena_;
}

FiberRoot& LoomRuntime::addRoot() {
  auto root = std::make_unique<FiberRoot>();
  root->rootId = static_cast<std::uint32_t>(roots_.size() + 1);
  roots_.push_back(std::move(root));
  return *roots_.back();
}

const std::vector<std::unique_ptr<FiberRoot>>& LoomRuntime::roots() const {
  return roots_;
}

std::vector<FiberId> LoomRuntime::currentRootFibers() const {
  std::vector<FiberId> fibers;
  fibers.reserve(roots_.size());
  for (const auto& root : roots_) {
    fibers.push_back(root->current);
  }
  return fibers;
}

void LoomRuntime::setHostConfig(std::shared_ptr<HostConfig> hostConfig) {
  hostConfig_ = std::move(hostConfig);
}

HostConfig& LoomRuntime::hostConfig() {
  return *ensureHostConfig();
}

std::shared_ptr<HostConfig> LoomRuntime::ensureHostConfig() {
  if (!hostConfig_) {
    hostConfig_ = std::make_shared<NoopHostConfig>();
  }
  return hostConfig_;
}

LoomScheduler& LoomRuntime::scheduler() {
  return scheduler_;
}

const LoomScheduler& LoomRuntime::scheduler() const {
  return scheduler_;
}

TaskHandle LoomRuntime::scheduleTask(
    SchedulerPriority priority,
    TaskCallback callback,
    const TaskOptions& options) {
  return scheduler_.scheduleTask(priority, std::move(callback), options);
}

void LoomRuntime::cancelTask(TaskHandle handle) {
  scheduler_.cancelTask(handle);
}

SchedulerPriority LoomRuntime::getCurrentPriorityLevel() const {
  return scheduler_.getCurrentPriorityLevel();
}

SchedulerPriority LoomRuntime::runWithPriority(
    SchedulerPriority priority,
    const std::function<void()>& fn) {
  return scheduler_.runWithPriority(priority, fn);
}

bool LoomRuntime::shouldYield() const {
  return scheduler_.shouldYield();
}

double LoomRuntime::now() const {
  return scheduler_.now();
}

} // namespace loom
