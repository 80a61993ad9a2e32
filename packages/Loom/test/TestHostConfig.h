#pragma once

#include "LoomReconciler/LoomElement.h"
#include "LoomReconciler/LoomFiber.h"
#include "LoomReconciler/LoomFiberRoot.h"
#include "LoomReconciler/LoomHostConfig.h"
#include "LoomRuntime/LoomRuntime.h"
#include "LoomScheduler/SchedulerHost.h"

#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace loom::test {

struct HostNode {
  std::string type;
  std::string key;
  PropsPtr props;
  HostNode* parent{nullptr};
  std::vector<std::shared_ptr<HostNode>> children;
};

/**
 * Renderer that keeps a real host tree and records every call it receives.
 *
 * Log entries: "before:<node>", "placement:<node>", "update:<node>",
 * "deletion:<node>", "reset", "after:<node>", where <node> is the host type
 * followed by "#key" when the fiber is keyed.
 */
class TestHostConfig : public HostConfig {
public:
  explicit TestHostConfig(LoomRuntime& runtime);

  void beforeMutation(FiberRoot& root, FiberNode& fiber) override;
  void mutate(FiberRoot& root, FiberNode& fiber, FiberFlags flags) override;
  void afterMutation(FiberRoot& root, FiberNode& fiber) override;
  void resetAfterCommit(FiberRoot& root) override;
  EventPriority getCurrentEventPriority() const override;

  void setEventPriority(EventPriority priority);

  std::vector<std::string> log;
  std::size_t commitCount{0};

private:
  LoomRuntime& runtime_;
  EventPriority eventPriority_{DefaultEventPriority};
};

std::shared_ptr<HostNode> createContainerNode();

// "list(item#a,item#b(label))": host children in order, nested in parens.
std::string serializeHostTree(const HostNode& container);

// Same format, read from the root's current fiber tree.
std::string serializeFiberTree(const LoomRuntime& runtime, const FiberRoot& root);

std::string describeFiber(const FiberNode& fiber);

std::vector<std::string> takeLog(TestHostConfig& host);

std::string messageOf(const std::exception_ptr& error);

/**
 * One runtime on virtual time, rendering into a TestHostConfig container.
 * Uncaught errors of the root are collected instead of reported.
 */
struct RendererFixture {
  RendererFixture();

  RendererFixture(const RendererFixture&) = delete;
  RendererFixture& operator=(const RendererFixture&) = delete;

  std::string hostTree() const;

  MockSchedulerHost host;
  LoomRuntime runtime;
  std::shared_ptr<TestHostConfig> hostConfig;
  std::shared_ptr<HostNode> container;
  FiberRoot* root{nullptr};
  std::vector<std::string> uncaughtErrors;
};

} // namespace loom::test
