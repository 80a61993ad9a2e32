#include "TestHostConfig.h"

#include "LoomReconciler/LoomFiberReconciler.h"
#include "LoomReconciler/LoomFiberWorkLoop.h"

#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace loom::test {

namespace {

class CounterComponent : public Component {
public:
  const char* name() const override {
    return "Counter";
  }

  ValueMap getInitialState(const Props& props) const override {
    ValueMap state;
    state["count"] = getValueOr<int>(props.values, "initial", 0);
    return state;
  }

  Elements render(const Props& props, const ValueMap& state) const override {
    (void)props;
    ++renderCount;
    return {createHostElement("text", makeProps({{"count", getValueOr<int>(state, "count", 0)}}))};
  }

  mutable int renderCount{0};
};

// Each render costs `costMs` of virtual time.
class SlowComponent : public Component {
public:
  SlowComponent(MockSchedulerHost& host, double costMs) : host_(host), costMs_(costMs) {}

  const char* name() const override {
    return "Slow";
  }

  Elements render(const Props& props, const ValueMap& state) const override {
    (void)state;
    ++renderCount;
    host_.advanceTime(costMs_);
    return {createHostElement("leaf", nullptr, getValueOr<std::string>(props.values, "label", ""))};
  }

  mutable int renderCount{0};

private:
  MockSchedulerHost& host_;
  double costMs_;
};

class FlakyComponent : public Component {
public:
  const char* name() const override {
    return "Flaky";
  }

  Elements render(const Props& props, const ValueMap& state) const override {
    (void)props;
    (void)state;
    ++attempts;
    if (failuresLeft > 0) {
      --failuresLeft;
      throw std::runtime_error("render failed");
    }
    return {createHostElement("ok")};
  }

  mutable int attempts{0};
  mutable int failuresLeft{0};
};

Element slowElement(const std::shared_ptr<SlowComponent>& slow, const std::string& label) {
  return createComponentElement(slow, makeProps({{"label", label}}), label);
}

Elements slowChildren(const std::shared_ptr<SlowComponent>& slow) {
  return {slowElement(slow, "a"), slowElement(slow, "b"), slowElement(slow, "c")};
}

Elements mixedTree(const std::shared_ptr<CounterComponent>& counter) {
  return {
    createHostElement(
      "list",
      makeProps({}, {createHostElement("item", nullptr, "a"), createHostElement("item", nullptr, "b")})),
    createComponentElement(counter, makeProps({{"initial", 3}}), "counter"),
  };
}

void testSyncAndConcurrentRenderSameTree() {
  auto counter = std::make_shared<CounterComponent>();

  RendererFixture sync;
  Lane syncLane = NoLane;
  flushSync(sync.runtime, [&] {
    syncLane = updateContainer(sync.runtime, *sync.root, mixedTree(counter));
  });
  assert(syncLane == SyncLane);
  assert(sync.hostTree() == "list(item#a,item#b),text");
  assert(serializeFiberTree(sync.runtime, *sync.root) == sync.hostTree());

  RendererFixture concurrent;
  const Lane concurrentLane = updateContainer(concurrent.runtime, *concurrent.root, mixedTree(counter));
  assert(concurrentLane == DefaultLane);
  // Nothing renders until the scheduler gets a turn.
  assert(concurrent.hostTree().empty());
  assert(concurrent.hostConfig->commitCount == 0);

  concurrent.host.flushAll();
  assert(concurrent.hostTree() == sync.hostTree());
  assert(serializeFiberTree(concurrent.runtime, *concurrent.root) == sync.hostTree());
  assert(takeLog(*concurrent.hostConfig) == takeLog(*sync.hostConfig));
  assert(concurrent.root->pendingLanes == NoLanes);
  assert(!concurrent.root->callbackNode);
  assert(getValueOr<int>(*getCurrentState(concurrent.runtime, *concurrent.root, "counter"), "count", 0) == 3);
  assert(counter->renderCount == 2);
}

void testConcurrentRenderYieldsBetweenUnits() {
  RendererFixture fixture;
  auto slow = std::make_shared<SlowComponent>(fixture.host, 3.0);

  updateContainer(fixture.runtime, *fixture.root, slowChildren(slow));
  fixture.host.flushMessage();

  // Two renders fill the 5ms slice; the third unit waits for the next turn.
  assert(slow->renderCount == 2);
  assert(getWorkInProgressRoot(fixture.runtime) == fixture.root);
  assert(getWorkInProgressRootRenderLanes(fixture.runtime) == DefaultLane);
  assert(fixture.hostTree().empty());
  assert(fixture.host.pendingMessageCount() == 1);

  fixture.host.flushAll();
  assert(slow->renderCount == 3);
  assert(getWorkInProgressRoot(fixture.runtime) == nullptr);
  assert(fixture.hostTree() == "leaf#a,leaf#b,leaf#c");
  assert(fixture.hostConfig->commitCount == 1);
}

void testSyncUpdateInterruptsYieldedRender() {
  RendererFixture fixture;
  auto slow = std::make_shared<SlowComponent>(fixture.host, 3.0);

  updateContainer(fixture.runtime, *fixture.root, slowChildren(slow));
  fixture.host.flushMessage();
  assert(getWorkInProgressRoot(fixture.runtime) == fixture.root);

  flushSync(fixture.runtime, [&] {
    updateContainer(fixture.runtime, *fixture.root, {createHostElement("leaf", nullptr, "x")});
  });
  // The half-finished default render was thrown away.
  assert(fixture.hostTree() == "leaf#x");
  assert(fixture.hostConfig->commitCount == 1);
  assert(fixture.root->pendingLanes == DefaultLane);

  // The default update is rebased under the sync one, which still wins.
  fixture.host.flushAll();
  assert(fixture.hostTree() == "leaf#x");
  assert(fixture.hostConfig->commitCount == 2);
  assert(slow->renderCount == 2);
  assert(fixture.root->pendingLanes == NoLanes);
}

void testInterleavedUpdateRendersAfterCurrentPass() {
  RendererFixture fixture;
  auto slow = std::make_shared<SlowComponent>(fixture.host, 3.0);

  updateContainer(fixture.runtime, *fixture.root, slowChildren(slow));
  fixture.host.flushMessage();

  // Same lane as the render in progress: it is not restarted.
  updateContainer(fixture.runtime, *fixture.root, {createHostElement("leaf", nullptr, "y")});
  fixture.host.flushAll();

  assert(slow->renderCount == 3);
  assert(fixture.hostConfig->commitCount == 2);
  assert(fixture.hostTree() == "leaf#y");
}

void testSamePropsBailOut() {
  RendererFixture fixture;
  auto counter = std::make_shared<CounterComponent>();
  const Elements children = {createComponentElement(counter, makeProps(), "counter")};

  updateContainer(fixture.runtime, *fixture.root, children);
  fixture.host.flushAll();
  assert(counter->renderCount == 1);
  takeLog(*fixture.hostConfig);

  updateContainer(fixture.runtime, *fixture.root, children);
  fixture.host.flushAll();
  assert(counter->renderCount == 1);
  assert((takeLog(*fixture.hostConfig) == std::vector<std::string>{"reset"}));

  updateContainer(fixture.runtime, *fixture.root, {createComponentElement(counter, makeProps(), "counter")});
  fixture.host.flushAll();
  assert(counter->renderCount == 2);
  assert((takeLog(*fixture.hostConfig) == std::vector<std::string>{"before:text", "update:text", "reset", "after:text"}));
}

void testRenderErrorIsRetriedOnce() {
  RendererFixture fixture;
  auto flaky = std::make_shared<FlakyComponent>();
  flaky->failuresLeft = 1;

  updateContainer(fixture.runtime, *fixture.root, {createComponentElement(flaky)});
  fixture.host.flushAll();

  assert(flaky->attempts == 2);
  assert(fixture.uncaughtErrors.empty());
  assert(fixture.hostTree() == "ok");
  assert(fixture.root->pendingLanes == NoLanes);
}

void testFatalRenderErrorSuspendsRoot() {
  RendererFixture fixture;
  auto flaky = std::make_shared<FlakyComponent>();
  flaky->failuresLeft = 2;
  const Elements children = {createComponentElement(flaky)};

  updateContainer(fixture.runtime, *fixture.root, children);
  fixture.host.flushAll();

  assert(flaky->attempts == 2);
  assert((fixture.uncaughtErrors == std::vector<std::string>{"render failed"}));
  assert(fixture.hostTree().empty());
  assert(fixture.hostConfig->commitCount == 0);
  // The lanes stay pending but are not retried on their own.
  assert(fixture.root->pendingLanes == DefaultLane);
  assert(fixture.root->suspendedLanes == DefaultLane);
  assert(!fixture.root->callbackNode);
  assert(fixture.host.pendingMessageCount() == 0);

  // A new update wakes the root and renders both updates.
  updateContainer(fixture.runtime, *fixture.root, children);
  fixture.host.flushAll();
  assert(flaky->attempts == 3);
  assert(fixture.uncaughtErrors.size() == 1);
  assert(fixture.hostTree() == "ok");
  assert(fixture.root->pendingLanes == NoLanes);
  assert(fixture.root->suspendedLanes == NoLanes);
}

void testStarvedRenderFinishesSynchronously() {
  RendererFixture fixture;
  auto slow = std::make_shared<SlowComponent>(fixture.host, 3.0);

  updateContainer(fixture.runtime, *fixture.root, slowChildren(slow));
  fixture.host.flushMessage();
  assert(slow->renderCount == 2);

  // Past the normal-priority timeout the task runs to completion in one turn.
  fixture.host.advanceTime(6000.0);
  fixture.host.flushMessage();
  assert(slow->renderCount == 3);
  assert(fixture.hostTree() == "leaf#a,leaf#b,leaf#c");
  assert(getWorkInProgressRoot(fixture.runtime) == nullptr);
  assert(fixture.root->expiredLanes == NoLanes);
}

} // namespace

bool runLoomFiberWorkLoopTests() {
  testSyncAndConcurrentRenderSameTree();
  testConcurrentRenderYieldsBetweenUnits();
  testSyncUpdateInterruptsYieldedRender();
  testInterleavedUpdateRendersAfterCurrentPass();
  testSamePropsBailOut();
  testRenderErrorIsRetriedOnce();
  testFatalRenderErrorSuspendsRoot();
  testStarvedRenderFinishesSynchronously();
  return true;
}

} // namespace loom::test
