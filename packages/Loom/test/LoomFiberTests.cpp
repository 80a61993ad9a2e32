#include "LoomReconciler/LoomElement.h"
#include "LoomReconciler/LoomFiber.h"
#include "LoomReconciler/LoomFiberRoot.h"

#include <cassert>
#include <stdexcept>
#include <string>

namespace loom::test {

namespace {

class EmptyComponent : public Component {
public:
  Elements render(const Props& props, const ValueMap& state) const override {
    (void)props;
    (void)state;
    return {};
  }
};

void testArenaHandles() {
  FiberArena arena;
  const FiberId first = arena.allocate();
  const FiberId second = arena.allocate();
  assert(first != second);
  assert(arena.liveCount() == 2);
  assert(arena.isLive(first));
  assert(!arena.isLive(NoFiber));

  const FiberHandle handle = arena.handleOf(first);
  assert(handle);
  assert(arena.resolve(handle) == &arena.get(first));

  arena.release(first);
  arena.release(first);
  assert(arena.liveCount() == 1);
  assert(!arena.isLive(first));
  assert(arena.tryGet(first) == nullptr);
  assert(arena.resolve(handle) == nullptr);
  assert(!arena.handleOf(first));

  bool threw = false;
  try {
    arena.get(first);
  } catch (const std::out_of_range&) {
    threw = true;
  }
  assert(threw);

  // Released slots are reused with a new generation, so old handles stay dead.
  const FiberId reused = arena.allocate();
  assert(reused == first);
  assert(arena.resolve(handle) == nullptr);
  assert(arena.handleOf(reused) != handle);
  assert(arena.capacity() == 2);
}

void testCreateFibers() {
  FiberArena arena;
  FiberRoot root{};
  const FiberId hostRoot = createHostRootFiber(arena, root);
  assert(arena.get(hostRoot).tag == WorkTag::HostRoot);
  assert(arena.get(hostRoot).root == &root);
  assert(isHostFiber(arena.get(hostRoot)));

  const PropsPtr props = makeProps({{"label", std::string("ok")}});
  const FiberId host = createFiberFromElement(arena, createHostElement("item", props, "a"), DefaultLane);
  const FiberNode& hostFiber = arena.get(host);
  assert(hostFiber.type == "item");
  assert(hostFiber.key == "a");
  assert(hostFiber.pendingProps == props);
  assert(hostFiber.lanes == DefaultLane);
  assert(isHostFiber(hostFiber));
  assert(getValueOr<std::string>(hostFiber.pendingProps->values, "label", "") == "ok");
  assert(getValue<int>(hostFiber.pendingProps->values, "label") == nullptr);

  auto component = std::make_shared<EmptyComponent>();
  const FiberId classFiber = createFiberFromElement(arena, createComponentElement(component), NoLanes);
  assert(arena.get(classFiber).tag == WorkTag::ClassComponent);
  assert(arena.get(classFiber).component == component);
  assert(arena.get(classFiber).pendingProps == emptyProps());
  assert(!isHostFiber(arena.get(classFiber)));
  assert(std::string(component->name()) == "Component");

  bool threw = false;
  try {
    createComponentElement(nullptr);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    createHostElement("");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void testCreateWorkInProgressPairsFibers() {
  FiberArena arena;
  const PropsPtr firstProps = makeProps();
  const FiberId current = createFiber(arena, WorkTag::HostComponent, firstProps, "k");
  arena.get(current).type = "item";
  arena.get(current).memoizedProps = firstProps;
  arena.get(current).lanes = DefaultLane;

  const PropsPtr nextProps = makeProps();
  const FiberId workInProgress = createWorkInProgress(arena, current, nextProps);
  assert(workInProgress != current);
  assert(arena.get(current).alternate == workInProgress);
  assert(arena.get(workInProgress).alternate == current);
  assert(arena.get(workInProgress).pendingProps == nextProps);
  assert(arena.get(workInProgress).memoizedProps == firstProps);
  assert(arena.get(workInProgress).lanes == DefaultLane);
  assert(arena.get(workInProgress).type == "item");

  // The second call reuses the alternate and clears its effects.
  arena.get(workInProgress).flags = Placement;
  arena.get(workInProgress).deletions.push_back(current);
  const FiberId reused = createWorkInProgress(arena, current, firstProps);
  assert(reused == workInProgress);
  assert(arena.get(reused).flags == NoFlags);
  assert(arena.get(reused).deletions.empty());
  assert(arena.liveCount() == 2);
}

void testCollectGarbage() {
  FiberArena arena;
  FiberRoot root{};
  const FiberId hostRoot = createHostRootFiber(arena, root);
  const FiberId child = createFiber(arena, WorkTag::HostComponent, emptyProps(), "");
  const FiberId sibling = createFiber(arena, WorkTag::HostComponent, emptyProps(), "");
  const FiberId detached = createFiber(arena, WorkTag::HostComponent, emptyProps(), "");
  arena.get(hostRoot).child = child;
  arena.get(child).returnFiber = hostRoot;
  arena.get(child).sibling = sibling;
  arena.get(sibling).returnFiber = hostRoot;

  const FiberId alternate = createWorkInProgress(arena, child, emptyProps());
  const FiberHandle detachedHandle = arena.handleOf(detached);

  const std::size_t released = arena.collectGarbage({hostRoot});
  assert(released == 1);
  assert(arena.isLive(hostRoot));
  assert(arena.isLive(child));
  assert(arena.isLive(sibling));
  // Alternates of current fibers are kept for reuse.
  assert(arena.isLive(alternate));
  assert(arena.resolve(detachedHandle) == nullptr);
}

} // namespace

bool runLoomFiberTests() {
  testArenaHandles();
  testCreateFibers();
  testCreateWorkInProgressPairsFibers();
  testCollectGarbage();
  return true;
}

} // namespace loom::test
