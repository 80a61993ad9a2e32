#include "TestHostConfig.h"

#include "LoomReconciler/LoomFiberCommitWork.h"
#include "LoomReconciler/LoomFiberReconciler.h"

#include <cassert>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace loom::test {

namespace {

using Log = std::vector<std::string>;

class WrapperComponent : public Component {
public:
  const char* name() const override {
    return "Wrapper";
  }

  Elements render(const Props& props, const ValueMap& state) const override {
    (void)props;
    (void)state;
    return {createHostElement("item", nullptr, "inner")};
  }
};

Elements listOf(const std::vector<std::string>& keys) {
  Elements items;
  for (const auto& key : keys) {
    items.push_back(createHostElement("item", nullptr, key));
  }
  return {createHostElement("list", makeProps({}, std::move(items)))};
}

void render(RendererFixture& fixture, Elements children, UpdateCallback callback = {}) {
  flushSync(fixture.runtime, [&] {
    updateContainer(fixture.runtime, *fixture.root, std::move(children), std::move(callback));
  });
}

void testMountCommitsParentsFirst() {
  RendererFixture fixture;
  render(fixture, listOf({"a", "b", "c"}), [&fixture] {
    fixture.hostConfig->log.push_back("callback");
  });

  assert(fixture.hostTree() == "list(item#a,item#b,item#c)");
  assert((takeLog(*fixture.hostConfig) == Log{
    "placement:list",
    "placement:item#a",
    "placement:item#b",
    "placement:item#c",
    "reset",
    "after:list",
    "after:item#a",
    "after:item#b",
    "after:item#c",
    "callback",
  }));
}

void testKeyedMovesAndDeletions() {
  RendererFixture fixture;
  render(fixture, listOf({"a", "b", "c"}));
  takeLog(*fixture.hostConfig);

  // c keeps its host node; a and b move behind it.
  render(fixture, listOf({"c", "a", "b"}));
  assert(fixture.hostTree() == "list(item#c,item#a,item#b)");
  assert((takeLog(*fixture.hostConfig) == Log{
    "before:list",
    "update:list",
    "placement:item#a",
    "placement:item#b",
    "reset",
    "after:list",
    "after:item#a",
    "after:item#b",
  }));

  // Deletions run before the parent's own update and its children's placements.
  render(fixture, listOf({"a", "d"}));
  assert(fixture.hostTree() == "list(item#a,item#d)");
  assert((takeLog(*fixture.hostConfig) == Log{
    "before:list",
    "deletion:item#c",
    "deletion:item#b",
    "update:list",
    "placement:item#d",
    "reset",
    "after:list",
    "after:item#d",
  }));

  // An insertion in the middle goes before the next stable sibling.
  render(fixture, listOf({"a", "e", "d"}));
  assert(fixture.hostTree() == "list(item#a,item#e,item#d)");
  assert(serializeFiberTree(fixture.runtime, *fixture.root) == fixture.hostTree());

  render(fixture, {});
  assert(fixture.hostTree().empty());
}

void testHostParentAndSibling() {
  RendererFixture fixture;
  auto wrapper = std::make_shared<WrapperComponent>();
  const Element wrapped = createComponentElement(wrapper, makeProps(), "w");
  const Element last = createHostElement("item", nullptr, "z");

  render(fixture, {createHostElement("list", makeProps({}, {wrapped, last}))});
  assert(fixture.hostTree() == "list(item#inner,item#z)");

  const FiberArena& arena = fixture.runtime.fiberArena();
  const FiberId hostRoot = fixture.root->current;
  const FiberId list = arena.get(hostRoot).child;
  const FiberId inner = findCurrentFiberByKey(fixture.runtime, *fixture.root, "inner").id;
  const FiberId z = findCurrentFiberByKey(fixture.runtime, *fixture.root, "z").id;

  assert(getHostParentFiber(arena, list) == hostRoot);
  // Class components are skipped on the way up and on the way across.
  assert(getHostParentFiber(arena, inner) == list);
  assert(getHostSiblingFiber(arena, inner) == z);
  assert(getHostSiblingFiber(arena, z) == NoFiber);
  assert(getHostSiblingFiber(arena, list) == NoFiber);

  bool threw = false;
  try {
    getHostParentFiber(arena, hostRoot);
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);

  // A new first child is inserted before the host node inside the wrapper.
  render(fixture, {createHostElement("list", makeProps({}, {createHostElement("item", nullptr, "new"), wrapped, last}))});
  assert(fixture.hostTree() == "list(item#new,item#inner,item#z)");
}

void testCallbackErrorsAreReported() {
  RendererFixture fixture;
  int ran = 0;
  render(fixture, listOf({"a"}), [] {
    throw std::runtime_error("callback failed");
  });
  render(fixture, listOf({"a", "b"}), [&ran] {
    ++ran;
  });

  // The commit that owned the failing callback still completed.
  assert(fixture.hostTree() == "list(item#a,item#b)");
  assert((fixture.uncaughtErrors == std::vector<std::string>{"callback failed"}));
  assert(ran == 1);
}

void testNestedUpdateLimit() {
  RendererFixture fixture;
  int commits = 0;
  std::function<void()> rerender;
  rerender = [&] {
    ++commits;
    // Commits run at discrete priority, so this is a sync update.
    updateContainer(fixture.runtime, *fixture.root, listOf({std::to_string(commits)}), rerender);
  };

  render(fixture, listOf({"0"}), rerender);

  assert(commits > 50);
  assert(fixture.uncaughtErrors.size() == 1);
  assert(fixture.uncaughtErrors[0].find("Maximum update depth exceeded") == 0);
  assert(!includesSyncLane(fixture.root->pendingLanes));
}

} // namespace

bool runLoomFiberCommitWorkTests() {
  testMountCommitsParentsFirst();
  testKeyedMovesAndDeletions();
  testHostParentAndSibling();
  testCallbackErrorsAreReported();
  testNestedUpdateLimit();
  return true;
}

} // namespace loom::test
