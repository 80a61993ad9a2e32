#pragma once

#include "LoomReconciler/LoomWorkTags.h"

#include <any>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace loom {

using ValueMap = std::unordered_map<std::string, std::any>;

struct Props;
using PropsPtr = std::shared_ptr<const Props>;
using StatePtr = std::shared_ptr<const ValueMap>;

class Component;
using ComponentPtr = std::shared_ptr<const Component>;

/**
 * Description of one child position: either a host node (`type`) or a class
 * component. Elements are immutable values; a fiber keeps the PropsPtr of the
 * element it was rendered from, so props identity drives bail-out.
 */
struct Element {
  WorkTag tag{WorkTag::HostComponent};
  std::string type{};
  ComponentPtr component{};
  std::string key{};
  PropsPtr props{};
};

using Elements = std::vector<Element>;

struct Props {
  ValueMap values{};
  Elements children{};
};

/**
 * Stateful node kind. Rendering is a pure function of props and state.
 */
class Component {
public:
  virtual ~Component() = default;

  virtual const char* name() const;
  virtual ValueMap getInitialState(const Props& props) const;
  virtual bool shouldUpdate(
    const Props& prevProps,
    const ValueMap& prevState,
    const Props& nextProps,
    const ValueMap& nextState) const;
  virtual Elements render(const Props& props, const ValueMap& state) const = 0;
};

PropsPtr makeProps(ValueMap values = {}, Elements children = {});
PropsPtr emptyProps();

Element createHostElement(std::string type, PropsPtr props = nullptr, std::string key = {});
Element createComponentElement(ComponentPtr component, PropsPtr props = nullptr, std::string key = {});

const Elements& getChildren(const Props* props);

template<typename T>
const T* getValue(const ValueMap& values, const std::string& key) {
  auto it = values.find(key);
  if (it == values.end()) {
    return nullptr;
  }
  return std::any_cast<T>(&it->second);
}

template<typename T>
T getValueOr(const ValueMap& values, const std::string& key, T fallback) {
  const T* value = getValue<T>(values, key);
  return value != nullptr ? *value : fallback;
}

} // namespace loom
