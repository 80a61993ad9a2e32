#include "LoomReconciler/LoomElement.h"

#include <stdexcept>
#include <utility>

namespace loom {

const char* Component::name() const {
  return "Component";
}

ValueMap Component::getInitialState(const Props& props) const {
  (void)props;
  return {};
}

bool Component::shouldUpdate(
    const Props& prevProps,
    const ValueMap& prevState,
    const Props& nextProps,
    const ValueMap& nextState) const {
  (void)prevProps;
  (void)prevState;
  (void)nextProps;
  (void)nextState;
  return true;
}

PropsPtr makeProps(ValueMap values, Elements children) {
  auto props = std::make_shared<Props>();
  props->values = std::move(values);
  props->children = std::move(children);
  return props;
}

PropsPtr emptyProps() {
  static const PropsPtr empty = std::make_shared<const Props>();
  return empty;
}

Element createHostElement(std::string type, PropsPtr props, std::string key) {
  if (type.empty()) {
    throw std::invalid_argument("createHostElement requires a host type");
  }

  Element element;
  element.tag = WorkTag::HostComponent;
  element.type = std::move(type);
  element.key = std::move(key);
  element.props = props != nullptr ? std::move(props) : emptyProps();
  return element;
}

Element createComponentElement(ComponentPtr component, PropsPtr props, std::string key) {
  if (component == nullptr) {
    throw std::invalid_argument("createComponentElement requires a component");
  }

  Element element;
  element.tag = WorkTag::ClassComponent;
  element.component = std::move(component);
  element.key = std::move(key);
  element.props = props != nullptr ? std::move(props) : emptyProps();
  return element;
}

const Elements& getChildren(const Props* props) {
  static const Elements noChildren{};
  return props != nullptr ? props->children : noChildren;
}

} // namespace loom
