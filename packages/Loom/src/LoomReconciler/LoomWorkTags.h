#pragma once

#include <cstdint>

namespace loom {

enum class WorkTag : std::uint8_t {
  ClassComponent = 1,
  HostRoot = 3,
  HostComponent = 5,
};

constexpr const char* workTagName(WorkTag tag) {
  switch (tag) {
    case WorkTag::ClassComponent:
      return "ClassComponent";
    case WorkTag::HostRoot:
      return "HostRoot";
    case WorkTag::HostComponent:
      return "HostComponent";
    default:
      return "Unknown";
  }
}

} // namespace loom
