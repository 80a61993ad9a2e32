#pragma once

#include <cstdint>

namespace loom {

enum FiberFlags : std::uint32_t {
  NoFlags = 0,
  PerformedWork = 1u << 0,
  Placement = 1u << 1,
  // Named apart from the update-queue entry type `Update`.
  UpdateFlag = 1u << 2,
  // Only ever passed to HostConfig::mutate for a removed host node.
  Deletion = 1u << 3,
  ChildDeletion = 1u << 4,
  Callback = 1u << 6,
  Snapshot = 1u << 10,

  BeforeMutationMask = Snapshot,
  MutationMask = Placement | UpdateFlag | ChildDeletion,
};

constexpr bool hasFlag(std::uint32_t flags, FiberFlags flag) {
  return (flags & flag) != NoFlags;
}

} // namespace loom
