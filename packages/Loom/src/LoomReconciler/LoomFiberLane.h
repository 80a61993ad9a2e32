#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>

namespace loom {

struct FiberRoot;

inline constexpr int TotalLanes = 31;
inline constexpr double NoTimestamp = -1.0;

/**
 * Set of priority lanes packed in the low 31 bits of a word.
 *
 * The numerically lowest set bit is the most urgent lane. Bits outside the
 * 31-bit range are rejected on construction, so every value combined from
 * valid lanes stays valid.
 */
class Lanes {
public:
  static constexpr std::uint32_t LaneMask = 0x7FFFFFFFu;

  constexpr Lanes() = default;

  static constexpr Lanes fromBits(std::uint32_t bits) {
    if ((bits & ~LaneMask) != 0) {
      throw std::out_of_range("Lanes: bits outside the 31-bit lane range");
    }
    return Lanes(bits);
  }

  static constexpr Lanes fromIndex(int index) {
    if (index < 0 || index >= TotalLanes) {
      throw std::out_of_range("Lanes: lane index outside the 31-bit lane range");
    }
    return Lanes(std::uint32_t{1} << index);
  }

  constexpr std::uint32_t bits() const {
    return bits_;
  }

  constexpr bool isEmpty() const {
    return bits_ == 0;
  }

  constexpr Lanes merge(Lanes other) const {
    return Lanes(bits_ | other.bits_);
  }

  constexpr Lanes intersect(Lanes other) const {
    return Lanes(bits_ & other.bits_);
  }

  constexpr Lanes remove(Lanes other) const {
    return Lanes(bits_ & ~other.bits_);
  }

  constexpr bool includesSome(Lanes other) const {
    return (bits_ & other.bits_) != 0;
  }

  // True when every lane of this set is also in `set`.
  constexpr bool isSubsetOf(Lanes set) const {
    return (bits_ & set.bits_) == bits_;
  }

  constexpr Lanes highestPriority() const {
    return Lanes(bits_ & (~bits_ + 1u));
  }

  int count() const;

  constexpr Lanes operator|(Lanes other) const {
    return merge(other);
  }

  constexpr Lanes operator&(Lanes other) const {
    return intersect(other);
  }

  Lanes& operator|=(Lanes other) {
    bits_ |= other.bits_;
    return *this;
  }

  Lanes& operator&=(Lanes other) {
    bits_ &= other.bits_;
    return *this;
  }

  constexpr bool operator==(Lanes other) const {
    return bits_ == other.bits_;
  }

  constexpr bool operator!=(Lanes other) const {
    return bits_ != other.bits_;
  }

private:
  explicit constexpr Lanes(std::uint32_t bits) : bits_(bits) {}

  std::uint32_t bits_{0};
};

// A single lane is a set with exactly one bit.
using Lane = Lanes;

using LaneMap = std::array<double, TotalLanes>;

inline constexpr Lanes NoLanes = Lanes::fromBits(0b0000000000000000000000000000000u);
inline constexpr Lane NoLane = Lanes::fromBits(0b0000000000000000000000000000000u);

inline constexpr Lane SyncLane = Lanes::fromBits(0b0000000000000000000000000000001u);
inline constexpr Lane InputContinuousLane = Lanes::fromBits(0b0000000000000000000000000000100u);
inline constexpr Lane DefaultLane = Lanes::fromBits(0b0000000000000000000000000010000u);

inline constexpr Lanes TransitionLanes = Lanes::fromBits(0b0000000001111111111111111000000u);
inline constexpr Lane TransitionLane1 = Lanes::fromBits(0b0000000000000000000000001000000u);
inline constexpr Lane TransitionLane2 = Lanes::fromBits(0b0000000000000000000000010000000u);
inline constexpr Lane TransitionLane3 = Lanes::fromBits(0b0000000000000000000000100000000u);
inline constexpr Lane TransitionLane4 = Lanes::fromBits(0b0000000000000000000001000000000u);
inline constexpr Lane TransitionLane5 = Lanes::fromBits(0b0000000000000000000010000000000u);
inline constexpr Lane TransitionLane6 = Lanes::fromBits(0b0000000000000000000100000000000u);
inline constexpr Lane TransitionLane7 = Lanes::fromBits(0b0000000000000000001000000000000u);
inline constexpr Lane TransitionLane8 = Lanes::fromBits(0b0000000000000000010000000000000u);
inline constexpr Lane TransitionLane9 = Lanes::fromBits(0b0000000000000000100000000000000u);
inline constexpr Lane TransitionLane10 = Lanes::fromBits(0b0000000000000001000000000000000u);
inline constexpr Lane TransitionLane11 = Lanes::fromBits(0b0000000000000010000000000000000u);
inline constexpr Lane TransitionLane12 = Lanes::fromBits(0b0000000000000100000000000000000u);
inline constexpr Lane TransitionLane13 = Lanes::fromBits(0b0000000000001000000000000000000u);
inline constexpr Lane TransitionLane14 = Lanes::fromBits(0b0000000000010000000000000000000u);
inline constexpr Lane TransitionLane15 = Lanes::fromBits(0b0000000000100000000000000000000u);
inline constexpr Lane TransitionLane16 = Lanes::fromBits(0b0000000001000000000000000000000u);

inline constexpr Lanes RetryLanes = Lanes::fromBits(0b0000111110000000000000000000000u);
inline constexpr Lane RetryLane1 = Lanes::fromBits(0b0000000010000000000000000000000u);
inline constexpr Lane RetryLane2 = Lanes::fromBits(0b0000000100000000000000000000000u);
inline constexpr Lane RetryLane3 = Lanes::fromBits(0b0000001000000000000000000000000u);
inline constexpr Lane RetryLane4 = Lanes::fromBits(0b0000010000000000000000000000000u);
inline constexpr Lane RetryLane5 = Lanes::fromBits(0b0000100000000000000000000000000u);

inline constexpr Lanes NonIdleLanes = Lanes::fromBits(0b0001111111111111111111111111111u);

inline constexpr Lane IdleLane = Lanes::fromBits(0b0100000000000000000000000000000u);
inline constexpr Lane OffscreenLane = Lanes::fromBits(0b1000000000000000000000000000000u);

// Set operations
constexpr Lanes mergeLanes(Lanes a, Lanes b) {
  return a.merge(b);
}

constexpr Lanes intersectLanes(Lanes a, Lanes b) {
  return a.intersect(b);
}

constexpr Lanes removeLanes(Lanes set, Lanes subset) {
  return set.remove(subset);
}

constexpr bool includesSomeLane(Lanes a, Lanes b) {
  return a.includesSome(b);
}

constexpr bool isSubsetOfLanes(Lanes set, Lanes subset) {
  return subset.isSubsetOf(set);
}

constexpr Lane getHighestPriorityLane(Lanes lanes) {
  return lanes.highestPriority();
}

constexpr bool includesSyncLane(Lanes lanes) {
  return lanes.includesSome(SyncLane);
}

constexpr bool includesNonIdleWork(Lanes lanes) {
  return lanes.includesSome(NonIdleLanes);
}

constexpr bool includesOnlyTransitions(Lanes lanes) {
  return !lanes.isEmpty() && lanes.isSubsetOf(TransitionLanes);
}

constexpr bool isTransitionLane(Lane lane) {
  return lane.includesSome(TransitionLanes);
}

// Batches transition and retry lanes together; every other lane stands alone.
Lanes getHighestPriorityLanes(Lanes lanes);

int pickArbitraryLaneIndex(Lanes lanes);
int laneToIndex(Lane lane);

const char* laneName(Lane lane);

Lanes getNextLanes(const FiberRoot& root, Lanes wipLanes);

double computeExpirationTime(Lane lane, double currentTime);
void markStarvedLanesAsExpired(FiberRoot& root, double currentTime);
bool includesExpiredLane(const FiberRoot& root, Lanes lanes);

void markRootUpdated(FiberRoot& root, Lane updateLane);
void markRootSuspended(FiberRoot& root, Lanes suspendedLanes);
void markRootPinged(FiberRoot& root, Lanes pingedLanes);
void markRootFinished(FiberRoot& root, Lanes remainingLanes);

Lane claimNextTransitionLane(Lane& nextTransitionLane);

} // namespace loom
