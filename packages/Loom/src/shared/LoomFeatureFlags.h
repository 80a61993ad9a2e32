#pragma once

#include <cstddef>

namespace loom {

// Render non-sync lanes in time slices that yield to the host.
inline constexpr bool enableTimeSlicing = true;

// After a render error, discard the shadow tree and retry once synchronously.
inline constexpr bool enableRenderErrorRecovery = true;

// Synchronous re-renders of one root triggered from its own commit.
inline constexpr std::size_t nestedUpdateLimit = 50;

// Transition lanes eventually expire like default updates.
inline constexpr bool enableTransitionExpiration = true;

} // namespace loom
