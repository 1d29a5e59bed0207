#pragma once

#include <cstdint>

namespace bomber::game {

// 0 asks for a clock-derived seed; any other value is returned unchanged.
// The result is never 0.
std::uint32_t ResolveSeed(std::uint32_t requested);

} // namespace bomber::game
