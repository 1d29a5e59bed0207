#include "bomber/game/Seed.h"

#include <chrono>

namespace bomber::game {

namespace {
constexpr std::uint32_t kSeedSalt = 0x9E3779B9U;
} // namespace

std::uint32_t ResolveSeed(std::uint32_t requested) {
    if (requested != 0) {
        return requested;
    }
    const auto now = static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
    const auto seed = static_cast<std::uint32_t>((now ^ (now >> 32)) + kSeedSalt);
    return seed != 0 ? seed : kSeedSalt;
}

} // namespace bomber::game
