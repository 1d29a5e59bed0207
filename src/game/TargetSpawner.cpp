#include "bomber/game/TargetSpawner.h"

#include "bomber/game/Seed.h"

#include <cmath>
#include <cstddef>

namespace bomber::game {

namespace {
constexpr float kTwoPi = 6.28318530718F;

float uniformBetween(std::mt19937& rng, float lo, float hi) {
    if (hi <= lo) {
        return (lo + hi) * 0.5F;
    }
    return std::uniform_real_distribution<float>(lo, hi)(rng);
}
} // namespace

TargetSpawner::TargetSpawner(std::uint32_t seed) {
    reseed(seed);
}

void TargetSpawner::reseed(std::uint32_t seed) {
    rng_.seed(ResolveSeed(seed));
}

entities::Target TargetSpawner::spawn(const world::Playfield& area) {
    std::uniform_int_distribution<std::size_t> entryDist(0, kScoreTable.size() - 1);
    const ScoreEntry& entry = kScoreTable[entryDist(rng_)];

    entities::Target target{};
    target.kind = entry.kind;
    target.points = entry.points;
    target.color = entry.color;
    target.radius = entities::TargetRadius(entry.kind);
    target.position.x = uniformBetween(rng_, area.left + target.radius, area.right - target.radius);
    target.position.y = uniformBetween(rng_, area.top + target.radius, area.bottom - target.radius);

    const float speed = std::uniform_real_distribution<float>(kTargetMinSpeed, kTargetMaxSpeed)(rng_);
    const float angle = std::uniform_real_distribution<float>(0.0F, kTwoPi)(rng_);
    target.velocity = {std::cos(angle) * speed, std::sin(angle) * speed};
    target.id = nextId_++;
    return target;
}

} // namespace bomber::game
