#pragma once

#include "bomber/entities/Target.h"
#include "bomber/world/Playfield.h"

#include <array>
#include <cstdint>
#include <random>

namespace bomber::game {

struct ScoreEntry {
    entities::TargetKind kind{entities::TargetKind::Infantry};
    int points{0};
    entities::Rgb color{};
};

inline constexpr std::array<ScoreEntry, 4> kScoreTable{{
    {entities::TargetKind::Infantry, 10, {70, 220, 120}},
    {entities::TargetKind::Tent, 20, {235, 220, 90}},
    {entities::TargetKind::Ammo, 50, {80, 210, 230}},
    {entities::TargetKind::Vehicle, 100, {220, 70, 70}},
}};

inline constexpr float kTargetMinSpeed = 25.0F;
inline constexpr float kTargetMaxSpeed = 65.0F;

class TargetSpawner {
public:
    // A zero seed draws one from the clock.
    explicit TargetSpawner(std::uint32_t seed = 0);

    entities::Target spawn(const world::Playfield& area);
    void reseed(std::uint32_t seed);

private:
    std::mt19937 rng_{};
    int nextId_{1};
};

} // namespace bomber::game
