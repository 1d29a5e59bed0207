#pragma once

#include "bomber/entities/Bomb.h"
#include "bomber/entities/Drone.h"
#include "bomber/entities/Target.h"
#include "bomber/game/Upgrades.h"
#include "bomber/world/Playfield.h"

#include <vector>

namespace bomber::game {

inline constexpr int kTargetPopulation = 10;

struct SimulationState {
    world::Playfield playfield{};
    entities::Drone drone{};
    std::vector<entities::Bomb> bombs{};
    std::vector<entities::Target> targets{};
    int score{0};
    UpgradeLevels upgrades{};
    GameMode mode{GameMode::Playing};
};

} // namespace bomber::game
