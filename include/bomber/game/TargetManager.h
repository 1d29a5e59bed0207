#pragma once

#include "bomber/entities/Target.h"
#include "bomber/game/TargetSpawner.h"
#include "bomber/world/Playfield.h"

#include <vector>

namespace bomber::game {

class TargetManager {
public:
    TargetManager(std::vector<entities::Target>& targets, TargetSpawner& spawner, int population);

    void update(float dt, const world::Playfield& bounds);
    // Tops the live set back up to the population. Returns how many were spawned.
    int maintainPopulation(const world::Playfield& bounds);
    void reset(const world::Playfield& bounds);

    int population() const { return population_; }
    std::vector<entities::Target>& targets() { return targets_; }
    const std::vector<entities::Target>& targets() const { return targets_; }

private:
    std::vector<entities::Target>& targets_;
    TargetSpawner& spawner_;
    int population_{0};
};

} // namespace bomber::game
