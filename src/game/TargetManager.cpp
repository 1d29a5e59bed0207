#include "bomber/game/TargetManager.h"

namespace bomber::game {

TargetManager::TargetManager(std::vector<entities::Target>& targets, TargetSpawner& spawner, int population)
    : targets_{targets},
      spawner_{spawner},
      population_{population} {}

void TargetManager::update(float dt, const world::Playfield& bounds) {
    for (auto& target : targets_) {
        target.update(dt, bounds);
    }
}

int TargetManager::maintainPopulation(const world::Playfield& bounds) {
    int spawned = 0;
    while (static_cast<int>(targets_.size()) < population_) {
        targets_.push_back(spawner_.spawn(bounds));
        ++spawned;
    }
    return spawned;
}

void TargetManager::reset(const world::Playfield& bounds) {
    targets_.clear();
    targets_.reserve(static_cast<std::size_t>(population_));
    maintainPopulation(bounds);
}

} // namespace bomber::game
