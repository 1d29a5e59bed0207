#include "bomber/game/BombSystem.h"

#include <algorithm>
#include <cstddef>

namespace bomber::game {

BombSystem::BombSystem(SimulationState& state) : state_{state} {}

bool BombSystem::drop(std::vector<GameEvent>& events) {
    auto& drone = state_.drone;
    if (!drone.canDrop()) {
        return false;
    }
    entities::Bomb bomb{};
    bomb.position = drone.position();
    bomb.tLeft = drone.stats().bombFallTime;
    bomb.fallTime = drone.stats().bombFallTime;
    bomb.radius = drone.stats().bombRadius;
    state_.bombs.push_back(bomb);
    drone.startReload();

    GameEvent event{};
    event.type = GameEventType::Drop;
    event.position = bomb.position;
    events.push_back(event);
    return true;
}

void BombSystem::update(float dt) {
    for (auto& bomb : state_.bombs) {
        bomb.update(dt);
    }
}

std::vector<entities::Bomb> BombSystem::takeImpactedBombs() {
    auto& bombs = state_.bombs;
    const auto falling = std::stable_partition(
        bombs.begin(), bombs.end(), [](const entities::Bomb& bomb) { return !bomb.impacted(); });
    std::vector<entities::Bomb> impacted(falling, bombs.end());
    bombs.erase(falling, bombs.end());
    return impacted;
}

BombSystem::ImpactReport BombSystem::resolveImpacts(std::vector<GameEvent>& events) {
    ImpactReport report{};
    const std::vector<entities::Bomb> impacted = takeImpactedBombs();
    if (impacted.empty()) {
        return report;
    }
    report.bombsImpacted = static_cast<int>(impacted.size());

    auto& targets = state_.targets;
    std::vector<bool> destroyed(targets.size(), false);
    for (const auto& bomb : impacted) {
        GameEvent explosion{};
        explosion.type = GameEventType::Explosion;
        explosion.position = bomb.position;
        events.push_back(explosion);

        // Bombs are resolved in drop order; a target already claimed by an
        // earlier bomb this tick is skipped.
        for (std::size_t i = 0; i < targets.size(); ++i) {
            if (destroyed[i] || !BombHitsTarget(bomb, targets[i])) {
                continue;
            }
            destroyed[i] = true;
            const auto& target = targets[i];
            state_.score += target.points;
            report.pointsGained += target.points;
            report.kills += 1;

            GameEvent kill{};
            kill.type = GameEventType::TargetDestroyed;
            kill.position = target.position;
            kill.points = target.points;
            kill.count = 1;
            kill.targetKind = target.kind;
            events.push_back(kill);
        }
    }

    if (report.kills > 0) {
        std::size_t kept = 0;
        for (std::size_t i = 0; i < targets.size(); ++i) {
            if (destroyed[i]) {
                continue;
            }
            if (kept != i) {
                targets[kept] = targets[i];
            }
            ++kept;
        }
        targets.resize(kept);

        GameEvent summary{};
        summary.type = report.kills > 1 ? GameEventType::Combo : GameEventType::Hit;
        summary.position = impacted.back().position;
        summary.count = report.kills;
        summary.points = report.pointsGained;
        events.push_back(summary);
    }
    return report;
}

void BombSystem::reset() {
    state_.bombs.clear();
}

} // namespace bomber::game
