#include "bomber/game/Simulation.h"

#include <cmath>
#include <utility>

namespace bomber::game {

Simulation::Simulation(const world::Playfield& playfield, std::uint32_t seed)
    : spawner_{seed},
      targetManager_{state_.targets, spawner_, kTargetPopulation},
      bombSystem_{state_},
      upgradeSystem_{state_} {
    newSession(playfield);
}

void Simulation::newSession(const world::Playfield& playfield) {
    state_.playfield = playfield;
    state_.drone = entities::Drone{playfield.center()};
    state_.score = 0;
    bombSystem_.reset();
    upgradeSystem_.reset();
    targetManager_.reset(playfield);
    pendingEvents_.clear();
}

TickResult Simulation::tick(float dt, const MovementIntent& intent, bool dropRequested, bool menuMode) {
    TickResult result{};
    result.events = std::move(pendingEvents_);
    pendingEvents_.clear();

    if (dropRequested && !menuMode) {
        bombSystem_.drop(result.events);
    }
    if (!menuMode) {
        moveDrone(dt, intent);
    }
    // Reload keeps running while the upgrade menu is open.
    state_.drone.tickReload(dt);

    targetManager_.update(dt, state_.playfield);
    bombSystem_.update(dt);

    const BombSystem::ImpactReport report = bombSystem_.resolveImpacts(result.events);
    result.kills = report.kills;
    result.scoreGained = report.pointsGained;
    result.spawned = targetManager_.maintainPopulation(state_.playfield);
    return result;
}

void Simulation::moveDrone(float dt, const MovementIntent& intent) {
    auto& drone = state_.drone;
    if (!intent.isZero()) {
        const float magnitude = std::hypot(intent.dx, intent.dy);
        const entities::Vec2 direction{intent.dx / magnitude, intent.dy / magnitude};
        drone.setHeading(std::atan2(direction.y, direction.x));
        drone.setPosition(drone.position() + direction * (drone.stats().speed * dt));
    }
    const world::Playfield flyable = state_.playfield.inset(entities::kDroneBoundsMargin);
    drone.setPosition(flyable.clampPoint(drone.position()));
}

bool Simulation::dropBomb() {
    return bombSystem_.drop(pendingEvents_);
}

UpgradeResult Simulation::requestUpgrade(UpgradeKind kind) {
    return upgradeSystem_.apply(kind);
}

int Simulation::upgradeCost(UpgradeKind kind) const {
    return upgradeSystem_.cost(kind);
}

void Simulation::toggleUpgradeMenu() {
    upgradeSystem_.toggleMenu();
}

void Simulation::closeUpgradeMenu() {
    upgradeSystem_.closeMenu();
}

bool Simulation::upgradeMenuOpen() const {
    return upgradeSystem_.menuOpen();
}

entities::Target Simulation::spawnTarget() {
    return spawner_.spawn(state_.playfield);
}

} // namespace bomber::game
