#pragma once

#include "bomber/entities/Target.h"
#include "bomber/game/BombSystem.h"
#include "bomber/game/GameEvent.h"
#include "bomber/game/SimulationState.h"
#include "bomber/game/TargetManager.h"
#include "bomber/game/TargetSpawner.h"
#include "bomber/game/UpgradeSystem.h"
#include "bomber/world/Playfield.h"

#include <cstdint>
#include <vector>

namespace bomber::game {

struct MovementIntent {
    float dx{0.0F};
    float dy{0.0F};

    bool isZero() const { return dx == 0.0F && dy == 0.0F; }
};

// Owns the whole game state. Everything outside reads it through state().
class Simulation {
public:
    explicit Simulation(const world::Playfield& playfield, std::uint32_t seed = 0);
    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    void newSession(const world::Playfield& playfield);
    TickResult tick(float dt, const MovementIntent& intent, bool dropRequested, bool menuMode);

    // Drop outside of tick(); the Drop event is delivered with the next tick's result.
    bool dropBomb();

    UpgradeResult requestUpgrade(UpgradeKind kind);
    int upgradeCost(UpgradeKind kind) const;
    void toggleUpgradeMenu();
    void closeUpgradeMenu();
    bool upgradeMenuOpen() const;

    entities::Target spawnTarget();

    const SimulationState& state() const { return state_; }
    const UpgradeSystem& upgrades() const { return upgradeSystem_; }

private:
    friend class SimulationTestAccess;

    void moveDrone(float dt, const MovementIntent& intent);

    SimulationState state_{};
    TargetSpawner spawner_;
    TargetManager targetManager_;
    BombSystem bombSystem_;
    UpgradeSystem upgradeSystem_;
    std::vector<GameEvent> pendingEvents_{};
};

} // namespace bomber::game
