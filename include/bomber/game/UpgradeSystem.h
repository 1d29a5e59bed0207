#pragma once

#include "bomber/game/SimulationState.h"
#include "bomber/game/Upgrades.h"
#include "bomber/rendering/HudState.h"

namespace bomber::game {

class UpgradeSystem {
public:
    explicit UpgradeSystem(SimulationState& state);

    int cost(UpgradeKind kind) const;
    int level(UpgradeKind kind) const;
    bool canAfford(UpgradeKind kind) const;
    UpgradeResult apply(UpgradeKind kind);

    void toggleMenu();
    void closeMenu();
    bool menuOpen() const;
    void reset();
    void fillHud(rendering::HudState& hud) const;

private:
    SimulationState& state_;
};

} // namespace bomber::game
