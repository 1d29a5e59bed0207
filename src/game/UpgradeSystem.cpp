#include "bomber/game/UpgradeSystem.h"

#include <string>

namespace bomber::game {

UpgradeSystem::UpgradeSystem(SimulationState& state) : state_{state} {}

int UpgradeSystem::cost(UpgradeKind kind) const {
    return UpgradeCost(kind, state_.upgrades);
}

int UpgradeSystem::level(UpgradeKind kind) const {
    return state_.upgrades.level(kind);
}

bool UpgradeSystem::canAfford(UpgradeKind kind) const {
    return state_.score >= cost(kind);
}

UpgradeResult UpgradeSystem::apply(UpgradeKind kind) {
    const int price = cost(kind);
    if (state_.score < price) {
        return UpgradeResult::InsufficientFunds;
    }
    state_.score -= price;
    state_.upgrades.increment(kind);
    // Past the cap the purchase still goes through; only the stat stops moving.
    ApplyUpgradeEffect(kind, state_.drone.stats());
    return UpgradeResult::Applied;
}

void UpgradeSystem::toggleMenu() {
    state_.mode = menuOpen() ? GameMode::Playing : GameMode::UpgradeMenu;
}

void UpgradeSystem::closeMenu() {
    state_.mode = GameMode::Playing;
}

bool UpgradeSystem::menuOpen() const {
    return state_.mode == GameMode::UpgradeMenu;
}

void UpgradeSystem::reset() {
    state_.upgrades = UpgradeLevels{};
    state_.mode = GameMode::Playing;
}

void UpgradeSystem::fillHud(rendering::HudState& hud) const {
    hud.upgradeMenuOpen = menuOpen();
    hud.upgradeRows.clear();
    hud.upgradeRows.reserve(kAllUpgradeKinds.size());
    int key = 1;
    for (UpgradeKind kind : kAllUpgradeKinds) {
        rendering::UpgradeRowHud row{};
        row.key = std::to_string(key++);
        row.label = UpgradeLabel(kind);
        row.level = level(kind);
        row.cost = cost(kind);
        row.affordable = canAfford(kind);
        hud.upgradeRows.push_back(row);
    }
}

} // namespace bomber::game
