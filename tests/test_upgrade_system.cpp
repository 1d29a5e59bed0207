#include <doctest/doctest.h>

#include "bomber/game/Simulation.h"
#include "SimulationTestAccess.h"
#include "bomber/rendering/HudState.h"

using bomber::game::GameMode;
using bomber::game::Simulation;
using bomber::game::SimulationTestAccess;
using bomber::game::UpgradeKind;
using bomber::game::UpgradeResult;
using bomber::world::Playfield;

namespace {
const Playfield kField = Playfield::FromSize(800.0f, 600.0f);
}

TEST_CASE("Upgrade cost grows by one base price per level")
{
    Simulation sim{kField, 1u};
    CHECK(sim.upgradeCost(UpgradeKind::Speed) == 120);
    CHECK(sim.upgradeCost(UpgradeKind::Reload) == 140);
    CHECK(sim.upgradeCost(UpgradeKind::Radius) == 160);

    SimulationTestAccess::state(sim).score = 1000;
    REQUIRE(sim.requestUpgrade(UpgradeKind::Speed) == UpgradeResult::Applied);
    CHECK(sim.state().score == 880);
    CHECK(sim.upgradeCost(UpgradeKind::Speed) == 240);
    CHECK(sim.upgradeCost(UpgradeKind::Reload) == 140);
    CHECK(sim.upgrades().level(UpgradeKind::Speed) == 1);
    CHECK(sim.state().drone.stats().speed == doctest::Approx(275.0f));
}

TEST_CASE("Unaffordable upgrade changes nothing")
{
    Simulation sim{kField, 1u};
    SimulationTestAccess::state(sim).score = 100;
    CHECK_FALSE(sim.upgrades().canAfford(UpgradeKind::Speed));
    CHECK(sim.requestUpgrade(UpgradeKind::Speed) == UpgradeResult::InsufficientFunds);
    CHECK(sim.state().score == 100);
    CHECK(sim.upgrades().level(UpgradeKind::Speed) == 0);
    CHECK(sim.state().drone.stats().speed == doctest::Approx(240.0f));

    SimulationTestAccess::state(sim).score = 120;
    CHECK(sim.requestUpgrade(UpgradeKind::Speed) == UpgradeResult::Applied);
    CHECK(sim.state().score == 0);
}

TEST_CASE("Speed saturates at its cap while levels and costs keep going")
{
    Simulation sim{kField, 1u};
    SimulationTestAccess::state(sim).score = 100000;

    int spent = 0;
    for (int i = 0; i < 8; ++i) {
        spent += sim.upgradeCost(UpgradeKind::Speed);
        REQUIRE(sim.requestUpgrade(UpgradeKind::Speed) == UpgradeResult::Applied);
    }
    CHECK(sim.state().drone.stats().speed == doctest::Approx(520.0f));

    const int scoreBefore = sim.state().score;
    const int ninthCost = sim.upgradeCost(UpgradeKind::Speed);
    CHECK(ninthCost == 120 * 9);
    REQUIRE(sim.requestUpgrade(UpgradeKind::Speed) == UpgradeResult::Applied);
    CHECK(sim.state().drone.stats().speed == doctest::Approx(520.0f));
    CHECK(sim.upgrades().level(UpgradeKind::Speed) == 9);
    CHECK(sim.state().score == scoreBefore - ninthCost);
    CHECK(sim.state().score == 100000 - spent - ninthCost);
}

TEST_CASE("Reload time and bomb radius stop at their limits")
{
    Simulation sim{kField, 1u};
    SimulationTestAccess::state(sim).score = 100000;

    for (int i = 0; i < 10; ++i) {
        REQUIRE(sim.requestUpgrade(UpgradeKind::Reload) == UpgradeResult::Applied);
    }
    CHECK(sim.state().drone.stats().reloadTime == bomber::game::kMinReloadTime);

    for (int i = 0; i < 15; ++i) {
        REQUIRE(sim.requestUpgrade(UpgradeKind::Radius) == UpgradeResult::Applied);
    }
    CHECK(sim.state().drone.stats().bombRadius == bomber::game::kMaxBombRadius);
    CHECK(sim.upgrades().level(UpgradeKind::Radius) == 15);
    CHECK(sim.state().score == 100000 - 140 * 55 - 160 * 120);
}

TEST_CASE("Upgrade menu toggles and closes")
{
    Simulation sim{kField, 1u};
    CHECK_FALSE(sim.upgradeMenuOpen());
    sim.toggleUpgradeMenu();
    CHECK(sim.upgradeMenuOpen());
    CHECK(sim.state().mode == GameMode::UpgradeMenu);
    sim.toggleUpgradeMenu();
    CHECK_FALSE(sim.upgradeMenuOpen());

    sim.toggleUpgradeMenu();
    sim.closeUpgradeMenu();
    CHECK(sim.state().mode == GameMode::Playing);
    sim.closeUpgradeMenu();
    CHECK_FALSE(sim.upgradeMenuOpen());
}

TEST_CASE("Upgrade rows for the HUD")
{
    Simulation sim{kField, 1u};
    SimulationTestAccess::state(sim).score = 150;
    sim.toggleUpgradeMenu();

    bomber::rendering::HudState hud{};
    sim.upgrades().fillHud(hud);
    CHECK(hud.upgradeMenuOpen);
    REQUIRE(hud.upgradeRows.size() == 3);
    CHECK(hud.upgradeRows[0].key == "1");
    CHECK(hud.upgradeRows[0].label == "SPEED+");
    CHECK(hud.upgradeRows[0].cost == 120);
    CHECK(hud.upgradeRows[0].affordable);
    CHECK(hud.upgradeRows[1].label == "RELOAD-");
    CHECK(hud.upgradeRows[1].affordable);
    CHECK(hud.upgradeRows[2].key == "3");
    CHECK(hud.upgradeRows[2].label == "RADIUS+");
    CHECK_FALSE(hud.upgradeRows[2].affordable);
}
