#include <doctest/doctest.h>

#include "bomber/game/Autopilot.h"
#include "bomber/game/Simulation.h"

#include <cmath>

using bomber::entities::Drone;
using bomber::game::Autopilot;
using bomber::game::GameEventType;
using bomber::game::Simulation;
using bomber::world::Playfield;

TEST_CASE("Drop cadence follows tenths of a second")
{
    CHECK(Autopilot::dropWindow(0.03f));
    CHECK_FALSE(Autopilot::dropWindow(0.25f));
    CHECK(Autopilot::dropWindow(0.65f));
    CHECK_FALSE(Autopilot::dropWindow(0.95f));
    CHECK(Autopilot::dropWindow(1.25f));
}

TEST_CASE("Waypoint circles the playfield center")
{
    const Playfield field = Playfield::FromSize(800.0f, 600.0f);
    const Autopilot pilot{field};

    const auto start = pilot.waypoint(0.0f);
    CHECK(start.x == doctest::Approx(520.0f));
    CHECK(start.y == doctest::Approx(300.0f));

    const float quarter = 3.14159265f / 2.0f / 1.2f;
    const auto later = pilot.waypoint(quarter);
    CHECK(later.x == doctest::Approx(400.0f).epsilon(0.001));
    CHECK(later.y == doctest::Approx(380.0f));

    // Small fields clamp the path to the flyable area.
    const Autopilot cramped{Playfield::FromSize(100.0f, 100.0f)};
    CHECK(cramped.waypoint(0.0f).x == doctest::Approx(90.0f));
}

TEST_CASE("Autopilot steers toward the waypoint and drops only when reloaded")
{
    const Playfield field = Playfield::FromSize(800.0f, 600.0f);
    const Autopilot pilot{field};

    Drone drone{field.center()};
    auto command = pilot.update(0.0f, drone);
    CHECK(command.intent.dx > 0.0f);
    CHECK(command.intent.dy == doctest::Approx(0.0f));
    CHECK(command.drop);

    drone.setPosition(pilot.waypoint(0.0f));
    command = pilot.update(0.0f, drone);
    CHECK(command.intent.isZero());

    drone.startReload();
    command = pilot.update(0.0f, drone);
    CHECK_FALSE(command.drop);

    drone = Drone{field.center()};
    command = pilot.update(0.25f, drone);
    CHECK_FALSE(command.drop);
}

TEST_CASE("Autopilot keeps a simulation busy")
{
    const Playfield field = Playfield::FromSize(420.0f, 360.0f);
    const Autopilot pilot{field};
    Simulation sim{field, 17u};

    const float dt = 1.0f / 60.0f;
    float elapsed = 0.0f;
    int drops = 0;
    int explosions = 0;
    for (int i = 0; i < 600; ++i) {
        const auto command = pilot.update(elapsed, sim.state().drone);
        const auto result = sim.tick(dt, command.intent, command.drop, false);
        drops += result.countOf(GameEventType::Drop);
        explosions += result.countOf(GameEventType::Explosion);
        elapsed += dt;

        const auto pos = sim.state().drone.position();
        CHECK(field.inset(10.0f).contains(pos));
    }
    CHECK(drops >= 3);
    CHECK(explosions >= 3);
    CHECK(sim.state().targets.size() == static_cast<std::size_t>(bomber::game::kTargetPopulation));
}
