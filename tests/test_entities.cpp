#include <doctest/doctest.h>

#include "bomber/entities/Bomb.h"
#include "bomber/entities/Drone.h"
#include "bomber/entities/Target.h"
#include "bomber/world/Playfield.h"

#include <string>

using bomber::entities::Bomb;
using bomber::entities::Drone;
using bomber::entities::Target;
using bomber::entities::TargetKind;
using bomber::entities::Vec2;
using bomber::world::Playfield;

TEST_CASE("Drone reload completes exactly when the accumulated time reaches the reload time")
{
    Drone drone{Vec2{50.0f, 50.0f}};
    CHECK(drone.canDrop());

    drone.stats().reloadTime = 1.0f;
    drone.startReload();
    CHECK_FALSE(drone.canDrop());

    drone.tickReload(0.25f);
    drone.tickReload(0.25f);
    drone.tickReload(0.25f);
    CHECK_FALSE(drone.canDrop());
    CHECK(drone.reloadLeft() == doctest::Approx(0.25f));

    drone.tickReload(0.25f);
    CHECK(drone.canDrop());
    CHECK(drone.reloadLeft() == 0.0f);

    // Never goes negative.
    drone.tickReload(5.0f);
    CHECK(drone.reloadLeft() == 0.0f);
}

TEST_CASE("Bomb counts down and impacts at zero")
{
    Bomb bomb{};
    bomb.tLeft = 0.5f;
    bomb.fallTime = 0.5f;
    bomb.radius = 42.0f;

    bomb.update(0.25f);
    CHECK_FALSE(bomb.impacted());
    bomb.update(0.25f);
    CHECK(bomb.impacted());
}

TEST_CASE("Target bounces off a single wall")
{
    const Playfield bounds = Playfield::FromSize(100.0f, 100.0f);
    Target target{};
    target.radius = 10.0f;
    target.position = {95.0f, 50.0f};
    target.velocity = {20.0f, 0.0f};

    target.update(0.5f, bounds);
    CHECK(target.position.x == doctest::Approx(90.0f));
    CHECK(target.velocity.x == doctest::Approx(-20.0f));
    CHECK(target.position.y == doctest::Approx(50.0f));
    CHECK(target.velocity.y == doctest::Approx(0.0f));
}

TEST_CASE("Target hitting a corner reflects both axes in the same step")
{
    const Playfield bounds = Playfield::FromSize(100.0f, 100.0f);
    Target target{};
    target.radius = 10.0f;
    target.position = {12.0f, 12.0f};
    target.velocity = {-20.0f, -20.0f};

    target.update(0.5f, bounds);
    CHECK(target.position.x == doctest::Approx(10.0f));
    CHECK(target.position.y == doctest::Approx(10.0f));
    CHECK(target.velocity.x == doctest::Approx(20.0f));
    CHECK(target.velocity.y == doctest::Approx(20.0f));
}

TEST_CASE("Target radius and name per kind")
{
    CHECK(bomber::entities::TargetRadius(TargetKind::Infantry) == 10.0f);
    CHECK(bomber::entities::TargetRadius(TargetKind::Tent) == 14.0f);
    CHECK(bomber::entities::TargetRadius(TargetKind::Ammo) == 12.0f);
    CHECK(bomber::entities::TargetRadius(TargetKind::Vehicle) == 18.0f);
    CHECK(std::string(bomber::entities::TargetKindName(TargetKind::Vehicle)) == "VEHICLE");
}

TEST_CASE("Playfield inset and clamp")
{
    const Playfield field = Playfield::FromSize(800.0f, 600.0f);
    const Playfield flyable = field.inset(10.0f);
    CHECK(flyable.left == 10.0f);
    CHECK(flyable.bottom == 590.0f);

    const Vec2 clamped = flyable.clampPoint({-50.0f, 1000.0f});
    CHECK(clamped.x == 10.0f);
    CHECK(clamped.y == 590.0f);
    CHECK(flyable.contains(clamped));
    CHECK_FALSE(flyable.contains({5.0f, 5.0f}));
}
