#pragma once

#include "bomber/entities/Drone.h"
#include "bomber/game/Simulation.h"
#include "bomber/world/Playfield.h"

namespace bomber::game {

struct AutopilotCommand {
    MovementIntent intent{};
    bool drop{false};
};

// Flies a fixed ellipse around the playfield center and asks for a drop on a
// regular cadence. Drives the headless smoke run.
class Autopilot {
public:
    explicit Autopilot(const world::Playfield& playfield);

    AutopilotCommand update(float elapsed, const entities::Drone& drone) const;
    entities::Vec2 waypoint(float elapsed) const;
    static bool dropWindow(float elapsed);

private:
    world::Playfield playfield_{};
};

} // namespace bomber::game
