#include "bomber/game/Autopilot.h"

#include <cmath>

namespace bomber::game {

namespace {
constexpr float kAngularSpeed = 1.2F;   // rad/s
constexpr float kRadiusX = 120.0F;
constexpr float kRadiusY = 80.0F;
constexpr float kArrivalTolerance = 1.0F;
constexpr int kDropCadenceTenths = 6;
} // namespace

Autopilot::Autopilot(const world::Playfield& playfield) : playfield_{playfield} {}

entities::Vec2 Autopilot::waypoint(float elapsed) const {
    const float angle = elapsed * kAngularSpeed;
    const entities::Vec2 center = playfield_.center();
    const entities::Vec2 point{center.x + std::cos(angle) * kRadiusX, center.y + std::sin(angle) * kRadiusY};
    return playfield_.inset(entities::kDroneBoundsMargin).clampPoint(point);
}

bool Autopilot::dropWindow(float elapsed) {
    return static_cast<int>(elapsed * 10.0F) % kDropCadenceTenths == 0;
}

AutopilotCommand Autopilot::update(float elapsed, const entities::Drone& drone) const {
    AutopilotCommand command{};
    const entities::Vec2 delta = waypoint(elapsed) - drone.position();
    if (entities::Length(delta) > kArrivalTolerance) {
        command.intent = MovementIntent{delta.x, delta.y};
    }
    command.drop = dropWindow(elapsed) && drone.canDrop();
    return command;
}

} // namespace bomber::game
