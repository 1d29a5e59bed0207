#pragma once

#include "bomber/entities/Vec2.h"

#include <algorithm>

namespace bomber::entities {

inline constexpr float kDroneDefaultSpeed = 240.0F;
inline constexpr float kDroneDefaultReloadTime = 1.20F;
inline constexpr float kDroneDefaultBombRadius = 42.0F;
inline constexpr float kDroneDefaultBombFallTime = 0.55F;
inline constexpr float kDroneBoundsMargin = 10.0F;

struct DroneStats {
    float speed{kDroneDefaultSpeed};             // px/s
    float reloadTime{kDroneDefaultReloadTime};   // s
    float bombRadius{kDroneDefaultBombRadius};   // px
    float bombFallTime{kDroneDefaultBombFallTime}; // s until impact
};

class Drone {
public:
    Drone() = default;
    explicit Drone(Vec2 position) : position_{position} {}

    void setPosition(Vec2 pos) { position_ = pos; }
    Vec2 position() const { return position_; }

    void setHeading(float radians) { heading_ = radians; }
    float heading() const { return heading_; }

    DroneStats& stats() { return stats_; }
    const DroneStats& stats() const { return stats_; }

    float reloadLeft() const { return reloadLeft_; }
    bool canDrop() const { return reloadLeft_ <= 0.0F; }
    void tickReload(float dt) { reloadLeft_ = std::max(0.0F, reloadLeft_ - dt); }
    void startReload() { reloadLeft_ = stats_.reloadTime; }

private:
    Vec2 position_{};
    float heading_{0.0F};
    DroneStats stats_{};
    float reloadLeft_{0.0F};
};

} // namespace bomber::entities
