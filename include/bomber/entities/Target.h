#pragma once

#include "bomber/entities/Vec2.h"
#include "bomber/world/Playfield.h"

#include <cstdint>

namespace bomber::entities {

enum class TargetKind : std::uint8_t {
    Infantry,
    Tent,
    Ammo,
    Vehicle
};

struct Rgb {
    std::uint8_t r{0};
    std::uint8_t g{0};
    std::uint8_t b{0};
};

inline constexpr float kDefaultTargetRadius = 12.0F;

inline float TargetRadius(TargetKind kind) {
    switch (kind) {
    case TargetKind::Infantry: return 10.0F;
    case TargetKind::Tent: return 14.0F;
    case TargetKind::Ammo: return 12.0F;
    case TargetKind::Vehicle: return 18.0F;
    default: return kDefaultTargetRadius;
    }
}

inline const char* TargetKindName(TargetKind kind) {
    switch (kind) {
    case TargetKind::Infantry: return "INFANTRY";
    case TargetKind::Tent: return "TENT";
    case TargetKind::Ammo: return "AMMO";
    case TargetKind::Vehicle: return "VEHICLE";
    default: return "";
    }
}

struct Target {
    TargetKind kind{TargetKind::Infantry};
    int points{0};
    Rgb color{};
    Vec2 position{};
    Vec2 velocity{};
    float radius{kDefaultTargetRadius};
    int id{0};

    void update(float dt, const world::Playfield& bounds);
};

} // namespace bomber::entities
