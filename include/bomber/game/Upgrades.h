#pragma once

#include "bomber/entities/Drone.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>

namespace bomber::game {

enum class UpgradeKind : std::uint8_t {
    Speed,
    Reload,
    Radius,
    Count
};

enum class UpgradeResult : std::uint8_t {
    Applied,
    InsufficientFunds
};

enum class GameMode : std::uint8_t {
    Playing,
    UpgradeMenu
};

inline constexpr std::size_t kUpgradeKindCount = static_cast<std::size_t>(UpgradeKind::Count);
inline constexpr std::array<UpgradeKind, kUpgradeKindCount> kAllUpgradeKinds{
    UpgradeKind::Speed, UpgradeKind::Reload, UpgradeKind::Radius};

inline constexpr float kSpeedUpgradeStep = 35.0F;
inline constexpr float kMaxDroneSpeed = 520.0F;
inline constexpr float kReloadUpgradeStep = 0.12F;
inline constexpr float kMinReloadTime = 0.25F;
inline constexpr float kRadiusUpgradeStep = 6.0F;
inline constexpr float kMaxBombRadius = 110.0F;

inline int UpgradeBaseCost(UpgradeKind kind) {
    switch (kind) {
    case UpgradeKind::Speed: return 120;
    case UpgradeKind::Reload: return 140;
    case UpgradeKind::Radius: return 160;
    default: return 0;
    }
}

inline const char* UpgradeLabel(UpgradeKind kind) {
    switch (kind) {
    case UpgradeKind::Speed: return "SPEED+";
    case UpgradeKind::Reload: return "RELOAD-";
    case UpgradeKind::Radius: return "RADIUS+";
    default: return "";
    }
}

struct UpgradeLevels {
    std::array<int, kUpgradeKindCount> levels{};

    int level(UpgradeKind kind) const { return levels[static_cast<std::size_t>(kind)]; }
    void increment(UpgradeKind kind) { levels[static_cast<std::size_t>(kind)] += 1; }
};

// Linear growth: every purchased level adds one more base cost.
inline int UpgradeCost(UpgradeKind kind, const UpgradeLevels& levels) {
    return UpgradeBaseCost(kind) * (1 + levels.level(kind));
}

inline void ApplyUpgradeEffect(UpgradeKind kind, entities::DroneStats& stats) {
    switch (kind) {
    case UpgradeKind::Speed:
        stats.speed = std::min(kMaxDroneSpeed, stats.speed + kSpeedUpgradeStep);
        break;
    case UpgradeKind::Reload:
        stats.reloadTime = std::max(kMinReloadTime, stats.reloadTime - kReloadUpgradeStep);
        break;
    case UpgradeKind::Radius:
        stats.bombRadius = std::min(kMaxBombRadius, stats.bombRadius + kRadiusUpgradeStep);
        break;
    default:
        break;
    }
}

} // namespace bomber::game
