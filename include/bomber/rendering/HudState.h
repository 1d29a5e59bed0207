#pragma once

#include "bomber/entities/Target.h"

#include <string>
#include <vector>

namespace bomber::rendering {

struct UpgradeRowHud {
    std::string key{};
    std::string label{};
    int level{0};
    int cost{0};
    bool affordable{false};
};

struct ScoreRowHud {
    std::string name{};
    int points{0};
    entities::Rgb color{};
};

struct FloatingNumberHud {
    float x{0.0F};
    float y{0.0F};
    int amount{0};
    float alpha{1.0F};
};

struct HudState {
    int score{0};
    bool reloadReady{true};
    float reloadLeft{0.0F};
    float speed{0.0F};
    float reloadTime{0.0F};
    float bombRadius{0.0F};
    float bombFallTime{0.0F};
    bool upgradeMenuOpen{false};
    std::vector<UpgradeRowHud> upgradeRows{};
    std::vector<ScoreRowHud> scoreTable{};
    std::string message{};
    float messageAlpha{0.0F};
    std::vector<FloatingNumberHud> floatingNumbers{};
    bool smokeRun{false};
    float perfFps{0.0F};
    float perfFrameMs{0.0F};
};

} // namespace bomber::rendering
