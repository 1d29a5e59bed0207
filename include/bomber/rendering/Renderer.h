#pragma once

#include "bomber/game/SimulationState.h"
#include "bomber/rendering/HudState.h"

#include <memory>

namespace bomber::core {
struct AppConfig;
}

namespace bomber::rendering {

class IRenderer {
public:
    virtual ~IRenderer() = default;
    virtual void initialize() = 0;
    virtual void render(const game::SimulationState& state, const HudState& hud) = 0;
    virtual void shutdown() = 0;
};

std::unique_ptr<IRenderer> CreateSdlRenderer(const core::AppConfig& config);

} // namespace bomber::rendering
