#pragma once

#include "bomber/audio/AudioSystem.h"
#include "bomber/core/Application.h"
#include "bomber/game/Autopilot.h"
#include "bomber/game/FeedbackSystem.h"
#include "bomber/game/Simulation.h"
#include "bomber/input/InputSystem.h"
#include "bomber/rendering/HudState.h"
#include "bomber/rendering/Renderer.h"

#include <chrono>
#include <memory>
#include <vector>

namespace bomber::game {

class Game {
public:
    explicit Game(const core::AppConfig& config);

    void initialize();
    bool tick();
    void shutdown();

    const Simulation& simulation() const { return simulation_; }

private:
    float frameDelta();
    void handleInput();
    void update(float dt);
    void render();
    void startSession();
    void purchaseUpgrade(UpgradeKind kind);
    void playEventSounds(const std::vector<GameEvent>& events);
    void updateHudState();
    void recordPerformanceMetrics(float frameMs, float updateMs, float renderMs);
    bool smokeRunFinished() const;
    void logSmokeSummary() const;

    core::AppConfig config_;
    world::Playfield playfield_{};
    Simulation simulation_;
    FeedbackSystem feedback_;
    Autopilot autopilot_;
    std::unique_ptr<rendering::IRenderer> renderer_;
    std::unique_ptr<input::IInputSystem> inputSystem_;
    std::unique_ptr<audio::IAudioSystem> audio_;
    rendering::HudState hud_{};

    MovementIntent intent_{};
    bool dropRequested_{false};
    bool requestQuit_{false};

    std::chrono::steady_clock::time_point lastFrame_{};
    bool haveLastFrame_{false};
    float elapsed_{0.0F};
    int frames_{0};
    int bombsDropped_{0};

    float perfFrameTimeMs_{0.0F};
    float perfUpdateTimeMs_{0.0F};
    float perfRenderTimeMs_{0.0F};
    float perfFps_{0.0F};
};

} // namespace bomber::game
