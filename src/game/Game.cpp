#include "bomber/game/Game.h"

#include "bomber/game/TargetSpawner.h"

#include <SDL.h>

#include <algorithm>
#include <cstddef>

namespace bomber::game {

namespace {
constexpr float kMaxFrameDelta = 0.1F;
constexpr float kPerfSmoothing = 0.1F;

world::Playfield PlayfieldFor(const core::AppConfig& config) {
    const int playWidth = std::max(1, config.windowWidth - config.sidebarWidth);
    return world::Playfield::FromSize(static_cast<float>(playWidth), static_cast<float>(config.windowHeight));
}

std::unique_ptr<audio::IAudioSystem> CreateAudio(const core::AppConfig& config) {
    if (!config.audioEnabled) {
        return audio::CreateSilentAudio();
    }
    return audio::CreateSdlMixerAudio(config);
}
} // namespace

Game::Game(const core::AppConfig& config)
    : config_{config},
      playfield_{PlayfieldFor(config_)},
      simulation_{playfield_, config_.seed},
      feedback_{config_.seed},
      autopilot_{playfield_},
      renderer_{rendering::CreateSdlRenderer(config_)},
      inputSystem_{input::CreateSdlInputSystem()},
      audio_{CreateAudio(config_)} {}

void Game::initialize() {
    renderer_->initialize();
    inputSystem_->initialize();
    audio_->initialize();

    hud_.scoreTable.clear();
    for (const auto& entry : kScoreTable) {
        hud_.scoreTable.push_back({entities::TargetKindName(entry.kind), entry.points, entry.color});
    }
    hud_.smokeRun = config_.smoke;
    startSession();
}

void Game::startSession() {
    simulation_.newSession(playfield_);
    feedback_.reset();
    feedback_.onSessionStart();
    audio_->play(audio::SoundId::Drone);
    elapsed_ = 0.0F;
    frames_ = 0;
    bombsDropped_ = 0;
    SDL_Log("Session started: playfield %.0fx%.0f, %zu targets",
            static_cast<double>(playfield_.width()),
            static_cast<double>(playfield_.height()),
            simulation_.state().targets.size());
}

bool Game::tick() {
    const auto frameStart = std::chrono::steady_clock::now();
    const float dt = frameDelta();
    handleInput();
    const auto updateStart = std::chrono::steady_clock::now();
    update(dt);
    const auto updateEnd = std::chrono::steady_clock::now();
    updateHudState();
    const auto renderStart = std::chrono::steady_clock::now();
    render();
    const auto frameEnd = std::chrono::steady_clock::now();

    const float frameMs = std::chrono::duration<float, std::milli>(frameEnd - frameStart).count();
    const float updateMs = std::chrono::duration<float, std::milli>(updateEnd - updateStart).count();
    const float renderMs = std::chrono::duration<float, std::milli>(frameEnd - renderStart).count();
    recordPerformanceMetrics(frameMs, updateMs, renderMs);

    if (config_.smoke && smokeRunFinished()) {
        logSmokeSummary();
        return false;
    }
    return !inputSystem_->shouldQuit() && !requestQuit_;
}

void Game::shutdown() {
    audio_->shutdown();
    inputSystem_->shutdown();
    renderer_->shutdown();
}

float Game::frameDelta() {
    const auto now = std::chrono::steady_clock::now();
    if (!haveLastFrame_) {
        lastFrame_ = now;
        haveLastFrame_ = true;
        return 0.0F;
    }
    const float raw = std::chrono::duration<float>(now - lastFrame_).count();
    lastFrame_ = now;
    // A stalled frame advances the simulation by at most kMaxFrameDelta.
    return std::clamp(raw, 0.0F, kMaxFrameDelta);
}

void Game::handleInput() {
    inputSystem_->poll();
    const auto& inputState = inputSystem_->state();
    intent_ = MovementIntent{inputState.moveX, inputState.moveY};
    dropRequested_ = inputState.drop;

    if (inputState.back) {
        if (simulation_.upgradeMenuOpen()) {
            simulation_.closeUpgradeMenu();
        } else {
            requestQuit_ = true;
        }
        return;
    }
    if (inputState.toggleUpgrades) {
        simulation_.toggleUpgradeMenu();
    }
    if (simulation_.upgradeMenuOpen() && inputState.upgradeSelection >= 0
        && static_cast<std::size_t>(inputState.upgradeSelection) < kUpgradeKindCount) {
        purchaseUpgrade(kAllUpgradeKinds[static_cast<std::size_t>(inputState.upgradeSelection)]);
    }
}

void Game::purchaseUpgrade(UpgradeKind kind) {
    const int cost = simulation_.upgradeCost(kind);
    if (simulation_.requestUpgrade(kind) != UpgradeResult::Applied) {
        return;
    }
    audio_->play(audio::SoundId::Upgrade);
    feedback_.onUpgradeApplied();
    SDL_Log("Upgrade %s bought for %d (level %d, score %d)",
            UpgradeLabel(kind),
            cost,
            simulation_.upgrades().level(kind),
            simulation_.state().score);
}

void Game::update(float dt) {
    if (config_.smoke) {
        const AutopilotCommand command = autopilot_.update(elapsed_, simulation_.state().drone);
        intent_ = command.intent;
        dropRequested_ = command.drop;
    }

    const bool menuMode = simulation_.upgradeMenuOpen();
    const TickResult result = simulation_.tick(dt, intent_, dropRequested_, menuMode);
    bombsDropped_ += result.countOf(GameEventType::Drop);
    playEventSounds(result.events);
    feedback_.onEvents(result.events);
    feedback_.update(dt);

    elapsed_ += dt;
    ++frames_;
}

void Game::playEventSounds(const std::vector<GameEvent>& events) {
    for (const auto& event : events) {
        switch (event.type) {
        case GameEventType::Drop:
            audio_->play(audio::SoundId::Drop);
            break;
        case GameEventType::Explosion:
            audio_->play(audio::SoundId::Explosion);
            break;
        case GameEventType::TargetDestroyed:
            audio_->play(audio::SoundId::Hit);
            break;
        default:
            break;
        }
    }
}

void Game::render() {
    renderer_->render(simulation_.state(), hud_);
}

void Game::updateHudState() {
    const auto& state = simulation_.state();
    const auto& drone = state.drone;
    hud_.score = state.score;
    hud_.reloadReady = drone.canDrop();
    hud_.reloadLeft = drone.reloadLeft();
    hud_.speed = drone.stats().speed;
    hud_.reloadTime = drone.stats().reloadTime;
    hud_.bombRadius = drone.stats().bombRadius;
    hud_.bombFallTime = drone.stats().bombFallTime;
    simulation_.upgrades().fillHud(hud_);
    feedback_.fillHud(hud_);
    hud_.perfFps = perfFps_;
    hud_.perfFrameMs = perfFrameTimeMs_;
}

void Game::recordPerformanceMetrics(float frameMs, float updateMs, float renderMs) {
    const auto smooth = [](float current, float target) {
        if (current <= 0.0F) {
            return target;
        }
        return current + (target - current) * kPerfSmoothing;
    };
    perfFrameTimeMs_ = smooth(perfFrameTimeMs_, frameMs);
    perfUpdateTimeMs_ = smooth(perfUpdateTimeMs_, updateMs);
    perfRenderTimeMs_ = smooth(perfRenderTimeMs_, renderMs);
    perfFps_ = (perfFrameTimeMs_ > 0.0001F) ? (1000.0F / perfFrameTimeMs_) : static_cast<float>(config_.targetFps);
}

bool Game::smokeRunFinished() const {
    if (config_.smokeFrames > 0 && frames_ >= config_.smokeFrames) {
        return true;
    }
    return elapsed_ >= config_.smokeSeconds;
}

void Game::logSmokeSummary() const {
    SDL_Log("Smoke run finished: %d frames, %.2f s, score %d, %d bombs dropped, %zu targets alive",
            frames_,
            static_cast<double>(elapsed_),
            simulation_.state().score,
            bombsDropped_,
            simulation_.state().targets.size());
    SDL_Log("Timing: update %.3f ms, render %.3f ms", static_cast<double>(perfUpdateTimeMs_),
            static_cast<double>(perfRenderTimeMs_));
}

} // namespace bomber::game
