#include "bomber/core/Application.h"

#include "bomber/game/Game.h"

#include <SDL.h>

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

namespace bomber::core {

Application::Application(AppConfig config) : config_{std::move(config)} {}
Application::~Application() = default;

void Application::init() {
    if (config_.smoke) {
        // Headless: no window or sound card is required.
        SDL_setenv("SDL_VIDEODRIVER", "dummy", 1);
        SDL_setenv("SDL_AUDIODRIVER", "dummy", 1);
        SDL_Log("Smoke run: %.2f s, frame cap %d, seed %u",
                static_cast<double>(config_.smokeSeconds),
                config_.smokeFrames,
                config_.seed);
    }
    running_ = true;
}

void Application::shutdown() {
    running_ = false;
    SDL_Quit();
}

int Application::run() {
    init();

    game::Game game{config_};
    game.initialize();

    const auto frameBudget = std::chrono::duration<double>(1.0 / static_cast<double>(std::max(1, config_.targetFps)));
    while (running_) {
        const auto frameStart = std::chrono::steady_clock::now();
        if (!game.tick()) {
            break;
        }
        const auto spent = std::chrono::steady_clock::now() - frameStart;
        if (spent < frameBudget) {
            std::this_thread::sleep_for(frameBudget - spent);
        }
    }

    SDL_Log("Final score: %d", game.simulation().state().score);
    game.shutdown();
    shutdown();
    return 0;
}

} // namespace bomber::core
