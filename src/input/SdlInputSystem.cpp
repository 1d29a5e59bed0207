#include "bomber/input/InputSystem.h"

#include <SDL.h>

#include <stdexcept>
#include <string>

namespace bomber::input {

namespace {

class SdlInputSystem final : public IInputSystem {
public:
    void initialize() override {
        if ((SDL_WasInit(SDL_INIT_EVENTS) & SDL_INIT_EVENTS) == 0) {
            if (SDL_InitSubSystem(SDL_INIT_EVENTS) != 0) {
                throw std::runtime_error(std::string("Failed to init SDL events: ") + SDL_GetError());
            }
        }
    }

    void poll() override {
        state_.moveX = 0.0F;
        state_.moveY = 0.0F;
        state_.drop = false;
        state_.toggleUpgrades = false;
        state_.upgradeSelection = -1;
        state_.back = false;
        SDL_Event event{};

        // Key presses are edge-triggered so a held key does not repeat a drop or a purchase.
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_QUIT) {
                quit_ = true;
            } else if (event.type == SDL_KEYDOWN && event.key.repeat == 0) {
                switch (event.key.keysym.sym) {
                case SDLK_ESCAPE: state_.back = true; break;
                case SDLK_SPACE: state_.drop = true; break;
                case SDLK_u: state_.toggleUpgrades = true; break;
                case SDLK_1:
                case SDLK_KP_1:
                    state_.upgradeSelection = 0;
                    break;
                case SDLK_2:
                case SDLK_KP_2:
                    state_.upgradeSelection = 1;
                    break;
                case SDLK_3:
                case SDLK_KP_3:
                    state_.upgradeSelection = 2;
                    break;
                default: break;
                }
            }
        }

        const Uint8* keyboard = SDL_GetKeyboardState(nullptr);
        if (keyboard[SDL_SCANCODE_A] || keyboard[SDL_SCANCODE_LEFT]) {
            state_.moveX -= 1.0F;
        }
        if (keyboard[SDL_SCANCODE_D] || keyboard[SDL_SCANCODE_RIGHT]) {
            state_.moveX += 1.0F;
        }
        if (keyboard[SDL_SCANCODE_W] || keyboard[SDL_SCANCODE_UP]) {
            state_.moveY -= 1.0F;
        }
        if (keyboard[SDL_SCANCODE_S] || keyboard[SDL_SCANCODE_DOWN]) {
            state_.moveY += 1.0F;
        }
    }

    bool shouldQuit() const override { return quit_; }
    const InputState& state() const override { return state_; }

    void shutdown() override {
        SDL_QuitSubSystem(SDL_INIT_EVENTS);
    }

private:
    InputState state_{};
    bool quit_{false};
};

} // namespace

std::unique_ptr<IInputSystem> CreateSdlInputSystem() {
    return std::make_unique<SdlInputSystem>();
}

} // namespace bomber::input
