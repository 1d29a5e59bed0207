#pragma once

#include <memory>

namespace bomber::input {

struct InputState {
    float moveX{0.0F};
    float moveY{0.0F};
    bool drop{false};
    bool toggleUpgrades{false};
    int upgradeSelection{-1};
    bool back{false};
};

class IInputSystem {
public:
    virtual ~IInputSystem() = default;
    virtual void initialize() = 0;
    virtual void poll() = 0;
    virtual bool shouldQuit() const = 0;
    virtual const InputState& state() const = 0;
    virtual void shutdown() = 0;
};

std::unique_ptr<IInputSystem> CreateSdlInputSystem();

} // namespace bomber::input
