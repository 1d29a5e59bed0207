#pragma once

#include "bomber/entities/Vec2.h"
#include "bomber/game/GameEvent.h"
#include "bomber/rendering/HudState.h"

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace bomber::game {

enum class PhraseCategory : std::uint8_t {
    Start,
    Hit,
    Miss,
    Upgrade,
    Combo
};

const std::vector<std::string>& Phrases(PhraseCategory category);

// Turns simulation events into on-screen text: one flavour line at a time and
// a rising "+points" number per destroyed target.
class FeedbackSystem {
public:
    // A zero seed draws one from the clock, as TargetSpawner does.
    explicit FeedbackSystem(std::uint32_t seed = 0);

    void onSessionStart();
    void onEvents(const std::vector<GameEvent>& events);
    void onUpgradeApplied();
    void update(float dt);
    void reset();
    void fillHud(rendering::HudState& hud) const;

    const std::string& message() const { return message_; }
    float messageTimer() const { return messageTimer_; }
    std::size_t floatingNumberCount() const { return numbers_.size(); }

private:
    struct FloatingNumber {
        entities::Vec2 position{};
        int amount{0};
        float timer{0.0F};
        float lifetime{1.0F};
    };

    void showPhrase(PhraseCategory category, float duration);
    void addFloatingNumber(const entities::Vec2& position, int amount);

    std::mt19937 rng_{};
    std::string message_{};
    float messageTimer_{0.0F};
    std::vector<FloatingNumber> numbers_{};
};

} // namespace bomber::game
