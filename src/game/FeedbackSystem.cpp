#include "bomber/game/FeedbackSystem.h"

#include "bomber/game/Seed.h"

#include <algorithm>

namespace bomber::game {

namespace {
constexpr float kStartMessageSeconds = 3.0F;
constexpr float kMessageSeconds = 2.0F;
constexpr float kNumberLifetime = 1.0F;
constexpr float kNumberRiseSpeed = 24.0F; // px/s
constexpr float kMessageFadeSeconds = 0.4F;
} // namespace

const std::vector<std::string>& Phrases(PhraseCategory category) {
    static const std::vector<std::string> start{
        "WELCOME TO THE FRONT, PILOT!",
        "TODAY IS YOUR TURN TO BE A HERO... OR A STATISTIC.",
        "REMEMBER: EVERY BOMB HAS AN ADDRESS.",
    };
    static const std::vector<std::string> hit{
        "BOOM! ANOTHER CLEAN STRIKE!",
        "DIRECT HIT! THEY MOVED TO A BETTER PLACE... OR JUST ANOTHER ONE.",
        "ON TARGET! BEAUTIFUL, LIKE DEATH.",
        "ANOTHER ONE! THE TROPHY SHELF GROWS.",
        "NICE! THEY WON'T BE COMPLAINING ANYMORE.",
    };
    static const std::vector<std::string> miss{
        "ALMOST... TRY AGAIN, MAYBE YOU'LL GET LUCKY.",
        "JUST MISSED. NEXT TIME WILL BE BETTER... OR WORSE.",
        "TRY AGAIN. PRACTICE MAKES A MASTER... OR A CORPSE.",
    };
    static const std::vector<std::string> upgrade{
        "UPGRADE BOUGHT! NOW YOU'RE DEADLIER.",
        "UPGRADE ACTIVE! THE ENEMY IS TERRIFIED... IF STILL ALIVE.",
        "NEW GEAR! NOW YOU CAN DO IT MORE EFFICIENTLY.",
    };
    static const std::vector<std::string> combo{
        "COMBO! THEY'RE DROPPING LIKE FLIES!",
        "GREAT STRIKE! THE COLLECTION GROWS!",
        "MULTIKILL! MASTER OF DESTRUCTION!",
    };
    switch (category) {
    case PhraseCategory::Start: return start;
    case PhraseCategory::Hit: return hit;
    case PhraseCategory::Miss: return miss;
    case PhraseCategory::Upgrade: return upgrade;
    case PhraseCategory::Combo:
    default: return combo;
    }
}

FeedbackSystem::FeedbackSystem(std::uint32_t seed) : rng_{ResolveSeed(seed)} {}

void FeedbackSystem::onSessionStart() {
    showPhrase(PhraseCategory::Start, kStartMessageSeconds);
}

void FeedbackSystem::onEvents(const std::vector<GameEvent>& events) {
    bool exploded = false;
    bool killed = false;
    for (const auto& event : events) {
        switch (event.type) {
        case GameEventType::Explosion:
            exploded = true;
            break;
        case GameEventType::TargetDestroyed:
            killed = true;
            addFloatingNumber(event.position, event.points);
            break;
        case GameEventType::Hit:
            showPhrase(PhraseCategory::Hit, kMessageSeconds);
            break;
        case GameEventType::Combo:
            showPhrase(PhraseCategory::Combo, kMessageSeconds);
            break;
        default:
            break;
        }
    }
    // Bombs landed this tick but nothing was destroyed.
    if (exploded && !killed) {
        showPhrase(PhraseCategory::Miss, kMessageSeconds);
    }
}

void FeedbackSystem::onUpgradeApplied() {
    showPhrase(PhraseCategory::Upgrade, kMessageSeconds);
}

void FeedbackSystem::update(float dt) {
    if (messageTimer_ > 0.0F) {
        messageTimer_ = std::max(0.0F, messageTimer_ - dt);
        if (messageTimer_ <= 0.0F) {
            message_.clear();
        }
    }
    for (auto& entry : numbers_) {
        entry.timer += dt;
        entry.position.y -= dt * kNumberRiseSpeed;
    }
    numbers_.erase(std::remove_if(numbers_.begin(),
                                  numbers_.end(),
                                  [](const FloatingNumber& entry) { return entry.timer >= entry.lifetime; }),
                   numbers_.end());
}

void FeedbackSystem::reset() {
    message_.clear();
    messageTimer_ = 0.0F;
    numbers_.clear();
}

void FeedbackSystem::fillHud(rendering::HudState& hud) const {
    hud.message = message_;
    hud.messageAlpha = message_.empty() ? 0.0F : std::clamp(messageTimer_ / kMessageFadeSeconds, 0.0F, 1.0F);
    hud.floatingNumbers.clear();
    hud.floatingNumbers.reserve(numbers_.size());
    for (const auto& entry : numbers_) {
        rendering::FloatingNumberHud hudEntry{};
        hudEntry.x = entry.position.x;
        hudEntry.y = entry.position.y;
        hudEntry.amount = entry.amount;
        hudEntry.alpha = std::clamp(1.0F - entry.timer / entry.lifetime, 0.0F, 1.0F);
        hud.floatingNumbers.push_back(hudEntry);
    }
}

void FeedbackSystem::showPhrase(PhraseCategory category, float duration) {
    const auto& lines = Phrases(category);
    if (lines.empty()) {
        return;
    }
    std::uniform_int_distribution<std::size_t> pick(0, lines.size() - 1);
    message_ = lines[pick(rng_)];
    messageTimer_ = duration;
}

void FeedbackSystem::addFloatingNumber(const entities::Vec2& position, int amount) {
    if (amount <= 0) {
        return;
    }
    FloatingNumber entry{};
    entry.position = position;
    entry.amount = amount;
    entry.timer = 0.0F;
    entry.lifetime = kNumberLifetime;
    numbers_.push_back(entry);
}

} // namespace bomber::game
