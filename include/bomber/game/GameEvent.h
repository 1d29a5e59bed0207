#pragma once

#include "bomber/entities/Target.h"
#include "bomber/entities/Vec2.h"

#include <algorithm>
#include <cstdint>
#include <vector>

namespace bomber::game {

enum class GameEventType : std::uint8_t {
    Drop,
    Explosion,
    TargetDestroyed,
    Hit,
    Combo
};

struct GameEvent {
    GameEventType type{GameEventType::Drop};
    entities::Vec2 position{};
    int points{0};
    int count{0};
    entities::TargetKind targetKind{entities::TargetKind::Infantry};
};

struct TickResult {
    std::vector<GameEvent> events{};
    int kills{0};
    int scoreGained{0};
    int spawned{0};

    int countOf(GameEventType type) const {
        return static_cast<int>(std::count_if(
            events.begin(), events.end(), [type](const GameEvent& event) { return event.type == type; }));
    }
};

} // namespace bomber::game
