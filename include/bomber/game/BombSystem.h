#pragma once

#include "bomber/entities/Bomb.h"
#include "bomber/entities/Target.h"
#include "bomber/game/GameEvent.h"
#include "bomber/game/SimulationState.h"

#include <vector>

namespace bomber::game {

// Inclusive: a bomb whose blast edge just touches the target's edge still hits.
inline bool BombHitsTarget(const entities::Bomb& bomb, const entities::Target& target) {
    return entities::Distance(bomb.position, target.position) <= bomb.radius + target.radius;
}

class BombSystem {
public:
    struct ImpactReport {
        int bombsImpacted{0};
        int kills{0};
        int pointsGained{0};
    };

    explicit BombSystem(SimulationState& state);

    bool drop(std::vector<GameEvent>& events);
    void update(float dt);
    ImpactReport resolveImpacts(std::vector<GameEvent>& events);
    void reset();

private:
    std::vector<entities::Bomb> takeImpactedBombs();

    SimulationState& state_;
};

} // namespace bomber::game
