#pragma once

#include "bomber/entities/Vec2.h"

namespace bomber::entities {

struct Bomb {
    Vec2 position{};
    float tLeft{0.0F};
    float fallTime{0.0F};
    float radius{0.0F};

    void update(float dt) { tLeft -= dt; }
    bool impacted() const { return tLeft <= 0.0F; }
};

} // namespace bomber::entities
