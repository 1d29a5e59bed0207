#include "bomber/entities/Target.h"

namespace bomber::entities {

void Target::update(float dt, const world::Playfield& bounds) {
    position.x += velocity.x * dt;
    position.y += velocity.y * dt;

    // Each edge is checked on its own so a corner hit flips both axes.
    if (position.x - radius < bounds.left) {
        position.x = bounds.left + radius;
        velocity.x = -velocity.x;
    }
    if (position.x + radius > bounds.right) {
        position.x = bounds.right - radius;
        velocity.x = -velocity.x;
    }
    if (position.y - radius < bounds.top) {
        position.y = bounds.top + radius;
        velocity.y = -velocity.y;
    }
    if (position.y + radius > bounds.bottom) {
        position.y = bounds.bottom - radius;
        velocity.y = -velocity.y;
    }
}

} // namespace bomber::entities
