#pragma once

#include "bomber/entities/Vec2.h"

namespace bomber::world {

// Axis-aligned rectangle in screen pixels. y grows downwards.
struct Playfield {
    float left{0.0F};
    float top{0.0F};
    float right{0.0F};
    float bottom{0.0F};

    static Playfield FromSize(float width, float height) { return Playfield{0.0F, 0.0F, width, height}; }

    float width() const { return right - left; }
    float height() const { return bottom - top; }
    entities::Vec2 center() const { return {(left + right) * 0.5F, (top + bottom) * 0.5F}; }

    Playfield inset(float margin) const { return Playfield{left + margin, top + margin, right - margin, bottom - margin}; }

    entities::Vec2 clampPoint(const entities::Vec2& p) const {
        return {entities::Clamp(p.x, left, right), entities::Clamp(p.y, top, bottom)};
    }

    bool contains(const entities::Vec2& p) const { return p.x >= left && p.x <= right && p.y >= top && p.y <= bottom; }
};

} // namespace bomber::world
