/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AABB_HPP
#define AABB_HPP

#include "utils/Vector2D.hpp"
#include <algorithm>

namespace Nightfall {

/**
 * Axis-aligned box stored as center and half extents.
 *
 * Obstacle footprints for grid rasterization and the broad phase of every
 * shape test. Edges are exclusive: boxes that only touch do not intersect.
 */
struct AABB {
    Vector2D center;
    Vector2D halfSize;

    AABB() = default;
    AABB(float cx, float cy, float hw, float hh) : center(cx, cy), halfSize(hw, hh) {}

    // Placement data arrives as top-left corner plus size
    static AABB fromRect(float left, float top, float width, float height) {
        return AABB(left + width * 0.5f, top + height * 0.5f, width * 0.5f, height * 0.5f);
    }

    float left() const { return center.getX() - halfSize.getX(); }
    float right() const { return center.getX() + halfSize.getX(); }
    float top() const { return center.getY() - halfSize.getY(); }
    float bottom() const { return center.getY() + halfSize.getY(); }
    float width() const { return 2.0f * halfSize.getX(); }
    float height() const { return 2.0f * halfSize.getY(); }

    bool intersects(const AABB& other) const {
        return left() < other.right() && other.left() < right() &&
               top() < other.bottom() && other.top() < bottom();
    }

    Vector2D closestPoint(const Vector2D& p) const {
        return Vector2D(std::clamp(p.getX(), left(), right()),
                        std::clamp(p.getY(), top(), bottom()));
    }
};

} // namespace Nightfall

#endif // AABB_HPP
