/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef OBSTACLE_HPP
#define OBSTACLE_HPP

#include "collisions/AABB.hpp"
#include "collisions/CollisionShape.hpp"
#include <utility>

namespace Nightfall {

/**
 * Immovable world obstacle.
 *
 * The bounds rectangle feeds NavGrid rasterization and the broad phase; the
 * shape, placed at the bounds center, is the precise footprint.
 */
struct Obstacle {
    AABB bounds;
    CollisionShape shape;

    Obstacle() = default;
    Obstacle(const AABB& rect, CollisionShape preciseShape)
        : bounds(rect), shape(std::move(preciseShape)) {}

    // Rectangle whose precise shape is the rectangle itself
    static Obstacle solid(const AABB& rect) {
        return Obstacle(rect, CollisionShape::box(rect.halfSize.getX(), rect.halfSize.getY()));
    }

    const Vector2D& getCenter() const { return bounds.center; }
};

} // namespace Nightfall

#endif // OBSTACLE_HPP
