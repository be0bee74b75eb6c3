/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionShape.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace Nightfall {

CollisionShape CollisionShape::box(float halfWidth, float halfHeight) {
    if (halfWidth < 0.0f || halfHeight < 0.0f) {
        throw std::invalid_argument("CollisionShape box extents must be non-negative: " +
                                    std::to_string(halfWidth) + "x" + std::to_string(halfHeight));
    }
    CollisionShape shape;
    shape.m_kind = ShapeKind::BOX;
    shape.m_halfSize = Vector2D(halfWidth, halfHeight);
    return shape;
}

CollisionShape CollisionShape::circle(float radius) {
    if (radius < 0.0f) {
        throw std::invalid_argument("CollisionShape circle radius must be non-negative: " +
                                    std::to_string(radius));
    }
    CollisionShape shape;
    shape.m_kind = ShapeKind::CIRCLE;
    shape.m_radius = radius;
    shape.m_halfSize = Vector2D(radius, radius);
    return shape;
}

CollisionShape CollisionShape::mask(int width, int height, std::vector<uint8_t> pixels) {
    if (width <= 0 || height <= 0 ||
        pixels.size() != static_cast<size_t>(width) * static_cast<size_t>(height)) {
        throw std::invalid_argument("CollisionShape mask " + std::to_string(width) + "x" +
                                    std::to_string(height) + " does not match " +
                                    std::to_string(pixels.size()) + " pixels");
    }
    CollisionShape shape;
    shape.m_kind = ShapeKind::MASK;
    shape.m_maskW = width;
    shape.m_maskH = height;
    shape.m_halfSize = Vector2D(width * 0.5f, height * 0.5f);
    shape.m_pixels = std::move(pixels);
    return shape;
}

AABB CollisionShape::boundsAt(const Vector2D& center) const {
    return AABB(center.getX(), center.getY(), m_halfSize.getX(), m_halfSize.getY());
}

bool CollisionShape::pixelSet(int px, int py) const {
    if (px < 0 || py < 0 || px >= m_maskW || py >= m_maskH) return false;
    return m_pixels[static_cast<size_t>(py * m_maskW + px)] != 0;
}

bool CollisionShape::containsPoint(const Vector2D& center, const Vector2D& point) const {
    switch (m_kind) {
        case ShapeKind::BOX: {
            // Half-open so adjacent pixels are never claimed twice
            AABB b = boundsAt(center);
            return point.getX() >= b.left() && point.getX() < b.right() &&
                   point.getY() >= b.top() && point.getY() < b.bottom();
        }
        case ShapeKind::CIRCLE:
            return Vector2D::distanceSquared(center, point) < m_radius * m_radius;
        case ShapeKind::MASK: {
            AABB b = boundsAt(center);
            int px = static_cast<int>(std::floor(point.getX() - b.left()));
            int py = static_cast<int>(std::floor(point.getY() - b.top()));
            return pixelSet(px, py);
        }
    }
    return false;
}

bool CollisionShape::overlaps(const Vector2D& center, const CollisionShape& other,
                              const Vector2D& otherCenter) const {
    if (!boundsAt(center).intersects(other.boundsAt(otherCenter))) {
        return false;
    }

    if (m_kind == ShapeKind::MASK) {
        return maskOverlaps(center, other, otherCenter);
    }
    if (other.m_kind == ShapeKind::MASK) {
        return other.maskOverlaps(otherCenter, *this, center);
    }

    if (m_kind == ShapeKind::BOX && other.m_kind == ShapeKind::BOX) {
        return true; // Bounds are the shapes
    }
    if (m_kind == ShapeKind::CIRCLE && other.m_kind == ShapeKind::CIRCLE) {
        float r = m_radius + other.m_radius;
        return Vector2D::distanceSquared(center, otherCenter) < r * r;
    }

    // Circle vs box: closest point on the box to the circle center
    const bool selfIsCircle = (m_kind == ShapeKind::CIRCLE);
    const Vector2D& circleCenter = selfIsCircle ? center : otherCenter;
    const float radius = selfIsCircle ? m_radius : other.m_radius;
    AABB box = selfIsCircle ? other.boundsAt(otherCenter) : boundsAt(center);
    Vector2D closest = box.closestPoint(circleCenter);
    return Vector2D::distanceSquared(closest, circleCenter) < radius * radius;
}

bool CollisionShape::maskOverlaps(const Vector2D& center, const CollisionShape& other,
                                  const Vector2D& otherCenter) const {
    AABB self = boundsAt(center);
    AABB them = other.boundsAt(otherCenter);

    // Only walk mask pixels inside the shared bounds
    float x0 = std::max(self.left(), them.left());
    float y0 = std::max(self.top(), them.top());
    float x1 = std::min(self.right(), them.right());
    float y1 = std::min(self.bottom(), them.bottom());

    int px0 = std::max(0, static_cast<int>(std::floor(x0 - self.left())));
    int py0 = std::max(0, static_cast<int>(std::floor(y0 - self.top())));
    int px1 = std::min(m_maskW - 1, static_cast<int>(std::ceil(x1 - self.left())));
    int py1 = std::min(m_maskH - 1, static_cast<int>(std::ceil(y1 - self.top())));

    for (int py = py0; py <= py1; ++py) {
        for (int px = px0; px <= px1; ++px) {
            if (!pixelSet(px, py)) continue;
            Vector2D pixelCenter(self.left() + px + 0.5f, self.top() + py + 0.5f);
            if (other.containsPoint(otherCenter, pixelCenter)) {
                return true;
            }
        }
    }
    return false;
}

} // namespace Nightfall
