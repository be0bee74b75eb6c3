/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_SHAPE_HPP
#define COLLISION_SHAPE_HPP

#include "collisions/AABB.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>
#include <ostream>
#include <vector>

namespace Nightfall {

enum class ShapeKind : uint8_t {
    BOX,     // Solid rectangle (half extents)
    CIRCLE,  // Solid disc
    MASK     // Per-pixel bitmask, centered on the owner's position
};

inline std::ostream& operator<<(std::ostream& os, ShapeKind kind) {
    switch (kind) {
        case ShapeKind::BOX: return os << "BOX";
        case ShapeKind::CIRCLE: return os << "CIRCLE";
        case ShapeKind::MASK: return os << "MASK";
        default: return os << "UNKNOWN";
    }
}

/**
 * Precise collision shape used after the AABB broad phase.
 *
 * Shapes are position-free; every query takes the world center the shape is
 * placed at. Overlap is strict: touching edges do not count.
 */
class CollisionShape {
public:
    CollisionShape() = default;

    static CollisionShape box(float halfWidth, float halfHeight);
    static CollisionShape circle(float radius);

    /**
     * @brief Bitmask shape, row-major, one byte per pixel (non-zero = solid)
     * @throws std::invalid_argument if the dimensions do not match the data
     */
    static CollisionShape mask(int width, int height, std::vector<uint8_t> pixels);

    ShapeKind getKind() const { return m_kind; }

    // Broad-phase bounds of the shape placed at center
    AABB boundsAt(const Vector2D& center) const;

    bool containsPoint(const Vector2D& center, const Vector2D& point) const;

    bool overlaps(const Vector2D& center, const CollisionShape& other,
                  const Vector2D& otherCenter) const;

    int getMaskWidth() const { return m_maskW; }
    int getMaskHeight() const { return m_maskH; }

private:
    ShapeKind m_kind{ShapeKind::BOX};
    Vector2D m_halfSize{0.0f, 0.0f};
    float m_radius{0.0f};
    int m_maskW{0};
    int m_maskH{0};
    std::vector<uint8_t> m_pixels;

    bool pixelSet(int px, int py) const;
    bool maskOverlaps(const Vector2D& center, const CollisionShape& other,
                      const Vector2D& otherCenter) const;
};

} // namespace Nightfall

#endif // COLLISION_SHAPE_HPP
