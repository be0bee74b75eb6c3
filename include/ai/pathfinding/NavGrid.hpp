/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NAV_GRID_HPP
#define NAV_GRID_HPP

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>
#include "collisions/AABB.hpp"
#include "utils/Vector2D.hpp"

namespace Nightfall {

struct GridCell {
    int x{0};
    int y{0};

    bool operator==(const GridCell& other) const { return x == other.x && y == other.y; }
    bool operator!=(const GridCell& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const GridCell& c) {
    return os << "(" << c.x << "," << c.y << ")";
}

/**
 * Occupancy grid over the world rectangle, built once per round from
 * obstacle footprints and read-only afterwards.
 */
class NavGrid {
public:
    /**
     * @brief Rasterize obstacle rectangles into blocked cells
     *
     * cols = ceil(worldWidth / cellSize), rows = ceil(worldHeight / cellSize).
     * Each rectangle marks the cells from floor(left/cell) to floor(right/cell)
     * (and likewise vertically), grown by expandCells on every side and
     * clamped to the grid.
     *
     * @throws std::invalid_argument for non-positive sizes or negative expansion
     */
    static NavGrid build(float worldWidth, float worldHeight, float cellSize,
                         const std::vector<AABB>& obstacles, int expandCells);

    // Pure coordinate transforms
    static GridCell cellOf(const Vector2D& worldPos, float cellSize);
    static Vector2D centerOf(const GridCell& cell, float cellSize);

    GridCell cellOf(const Vector2D& worldPos) const { return cellOf(worldPos, m_cell); }
    Vector2D centerOf(const GridCell& cell) const { return centerOf(cell, m_cell); }

    GridCell clampCell(const GridCell& cell) const;
    bool inBounds(const GridCell& cell) const;
    // Out-of-bounds cells count as blocked
    bool isBlocked(const GridCell& cell) const;

    int getCols() const { return m_cols; }
    int getRows() const { return m_rows; }
    float getCellSize() const { return m_cell; }
    size_t blockedCount() const;

private:
    NavGrid(int cols, int rows, float cellSize);

    int m_cols;
    int m_rows;
    float m_cell;
    std::vector<uint8_t> m_blocked; // 0 walkable, 1 blocked

    size_t index(int x, int y) const { return static_cast<size_t>(y) * m_cols + x; }
};

} // namespace Nightfall

#endif // NAV_GRID_HPP
