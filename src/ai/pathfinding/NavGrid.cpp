/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/NavGrid.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace Nightfall {

NavGrid::NavGrid(int cols, int rows, float cellSize)
    : m_cols(cols), m_rows(rows), m_cell(cellSize) {
    m_blocked.assign(static_cast<size_t>(m_cols) * static_cast<size_t>(m_rows), 0);
}

NavGrid NavGrid::build(float worldWidth, float worldHeight, float cellSize,
                       const std::vector<AABB>& obstacles, int expandCells) {
    if (!(worldWidth > 0.0f) || !(worldHeight > 0.0f)) {
        throw std::invalid_argument("NavGrid world size must be positive: " +
                                    std::to_string(worldWidth) + "x" + std::to_string(worldHeight));
    }
    if (!(cellSize > 0.0f)) {
        throw std::invalid_argument("NavGrid cell size must be positive: " +
                                    std::to_string(cellSize));
    }
    if (expandCells < 0) {
        throw std::invalid_argument("NavGrid expansion must be non-negative: " +
                                    std::to_string(expandCells));
    }

    const int cols = static_cast<int>(std::ceil(worldWidth / cellSize));
    const int rows = static_cast<int>(std::ceil(worldHeight / cellSize));
    NavGrid grid(cols, rows, cellSize);

    for (const auto& rect : obstacles) {
        int left = static_cast<int>(std::floor(rect.left() / cellSize));
        int right = static_cast<int>(std::floor(rect.right() / cellSize));
        int top = static_cast<int>(std::floor(rect.top() / cellSize));
        int bottom = static_cast<int>(std::floor(rect.bottom() / cellSize));

        // Clamp the footprint first, then grow it, then clamp again
        left = std::max(0, left);
        top = std::max(0, top);
        right = std::min(cols - 1, right);
        bottom = std::min(rows - 1, bottom);

        const int x0 = std::max(0, left - expandCells);
        const int x1 = std::min(cols - 1, right + expandCells);
        const int y0 = std::max(0, top - expandCells);
        const int y1 = std::min(rows - 1, bottom + expandCells);

        for (int y = y0; y <= y1; ++y) {
            for (int x = x0; x <= x1; ++x) {
                grid.m_blocked[grid.index(x, y)] = 1;
            }
        }
    }

    NAVGRID_DEBUG("Built " + std::to_string(cols) + "x" + std::to_string(rows) +
                  " grid from " + std::to_string(obstacles.size()) + " obstacles, " +
                  std::to_string(grid.blockedCount()) + " cells blocked");
    return grid;
}

GridCell NavGrid::cellOf(const Vector2D& worldPos, float cellSize) {
    return GridCell{static_cast<int>(std::floor(worldPos.getX() / cellSize)),
                    static_cast<int>(std::floor(worldPos.getY() / cellSize))};
}

Vector2D NavGrid::centerOf(const GridCell& cell, float cellSize) {
    return Vector2D((static_cast<float>(cell.x) + 0.5f) * cellSize,
                    (static_cast<float>(cell.y) + 0.5f) * cellSize);
}

GridCell NavGrid::clampCell(const GridCell& cell) const {
    return GridCell{std::clamp(cell.x, 0, m_cols - 1), std::clamp(cell.y, 0, m_rows - 1)};
}

bool NavGrid::inBounds(const GridCell& cell) const {
    return cell.x >= 0 && cell.y >= 0 && cell.x < m_cols && cell.y < m_rows;
}

bool NavGrid::isBlocked(const GridCell& cell) const {
    if (!inBounds(cell)) return true;
    return m_blocked[index(cell.x, cell.y)] != 0;
}

size_t NavGrid::blockedCount() const {
    return static_cast<size_t>(std::count(m_blocked.begin(), m_blocked.end(), uint8_t{1}));
}

} // namespace Nightfall
