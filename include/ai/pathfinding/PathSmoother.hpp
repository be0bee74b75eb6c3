/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_SMOOTHER_HPP
#define PATH_SMOOTHER_HPP

#include <vector>
#include "ai/pathfinding/NavGrid.hpp"
#include "utils/Vector2D.hpp"

namespace Nightfall {

struct PathSmoother {
    // Interior points whose turn is flatter than this are dropped
    static constexpr float COLLINEAR_DOT = 0.999f;

    // Keeps endpoints and direction changes, judged against immediate neighbours
    static std::vector<Vector2D> simplify(const std::vector<Vector2D>& points) {
        std::vector<Vector2D> out;
        out.reserve(points.size());
        for (size_t i = 0; i < points.size(); ++i) {
            if (i == 0 || i + 1 == points.size()) {
                out.push_back(points[i]);
                continue;
            }
            Vector2D in = points[i] - points[i - 1];
            Vector2D next = points[i + 1] - points[i];
            // Repeated points are kept rather than normalized
            if (in.lengthSquared() == 0.0f || next.lengthSquared() == 0.0f) {
                out.push_back(points[i]);
                continue;
            }
            if (in.normalized().dot(next.normalized()) < COLLINEAR_DOT) {
                out.push_back(points[i]);
            }
        }
        return out;
    }

    // Cells to world-space cell centers, then simplify
    static std::vector<Vector2D> simplify(const std::vector<GridCell>& cells, float cellSize) {
        std::vector<Vector2D> points;
        points.reserve(cells.size());
        for (const auto& c : cells) {
            points.push_back(NavGrid::centerOf(c, cellSize));
        }
        return simplify(points);
    }
};

} // namespace Nightfall

#endif // PATH_SMOOTHER_HPP
