/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/PathFinder.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>
#include <stdexcept>
#include <string>

namespace Nightfall {

namespace {
constexpr float COST_STRAIGHT = 1.0f;
constexpr float COST_DIAGONAL = 1.41421356f;

struct OpenNode {
    int index;
    float f;
    uint64_t seq;
};

// Min-heap on f, earlier insertion first on equal f
struct OpenNodeCmp {
    bool operator()(const OpenNode& a, const OpenNode& b) const {
        if (a.f != b.f) return a.f > b.f;
        return a.seq > b.seq;
    }
};

float heuristic(int x, int y, const GridCell& goal) {
    return std::hypot(static_cast<float>(goal.x - x), static_cast<float>(goal.y - y));
}
} // namespace

PathFinder::PathFinder(const NavGrid& grid, int maxExpansions)
    : m_grid(grid), m_maxExpansions(maxExpansions) {
    if (maxExpansions <= 0) {
        throw std::invalid_argument("PathFinder expansion budget must be positive: " +
                                    std::to_string(maxExpansions));
    }
}

PathfindingResult PathFinder::findPath(const GridCell& start, const GridCell& goal,
                                       std::vector<GridCell>& outPath) {
    outPath.clear();
    m_stats.totalRequests++;

    if (!m_grid.inBounds(start)) {
        PATHFIND_DEBUG("findPath: INVALID_START - cell " + std::to_string(start.x) + "," +
                       std::to_string(start.y) + " out of bounds");
        m_stats.invalidStarts++;
        return PathfindingResult::INVALID_START;
    }
    if (!m_grid.inBounds(goal)) {
        PATHFIND_DEBUG("findPath: INVALID_GOAL - cell " + std::to_string(goal.x) + "," +
                       std::to_string(goal.y) + " out of bounds");
        m_stats.invalidGoals++;
        return PathfindingResult::INVALID_GOAL;
    }

    // Already there
    if (start == goal) {
        outPath.push_back(start);
        m_stats.successfulPaths++;
        return PathfindingResult::SUCCESS;
    }

    if (m_grid.isBlocked(start)) {
        m_stats.invalidStarts++;
        return PathfindingResult::INVALID_START;
    }
    if (m_grid.isBlocked(goal)) {
        m_stats.invalidGoals++;
        return PathfindingResult::INVALID_GOAL;
    }

    const int W = m_grid.getCols();
    const int H = m_grid.getRows();
    const size_t cellCount = static_cast<size_t>(W) * static_cast<size_t>(H);
    auto idx = [W](int x, int y) { return y * W + x; };

    m_gScore.assign(cellCount, std::numeric_limits<float>::infinity());
    m_parent.assign(cellCount, -1);
    m_closed.assign(cellCount, 0);

    std::priority_queue<OpenNode, std::vector<OpenNode>, OpenNodeCmp> open;
    uint64_t seq = 0;

    const int startIndex = idx(start.x, start.y);
    const int goalIndex = idx(goal.x, goal.y);
    m_gScore[static_cast<size_t>(startIndex)] = 0.0f;
    open.push(OpenNode{startIndex, heuristic(start.x, start.y, goal), seq++});

    constexpr int dx8[8] = {1, -1, 0, 0, 1, 1, -1, -1};
    constexpr int dy8[8] = {0, 0, 1, -1, 1, -1, 1, -1};

    int expansions = 0;
    while (!open.empty()) {
        OpenNode cur = open.top();
        open.pop();

        const size_t cIndex = static_cast<size_t>(cur.index);
        if (m_closed[cIndex]) continue; // stale entry
        m_closed[cIndex] = 1;

        if (++expansions > m_maxExpansions) {
            m_stats.timeouts++;
            m_stats.totalExpansions += static_cast<uint64_t>(m_maxExpansions);
            PATHFIND_DEBUG("findPath: TIMEOUT after " + std::to_string(m_maxExpansions) +
                           " expansions");
            return PathfindingResult::TIMEOUT;
        }

        if (cur.index == goalIndex) {
            for (int p = cur.index; p >= 0; p = m_parent[static_cast<size_t>(p)]) {
                outPath.push_back(GridCell{p % W, p / W});
            }
            std::reverse(outPath.begin(), outPath.end());
            m_stats.successfulPaths++;
            m_stats.totalExpansions += static_cast<uint64_t>(expansions);
            return PathfindingResult::SUCCESS;
        }

        const int cx = cur.index % W;
        const int cy = cur.index / W;
        const float g = m_gScore[cIndex];

        for (int i = 0; i < 8; ++i) {
            const int nx = cx + dx8[i];
            const int ny = cy + dy8[i];
            if (nx < 0 || ny < 0 || nx >= W || ny >= H) continue;
            if (m_grid.isBlocked(GridCell{nx, ny})) continue;

            const size_t nIndex = static_cast<size_t>(idx(nx, ny));
            if (m_closed[nIndex]) continue;

            const float step = (i < 4) ? COST_STRAIGHT : COST_DIAGONAL;
            const float tentative = g + step;
            if (tentative < m_gScore[nIndex]) {
                m_gScore[nIndex] = tentative;
                m_parent[nIndex] = cur.index;
                open.push(OpenNode{static_cast<int>(nIndex), tentative + heuristic(nx, ny, goal),
                                   seq++});
            }
        }
    }

    m_stats.noPathFound++;
    m_stats.totalExpansions += static_cast<uint64_t>(expansions);
    return PathfindingResult::NO_PATH_FOUND;
}

float PathFinder::pathCost(const std::vector<GridCell>& path) {
    float cost = 0.0f;
    for (size_t i = 1; i < path.size(); ++i) {
        const bool diagonal = path[i].x != path[i - 1].x && path[i].y != path[i - 1].y;
        cost += diagonal ? COST_DIAGONAL : COST_STRAIGHT;
    }
    return cost;
}

} // namespace Nightfall
