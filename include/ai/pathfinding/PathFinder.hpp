/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_FINDER_HPP
#define PATH_FINDER_HPP

#include <cstdint>
#include <ostream>
#include <vector>
#include "ai/pathfinding/NavGrid.hpp"

namespace Nightfall {

enum class PathfindingResult { SUCCESS, NO_PATH_FOUND, INVALID_START, INVALID_GOAL, TIMEOUT };

// Stream operator for PathfindingResult to support test output
inline std::ostream& operator<<(std::ostream& os, const PathfindingResult& result) {
    switch (result) {
        case PathfindingResult::SUCCESS: return os << "SUCCESS";
        case PathfindingResult::NO_PATH_FOUND: return os << "NO_PATH_FOUND";
        case PathfindingResult::INVALID_START: return os << "INVALID_START";
        case PathfindingResult::INVALID_GOAL: return os << "INVALID_GOAL";
        case PathfindingResult::TIMEOUT: return os << "TIMEOUT";
        default: return os << "UNKNOWN";
    }
}

/**
 * 8-connected A* over a NavGrid.
 *
 * Cardinal steps cost 1, diagonal steps sqrt(2), heuristic is Euclidean
 * distance in cells. Diagonals between free cells are allowed even when both
 * orthogonal neighbours are blocked. Open-set ties resolve by insertion order,
 * so results are deterministic for a given grid.
 */
class PathFinder {
public:
    static constexpr int DEFAULT_MAX_EXPANSIONS = 25000;

    explicit PathFinder(const NavGrid& grid, int maxExpansions = DEFAULT_MAX_EXPANSIONS);

    /**
     * @brief Search from start to goal
     * @param outPath cleared, then filled start..goal on SUCCESS only
     * @return INVALID_START / INVALID_GOAL for out-of-bounds or blocked
     *         endpoints (no search runs), TIMEOUT once more than maxExpansions
     *         nodes were expanded, NO_PATH_FOUND when the open set empties
     */
    PathfindingResult findPath(const GridCell& start, const GridCell& goal,
                               std::vector<GridCell>& outPath);

    // Sum of step costs along a cell path (1 or sqrt(2) per step)
    static float pathCost(const std::vector<GridCell>& path);

    const NavGrid& getGrid() const { return m_grid; }
    int getMaxExpansions() const { return m_maxExpansions; }

    // Statistics
    struct PathfindingStats {
        uint64_t totalRequests{0};
        uint64_t successfulPaths{0};
        uint64_t noPathFound{0};
        uint64_t timeouts{0};
        uint64_t invalidStarts{0};
        uint64_t invalidGoals{0};
        uint64_t totalExpansions{0};
    };

    void resetStats() { m_stats = PathfindingStats{}; }
    const PathfindingStats& getStats() const { return m_stats; }

private:
    const NavGrid& m_grid;
    int m_maxExpansions;
    PathfindingStats m_stats{};

    // Search buffers reused between requests
    std::vector<float> m_gScore;
    std::vector<int> m_parent;
    std::vector<uint8_t> m_closed;
};

} // namespace Nightfall

#endif // PATH_FINDER_HPP
