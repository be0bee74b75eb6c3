/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef AGENT_STEERING_HPP
#define AGENT_STEERING_HPP

#include "ai/NavConfig.hpp"
#include "ai/internal/Crowd.hpp"
#include "ai/pathfinding/NavGrid.hpp"
#include "ai/pathfinding/PathFinder.hpp"
#include "entities/Agent.hpp"
#include "utils/Vector2D.hpp"
#include "world/Obstacle.hpp"
#include <vector>

namespace Nightfall {

/**
 * @brief Per-agent velocity controller
 *
 * One tick of an agent: throttled path request, waypoint following (with a
 * direct-vector fallback), separation and obstacle repulsion blended into a
 * bounded acceleration, then hard collision resolution against obstacles
 * and the world rectangle. Halted and caught agents are left untouched.
 */
class AgentSteering {
public:
    AgentSteering(const SteeringConfig& steering, const BehaviorTimingConfig& timing,
                  const NavGrid& grid, PathFinder& pathFinder,
                  float worldWidth, float worldHeight);

    void update(Agent& agent, float dt, float now, const Vector2D& playerPos,
                const std::vector<AIInternal::NeighbourSnapshot>& neighbours,
                const std::vector<Obstacle>& obstacles);

    /**
     * @brief Search a new path if the throttle allows it
     *
     * Agent and player cells are clamped to the grid before the search. Any
     * failure (no goal, no path, invalid endpoint, timeout) clears the path.
     *
     * @return true if the throttle window was consumed
     */
    bool requestPath(Agent& agent, const Vector2D& playerPos, float now);

    // Advances the cursor when the current waypoint is reached
    Vector2D desiredVelocity(Agent& agent, const Vector2D& playerPos) const;

    // Applies the clamped steering and the speed cap to the agent's velocity
    void integrate(Agent& agent, const Vector2D& desired, const Vector2D& separation,
                   const Vector2D& avoidance, float dt) const;

    /**
     * @brief Move to position + velocity * dt unless that overlaps an obstacle
     *
     * On overlap the agent is pushed away from the obstacle center instead
     * (only if the pushed position is itself clear), its velocity is damped
     * and its path dropped.
     *
     * @return true if an obstacle was hit
     */
    bool resolveCollisions(Agent& agent, const std::vector<Obstacle>& obstacles, float dt);

    bool overlapsAnyObstacle(const Agent& agent, const Vector2D& position,
                             const std::vector<Obstacle>& obstacles) const;

    float getWaypointRadius() const { return m_waypointRadius; }
    float getAvoidRadius() const { return m_avoidRadius; }

private:
    const SteeringConfig& m_config;
    const BehaviorTimingConfig& m_timing;
    const NavGrid& m_grid;
    PathFinder& m_pathFinder;
    float m_worldWidth;
    float m_worldHeight;
    float m_waypointRadius;
    float m_avoidRadius;

    std::vector<GridCell> m_cellBuffer; // reused search output

    Vector2D clampToWorld(const Vector2D& p) const;
};

} // namespace Nightfall

#endif // AGENT_STEERING_HPP
