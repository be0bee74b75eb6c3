/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/AgentSteering.hpp"
#include "ai/BehaviorMode.hpp"
#include "ai/pathfinding/PathSmoother.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <string>

namespace Nightfall {

AgentSteering::AgentSteering(const SteeringConfig& steering, const BehaviorTimingConfig& timing,
                             const NavGrid& grid, PathFinder& pathFinder,
                             float worldWidth, float worldHeight)
    : m_config(steering), m_timing(timing), m_grid(grid), m_pathFinder(pathFinder),
      m_worldWidth(worldWidth), m_worldHeight(worldHeight) {
    const float cell = m_grid.getCellSize();
    m_waypointRadius = std::max(m_config.waypointRadiusMin, cell * m_config.waypointRadiusCellFactor);
    m_avoidRadius = std::max(cell * m_config.avoidRadiusCellFactor, m_config.avoidRadiusMin);
}

void AgentSteering::update(Agent& agent, float dt, float now, const Vector2D& playerPos,
                           const std::vector<AIInternal::NeighbourSnapshot>& neighbours,
                           const std::vector<Obstacle>& obstacles) {
    if (agent.isHit() || agent.getMode() == BehaviorMode::HALT || dt <= 0.0f) {
        return;
    }

    requestPath(agent, playerPos, now);

    Vector2D desired = desiredVelocity(agent, playerPos);
    Vector2D separation = AIInternal::SeparationForce(agent, neighbours, m_config.separationRadius,
                                                      m_config.separationForce, dt);
    Vector2D avoidance = AIInternal::ObstacleAvoidance(agent, obstacles, m_avoidRadius,
                                                       m_config.avoidForce, dt);

    integrate(agent, desired, separation, avoidance, dt);
    resolveCollisions(agent, obstacles, dt);
    agent.updateFacing();
}

bool AgentSteering::requestPath(Agent& agent, const Vector2D& playerPos, float now) {
    if (agent.isHit() || agent.getMode() == BehaviorMode::HALT) {
        return false;
    }
    if ((now - agent.getLastRecalc()) < m_timing.recalcInterval) {
        return false;
    }
    agent.setLastRecalc(now);

    const GridCell start = m_grid.clampCell(m_grid.cellOf(agent.getPosition()));
    const GridCell playerCell = m_grid.clampCell(m_grid.cellOf(playerPos));

    std::optional<GridCell> goal = selectGoal(agent.getMode(), start, playerCell, m_grid);
    if (!goal) {
        agent.clearPath();
        return true;
    }

    PathfindingResult result = m_pathFinder.findPath(start, *goal, m_cellBuffer);
    if (result == PathfindingResult::SUCCESS) {
        agent.setPath(PathSmoother::simplify(m_cellBuffer, m_grid.getCellSize()));
    } else {
        agent.clearPath();
        STEERING_DEBUG("Agent " + std::to_string(agent.getID()) + " path request failed");
    }
    return true;
}

Vector2D AgentSteering::desiredVelocity(Agent& agent, const Vector2D& playerPos) const {
    const Vector2D& pos = agent.getPosition();

    if (agent.hasActiveWaypoint() &&
        Vector2D::distance(pos, agent.currentWaypoint()) < m_waypointRadius) {
        agent.advanceCursor();
    }

    Vector2D direction(0.0f, 0.0f);
    if (agent.hasActiveWaypoint()) {
        direction = agent.currentWaypoint() - pos;
    } else if (agent.getMode() == BehaviorMode::CHASE) {
        direction = playerPos - pos;
    } else if (agent.getMode() == BehaviorMode::FLEE) {
        direction = pos - playerPos;
    }

    // Zero direction (standing on the target) asks for a stop
    return direction.normalized() * m_config.maxSpeed;
}

void AgentSteering::integrate(Agent& agent, const Vector2D& desired, const Vector2D& separation,
                              const Vector2D& avoidance, float dt) const {
    Vector2D steer = (desired - agent.getVelocity()) + separation + avoidance;
    steer = steer.clampedToLength(m_config.acceleration * dt);

    Vector2D velocity = agent.getVelocity() + steer;
    agent.setVelocity(velocity.clampedToLength(m_config.maxSpeed));
}

bool AgentSteering::resolveCollisions(Agent& agent, const std::vector<Obstacle>& obstacles, float dt) {
    const Vector2D& pos = agent.getPosition();
    Vector2D velocity = agent.getVelocity();
    Vector2D tentative = pos + velocity * dt;

    // World rectangle: clamp and drop the outward component
    Vector2D clamped = clampToWorld(tentative);
    if (clamped.getX() != tentative.getX()) velocity.setX(0.0f);
    if (clamped.getY() != tentative.getY()) velocity.setY(0.0f);
    agent.setVelocity(velocity);
    tentative = clamped;

    for (const auto& obstacle : obstacles) {
        if (!agent.getShape().boundsAt(tentative).intersects(obstacle.bounds)) continue;
        if (!agent.getShape().overlaps(tentative, obstacle.shape, obstacle.getCenter())) continue;

        Vector2D push = pos - obstacle.getCenter();
        if (push.lengthSquared() == 0.0f) {
            push = agent.randomUnitVector();
        }
        Vector2D pushed = clampToWorld(pos + push.normalized() * (m_grid.getCellSize() *
                                                                  m_config.collisionPushCellFactor));
        // Already overlapping (spawned inside): always step out, otherwise only onto clear ground
        if (overlapsAnyObstacle(agent, pos, obstacles) || !overlapsAnyObstacle(agent, pushed, obstacles)) {
            agent.setPosition(pushed);
        }
        agent.setVelocity(agent.getVelocity() * m_config.collisionDamping);
        agent.clearPath();
        return true;
    }

    agent.setPosition(tentative);
    return false;
}

bool AgentSteering::overlapsAnyObstacle(const Agent& agent, const Vector2D& position,
                                        const std::vector<Obstacle>& obstacles) const {
    const AABB bounds = agent.getShape().boundsAt(position);
    for (const auto& obstacle : obstacles) {
        if (bounds.intersects(obstacle.bounds) &&
            agent.getShape().overlaps(position, obstacle.shape, obstacle.getCenter())) {
            return true;
        }
    }
    return false;
}

Vector2D AgentSteering::clampToWorld(const Vector2D& p) const {
    return Vector2D(std::clamp(p.getX(), 0.0f, m_worldWidth),
                    std::clamp(p.getY(), 0.0f, m_worldHeight));
}

} // namespace Nightfall
