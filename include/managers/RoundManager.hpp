/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ROUND_MANAGER_HPP
#define ROUND_MANAGER_HPP

/**
 * @file RoundManager.hpp
 * @brief Owns one round of the navigation simulation and its frame order
 *
 * Per tick, in order:
 *   1. Day/night clock advances; every signal crossed is applied to all agents
 *   2. Caught agents whose despawn delay elapsed are flagged for removal
 *   3. Neighbour snapshot of all agents is taken
 *   4. Each live, non-halted agent runs AgentSteering::update
 *   5. First agent overlapping the player is caught (FLEE) or bounced (other)
 *   6. Flagged agents are compacted out
 *
 * Ownership: the host owns the manager (not a singleton). startRound()
 * discards the previous grid, path finder, steering and agents and builds
 * them again from the round setup.
 */

#include "ai/AgentSteering.hpp"
#include "ai/NavConfig.hpp"
#include "ai/pathfinding/NavGrid.hpp"
#include "ai/pathfinding/PathFinder.hpp"
#include "collisions/CollisionShape.hpp"
#include "controllers/world/DayNightController.hpp"
#include "entities/Agent.hpp"
#include "events/RoundEvents.hpp"
#include "world/RoundSetup.hpp"
#include <memory>
#include <vector>

namespace Nightfall {

class RoundManager {
public:
    /**
     * @throws std::invalid_argument if the config fails validation
     */
    explicit RoundManager(const NavConfig& config);

    // Steering holds references into the owned config and grid
    RoundManager(const RoundManager&) = delete;
    RoundManager& operator=(const RoundManager&) = delete;
    RoundManager(RoundManager&&) = delete;
    RoundManager& operator=(RoundManager&&) = delete;

    /**
     * @brief Build the grid and agents for a new round
     * @throws std::invalid_argument if the setup fails validation
     */
    void startRound(const RoundSetup& setup);

    /**
     * @brief Advance the round by dt seconds
     * @param now round clock in seconds, used for path throttling and catches
     * @param playerPos player position for this tick
     * @param playerShape player collision shape for this tick
     */
    RoundEvents update(float dt, float now, const Vector2D& playerPos,
                       const CollisionShape& playerShape);

    // Same, with the player shape from the round setup
    RoundEvents update(float dt, float now, const Vector2D& playerPos);

    // Apply a signal from an external clock to every agent
    void applySignal(DayNightSignal signal);

    bool isRoundActive() const { return m_grid != nullptr; }
    // True once every agent of an active round has despawned
    bool roundCleared() const { return isRoundActive() && m_agents.empty(); }

    const std::vector<Agent>& getAgents() const { return m_agents; }
    const std::vector<Obstacle>& getObstacles() const { return m_obstacles; }
    const NavConfig& getConfig() const { return m_config; }
    const DayNightController& getDayNight() const { return m_dayNight; }

    /**
     * @throws std::logic_error before the first startRound()
     */
    const NavGrid& getGrid() const;
    const PathFinder::PathfindingStats& getPathStats() const;

private:
    const NavConfig m_config;
    DayNightController m_dayNight;

    float m_worldWidth{0.0f};
    float m_worldHeight{0.0f};
    CollisionShape m_playerShape;
    std::vector<Obstacle> m_obstacles;
    std::vector<Agent> m_agents;

    std::unique_ptr<NavGrid> m_grid;
    std::unique_ptr<PathFinder> m_pathFinder;
    std::unique_ptr<AgentSteering> m_steering;

    void flagDespawns(float now, RoundEvents& out);
    void resolvePlayerContact(float now, const Vector2D& playerPos,
                              const CollisionShape& playerShape, RoundEvents& out);
    void compactAgents();
};

} // namespace Nightfall

#endif // ROUND_MANAGER_HPP
