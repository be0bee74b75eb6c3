/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/RoundManager.hpp"
#include "ai/internal/Crowd.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace Nightfall {

namespace {
const NavConfig& validated(const NavConfig& config) {
    config.validate();
    return config;
}
} // namespace

RoundManager::RoundManager(const NavConfig& config)
    : m_config(validated(config)), m_dayNight(m_config.dayNight) {}

void RoundManager::startRound(const RoundSetup& setup) {
    setup.validate();

    // Steering and path finder hold references into the grid
    m_steering.reset();
    m_pathFinder.reset();
    m_grid.reset();

    m_worldWidth = setup.worldWidth;
    m_worldHeight = setup.worldHeight;
    m_playerShape = setup.playerShape;
    m_obstacles = setup.obstacles;

    std::vector<AABB> footprints;
    footprints.reserve(m_obstacles.size());
    for (const auto& obstacle : m_obstacles) {
        footprints.push_back(obstacle.bounds);
    }

    m_grid = std::make_unique<NavGrid>(NavGrid::build(m_worldWidth, m_worldHeight,
                                                      m_config.grid.cellSize, footprints,
                                                      m_config.grid.expandCells));
    m_pathFinder = std::make_unique<PathFinder>(*m_grid, m_config.pathfinder.maxExpansions);
    m_steering = std::make_unique<AgentSteering>(m_config.steering, m_config.timing, *m_grid,
                                                 *m_pathFinder, m_worldWidth, m_worldHeight);

    m_agents.clear();
    m_agents.reserve(setup.enemies.size());
    AgentID nextId = 1;
    for (const auto& spawn : setup.enemies) {
        m_agents.emplace_back(nextId++, spawn.position, spawn.shape);
    }

    m_dayNight.reset();

    ROUND_INFO("Round started: " + std::to_string(m_agents.size()) + " agents, " +
               std::to_string(m_obstacles.size()) + " obstacles, grid " +
               std::to_string(m_grid->getCols()) + "x" + std::to_string(m_grid->getRows()) +
               " with " + std::to_string(m_grid->blockedCount()) + " blocked cells");
}

RoundEvents RoundManager::update(float dt, float now, const Vector2D& playerPos) {
    return update(dt, now, playerPos, m_playerShape);
}

RoundEvents RoundManager::update(float dt, float now, const Vector2D& playerPos,
                                 const CollisionShape& playerShape) {
    RoundEvents out;
    if (!isRoundActive()) {
        ROUND_WARN("update() called before startRound()");
        return out;
    }

    m_dayNight.update(dt, out.signals);
    for (DayNightSignal signal : out.signals) {
        applySignal(signal);
    }

    flagDespawns(now, out);

    const auto snapshot = AIInternal::TakeNeighbourSnapshot(m_agents);
    for (auto& agent : m_agents) {
        if (agent.isPendingRemoval()) continue;
        m_steering->update(agent, dt, now, playerPos, snapshot, m_obstacles);
    }

    resolvePlayerContact(now, playerPos, playerShape, out);
    compactAgents();

    if (roundCleared() && out.count(RoundEventType::Despawn) > 0) {
        ROUND_INFO("Round cleared at t=" + std::to_string(now));
    }
    return out;
}

void RoundManager::applySignal(DayNightSignal signal) {
    size_t changed = 0;
    for (auto& agent : m_agents) {
        if (agent.applySignal(signal)) ++changed;
    }
    ROUND_DEBUG(std::string("Signal ") + signalName(signal) + " changed " +
                std::to_string(changed) + " agents");
}

const NavGrid& RoundManager::getGrid() const {
    if (!m_grid) {
        throw std::logic_error("RoundManager::getGrid() called before startRound()");
    }
    return *m_grid;
}

const PathFinder::PathfindingStats& RoundManager::getPathStats() const {
    if (!m_pathFinder) {
        throw std::logic_error("RoundManager::getPathStats() called before startRound()");
    }
    return m_pathFinder->getStats();
}

void RoundManager::flagDespawns(float now, RoundEvents& out) {
    for (auto& agent : m_agents) {
        if (agent.isPendingRemoval() || !agent.despawnDue(now, m_config.timing.despawnDelay)) {
            continue;
        }
        agent.markForRemoval();
        out.events.push_back(RoundEvent{RoundEventType::Despawn, agent.getID(),
                                        agent.getPosition(), now});
        ROUND_INFO("Agent " + std::to_string(agent.getID()) + " despawned");
    }
}

void RoundManager::resolvePlayerContact(float now, const Vector2D& playerPos,
                                        const CollisionShape& playerShape, RoundEvents& out) {
    for (auto& agent : m_agents) {
        if (agent.isHit() || agent.isPendingRemoval()) continue;
        if (!agent.getShape().overlaps(agent.getPosition(), playerShape, playerPos)) continue;

        if (agent.markCaught(now)) {
            out.events.push_back(RoundEvent{RoundEventType::Catch, agent.getID(),
                                            agent.getPosition(), now});
            ROUND_INFO("Agent " + std::to_string(agent.getID()) + " caught");
        } else {
            agent.setVelocity(agent.getVelocity() * m_config.steering.contactRebound);
            out.events.push_back(RoundEvent{RoundEventType::Contact, agent.getID(),
                                            agent.getPosition(), now});
        }
        // One player contact per tick
        break;
    }
}

void RoundManager::compactAgents() {
    m_agents.erase(std::remove_if(m_agents.begin(), m_agents.end(),
                                  [](const Agent& a) { return a.isPendingRemoval(); }),
                   m_agents.end());
}

} // namespace Nightfall
