/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef AGENT_HPP
#define AGENT_HPP

#include "ai/BehaviorMode.hpp"
#include "collisions/CollisionShape.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace Nightfall {

using AgentID = uint32_t;

/**
 * @brief Enemy navigating the round's world.
 *
 * Holds the per-agent navigation state: kinematics, behaviour mode, the
 * current waypoint list and its cursor, the path throttle timestamp and the
 * caught/despawn flags. Mode changes go through applySignal and markCaught
 * so the throttle reset and the caught-agent freeze are always honoured.
 */
class Agent {
public:
    // Throttle value that lets the next tick search immediately
    static constexpr float NEVER_RECALCULATED = -9999.0f;
    // Speed above which the agent counts as running
    static constexpr float MOVING_SPEED = 4.0f;

    Agent(AgentID id, const Vector2D& position, CollisionShape shape);

    AgentID getID() const { return m_id; }

    const Vector2D& getPosition() const { return m_position; }
    void setPosition(const Vector2D& position) { m_position = position; }
    const Vector2D& getVelocity() const { return m_velocity; }
    void setVelocity(const Vector2D& velocity) { m_velocity = velocity; }
    const CollisionShape& getShape() const { return m_shape; }

    BehaviorMode getMode() const { return m_mode; }

    /**
     * @brief Apply a day/night signal
     *
     * Ignored once caught. Entering FLEE or CHASE from another mode resets
     * the path throttle and drops the old path.
     *
     * @return true if the mode changed
     */
    bool applySignal(DayNightSignal signal);

    /**
     * @brief Player touched this agent while it was fleeing
     * @return true if the agent was newly caught (FLEE and not already hit)
     */
    bool markCaught(float now);

    bool isHit() const { return m_hit; }
    float getHitTime() const { return m_hitTime; }
    bool despawnDue(float now, float despawnDelay) const {
        return m_hit && (now - m_hitTime) >= despawnDelay;
    }

    // Two-phase removal: flagged during the update pass, erased afterwards
    void markForRemoval() { m_pendingRemoval = true; }
    bool isPendingRemoval() const { return m_pendingRemoval; }

    // Path state
    const std::vector<Vector2D>& getWaypoints() const { return m_waypoints; }
    size_t getCursor() const { return m_cursor; }
    bool hasActiveWaypoint() const { return m_cursor < m_waypoints.size(); }
    const Vector2D& currentWaypoint() const { return m_waypoints[m_cursor]; }
    void advanceCursor() { ++m_cursor; }
    void setPath(std::vector<Vector2D> waypoints);
    void clearPath();

    float getLastRecalc() const { return m_lastRecalc; }
    void setLastRecalc(float now) { m_lastRecalc = now; }

    // Facing follows velocity only while running, as the animator expects
    Facing getFacing() const { return m_facing; }
    void updateFacing();
    bool isMoving() const { return m_velocity.length() > MOVING_SPEED; }
    std::string getAnimationKey() const { return animationKey(m_mode, m_facing, isMoving()); }

    // Stable per-agent direction for degenerate vectors
    Vector2D randomUnitVector();

private:
    AgentID m_id;
    Vector2D m_position;
    Vector2D m_velocity{0.0f, 0.0f};
    CollisionShape m_shape;

    BehaviorMode m_mode{BehaviorMode::CHASE};
    Facing m_facing{Facing::DOWN};

    std::vector<Vector2D> m_waypoints;
    size_t m_cursor{0};
    float m_lastRecalc{NEVER_RECALCULATED};

    bool m_hit{false};
    float m_hitTime{0.0f};
    bool m_pendingRemoval{false};

    std::mt19937 m_rng;
};

} // namespace Nightfall

#endif // AGENT_HPP
