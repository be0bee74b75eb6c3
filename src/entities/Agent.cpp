/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Agent.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <utility>

namespace Nightfall {

Agent::Agent(AgentID id, const Vector2D& position, CollisionShape shape)
    : m_id(id), m_position(position), m_shape(std::move(shape)), m_rng(id) {}

bool Agent::applySignal(DayNightSignal signal) {
    if (m_hit) {
        return false;
    }

    BehaviorMode next = transitionOnSignal(m_mode, signal);
    if (next == m_mode) {
        return false;
    }

    BEHAVIOR_DEBUG("Agent " + std::to_string(m_id) + ": " + modeName(m_mode) + " -> " +
                   modeName(next) + " on " + signalName(signal));
    m_mode = next;

    if (m_mode == BehaviorMode::FLEE || m_mode == BehaviorMode::CHASE) {
        m_lastRecalc = NEVER_RECALCULATED;
        clearPath();
    }
    return true;
}

bool Agent::markCaught(float now) {
    if (m_hit || m_mode != BehaviorMode::FLEE) {
        return false;
    }
    m_hit = true;
    m_hitTime = now;
    m_velocity = Vector2D(0.0f, 0.0f);
    clearPath();
    BEHAVIOR_DEBUG("Agent " + std::to_string(m_id) + " caught at t=" + std::to_string(now));
    return true;
}

void Agent::setPath(std::vector<Vector2D> waypoints) {
    m_waypoints = std::move(waypoints);
    m_cursor = 0;
}

void Agent::clearPath() {
    m_waypoints.clear();
    m_cursor = 0;
}

void Agent::updateFacing() {
    if (isMoving()) {
        m_facing = facingFromVector(m_velocity);
    }
}

Vector2D Agent::randomUnitVector() {
    std::uniform_real_distribution<float> angle(0.0f, 6.28318531f);
    float a = angle(m_rng);
    return Vector2D(std::cos(a), std::sin(a));
}

} // namespace Nightfall
