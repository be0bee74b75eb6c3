/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

// Internal crowd utilities for separation and obstacle repulsion steering.
#ifndef AI_INTERNAL_CROWD_HPP
#define AI_INTERNAL_CROWD_HPP

#include "entities/Agent.hpp"
#include "utils/Vector2D.hpp"
#include "world/Obstacle.hpp"
#include <vector>

namespace AIInternal {

// Previous-tick state of one agent, captured before the update pass
struct NeighbourSnapshot {
  Nightfall::AgentID id;
  Nightfall::Vector2D position;
  bool halted; // Halted agents exert no separation
};

// Captures every agent's position and halt state in order
std::vector<NeighbourSnapshot>
TakeNeighbourSnapshot(const std::vector<Nightfall::Agent> &agents);

// Separation push for one agent
// - agent: the steering agent (excluded by id; supplies the fallback direction)
// - snapshot: positions from TakeNeighbourSnapshot
// - radius: neighbours at distance >= radius are ignored
// - force, dt: the normalized sum of (self - other) / d^2 is scaled by force * dt
// Coincident neighbours contribute the agent's random unit vector.
Nightfall::Vector2D
SeparationForce(Nightfall::Agent &agent,
                const std::vector<NeighbourSnapshot> &snapshot, float radius,
                float force, float dt);

// Obstacle repulsion for one agent, same form as SeparationForce but against
// obstacle centers
Nightfall::Vector2D
ObstacleAvoidance(Nightfall::Agent &agent,
                  const std::vector<Nightfall::Obstacle> &obstacles,
                  float radius, float force, float dt);

} // namespace AIInternal

#endif // AI_INTERNAL_CROWD_HPP
