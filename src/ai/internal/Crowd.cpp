/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/internal/Crowd.hpp"

using Nightfall::Agent;
using Nightfall::Vector2D;

namespace AIInternal {

namespace {

// Accumulates (self - other) / d^2 for one source point
void AccumulateRepulsion(Agent &agent, const Vector2D &other, float radiusSq,
                         Vector2D &sum) {
  const Vector2D offset = agent.getPosition() - other;
  const float distSq = offset.lengthSquared();
  if (distSq >= radiusSq) {
    return;
  }
  if (distSq == 0.0f) {
    sum += agent.randomUnitVector();
    return;
  }
  sum += offset / distSq;
}

Vector2D ScaleRepulsion(const Vector2D &sum, float force, float dt) {
  if (sum.lengthSquared() == 0.0f) {
    return Vector2D(0.0f, 0.0f);
  }
  return sum.normalized() * (force * dt);
}

} // namespace

std::vector<NeighbourSnapshot>
TakeNeighbourSnapshot(const std::vector<Agent> &agents) {
  std::vector<NeighbourSnapshot> snapshot;
  snapshot.reserve(agents.size());
  for (const auto &agent : agents) {
    snapshot.push_back(NeighbourSnapshot{
        agent.getID(), agent.getPosition(),
        agent.getMode() == Nightfall::BehaviorMode::HALT});
  }
  return snapshot;
}

Vector2D SeparationForce(Agent &agent,
                         const std::vector<NeighbourSnapshot> &snapshot,
                         float radius, float force, float dt) {
  Vector2D sum(0.0f, 0.0f);
  const float radiusSq = radius * radius;
  for (const auto &other : snapshot) {
    if (other.id == agent.getID() || other.halted) {
      continue;
    }
    AccumulateRepulsion(agent, other.position, radiusSq, sum);
  }
  return ScaleRepulsion(sum, force, dt);
}

Vector2D ObstacleAvoidance(Agent &agent,
                           const std::vector<Nightfall::Obstacle> &obstacles,
                           float radius, float force, float dt) {
  Vector2D sum(0.0f, 0.0f);
  const float radiusSq = radius * radius;
  for (const auto &obstacle : obstacles) {
    AccumulateRepulsion(agent, obstacle.getCenter(), radiusSq, sum);
  }
  return ScaleRepulsion(sum, force, dt);
}

} // namespace AIInternal
