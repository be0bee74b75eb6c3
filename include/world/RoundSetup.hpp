/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ROUND_SETUP_HPP
#define ROUND_SETUP_HPP

#include "collisions/CollisionShape.hpp"
#include "utils/Vector2D.hpp"
#include "world/Obstacle.hpp"
#include <string>
#include <vector>

namespace Nightfall {

class JsonValue;

struct EnemySpawn {
    Vector2D position;
    CollisionShape shape{CollisionShape::box(16.0f, 16.0f)};
};

/**
 * Result of world placement for one round: bounds, obstacles, the player's
 * start and every enemy spawn. Consumed by RoundManager::startRound.
 */
struct RoundSetup {
    float worldWidth{2000.0f};
    float worldHeight{2000.0f};
    std::vector<Obstacle> obstacles;
    Vector2D playerStart{1000.0f, 1000.0f};
    CollisionShape playerShape{CollisionShape::box(16.0f, 16.0f)};
    std::vector<EnemySpawn> enemies;

    /**
     * @brief Positive world size, player and spawns inside the world
     * @throws std::invalid_argument describing the first problem found
     */
    void validate() const;
};

/**
 * @brief Parse a collision shape object
 *
 * {"kind": "box", "halfWidth": w, "halfHeight": h}
 * {"kind": "circle", "radius": r}
 * {"kind": "mask", "rows": ["..##..", ...]}   ('#' is solid)
 *
 * @throws std::invalid_argument on an unknown kind or malformed fields
 */
CollisionShape parseCollisionShape(const JsonValue& value);

/**
 * @brief Read the "round" object of a config root into setup
 * @return false (setup untouched) if the object is missing or invalid
 */
bool applyRoundSetup(const JsonValue& root, RoundSetup& setup);

bool loadRoundSetup(const std::string& filepath, RoundSetup& setup);

} // namespace Nightfall

#endif // ROUND_SETUP_HPP
