/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef NAV_CONFIG_HPP
#define NAV_CONFIG_HPP

#include <string>

namespace Nightfall
{

class JsonValue;

/**
 * Configuration for NavGrid construction
 */
struct NavGridConfig
{
    float cellSize = 48.0f;                       // World units per grid cell
    int expandCells = 1;                          // Blocked-region growth on every side
};

/**
 * Configuration for PathFinder
 */
struct PathfinderConfig
{
    int maxExpansions = 25000;                    // Expanded-node budget before TIMEOUT
};

/**
 * Configuration for AgentSteering
 *
 * Controls path following, separation between agents, obstacle repulsion
 * and the hard collision response.
 */
struct SteeringConfig
{
    // Movement parameters
    float maxSpeed = 150.0f;                      // Speed cap in px/s
    float acceleration = 900.0f;                  // Steering magnitude cap in px/s^2

    // Separation
    float separationRadius = 36.0f;               // Neighbour radius (px)
    float separationForce = 420.0f;               // Separation scale, multiplied by dt

    // Obstacle avoidance
    float avoidForce = 600.0f;                    // Repulsion scale, multiplied by dt
    float avoidRadiusMin = 32.0f;                 // Lower bound of the repulsion radius (px)
    float avoidRadiusCellFactor = 0.8f;           // Repulsion radius as a fraction of cell size

    // Waypoint following
    float waypointRadiusMin = 10.0f;              // Lower bound of the arrival radius (px)
    float waypointRadiusCellFactor = 0.35f;       // Arrival radius as a fraction of cell size

    // Collision response
    float collisionPushCellFactor = 0.06f;        // Push-out distance as a fraction of cell size
    float collisionDamping = 0.55f;               // Velocity multiplier after an obstacle hit
    float contactRebound = -0.3f;                 // Velocity multiplier after touching the player
};

/**
 * Per-agent behaviour timing
 */
struct BehaviorTimingConfig
{
    float recalcInterval = 0.85f;                 // Minimum seconds between path searches
    float despawnDelay = 0.7f;                    // Seconds a caught agent stays before removal
};

/**
 * Day/night cycle lengths
 */
struct DayNightConfig
{
    float dayLength = 20.0f;                      // Seconds of daytime chase
    float nightLength = 12.0f;                    // Seconds of night (halt window included)
    float haltWindow = 0.56f;                     // Seconds agents stand still after dusk
};

/**
 * All navigation tunables, passed by const reference to the grid, finder
 * and steering constructors. Never mutated while a round is running.
 */
struct NavConfig
{
    NavGridConfig grid;
    PathfinderConfig pathfinder;
    SteeringConfig steering;
    BehaviorTimingConfig timing;
    DayNightConfig dayNight;

    /**
     * @brief Reject non-positive sizes, speeds and durations
     * @throws std::invalid_argument naming the first offending field
     */
    void validate() const;
};

/**
 * @brief Overlay the categories present in a parsed JSON root onto config
 *
 * Unknown keys are logged and skipped. The result is validated before it is
 * committed, so config is untouched on failure.
 *
 * @return false if root is not an object or the merged values are invalid
 */
bool applyNavConfig(const JsonValue& root, NavConfig& config);

/**
 * @brief Load a JSON file and apply it with applyNavConfig
 * @return false (config untouched) on I/O, parse or validation failure
 */
bool loadNavConfig(const std::string& filepath, NavConfig& config);

} // namespace Nightfall

#endif // NAV_CONFIG_HPP
