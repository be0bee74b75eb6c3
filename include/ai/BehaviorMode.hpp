/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef BEHAVIOR_MODE_HPP
#define BEHAVIOR_MODE_HPP

#include "ai/pathfinding/NavGrid.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace Nightfall {

enum class BehaviorMode : uint8_t {
    CHASE,  // Path toward the player
    FLEE,   // Path away from the player, catchable
    HALT    // No pathfinding, no steering
};

enum class DayNightSignal : uint8_t {
    NIGHT_BEGIN,
    HALT_WINDOW_ELAPSED,
    DAY_BEGIN
};

enum class Facing : uint8_t { DOWN, UP, LEFT, RIGHT };

const char* modeName(BehaviorMode mode);
const char* signalName(DayNightSignal signal);
const char* facingName(Facing facing);

inline std::ostream& operator<<(std::ostream& os, BehaviorMode mode) { return os << modeName(mode); }
inline std::ostream& operator<<(std::ostream& os, DayNightSignal signal) { return os << signalName(signal); }
inline std::ostream& operator<<(std::ostream& os, Facing facing) { return os << facingName(facing); }

/**
 * @brief Mode after a day/night signal
 *
 * NIGHT_BEGIN sends every mode to HALT, DAY_BEGIN sends every mode to CHASE,
 * HALT_WINDOW_ELAPSED turns HALT into FLEE and leaves other modes alone.
 * Caught agents are filtered out by the caller.
 */
BehaviorMode transitionOnSignal(BehaviorMode mode, DayNightSignal signal);

/**
 * @brief Pathfinding goal for the mode, or nullopt when no search should run
 *
 * CHASE targets the player's cell. FLEE mirrors the agent's offset from the
 * player (agent + (agent - player)) and clamps it to the grid; when that cell
 * is blocked the free grid corner farthest from the player is used instead,
 * and with no free corner there is no goal. HALT never has a goal.
 */
std::optional<GridCell> selectGoal(BehaviorMode mode, const GridCell& agentCell,
                                   const GridCell& playerCell, const NavGrid& grid);

// Zero faces down; the dominant axis wins and ties go to the vertical axis
Facing facingFromVector(const Vector2D& v);

/**
 * @brief Animation sheet key for the presentation layer
 * @return "halt" while halted, otherwise "run_<facing>" or "idle_<facing>"
 */
std::string animationKey(BehaviorMode mode, Facing facing, bool moving);

} // namespace Nightfall

#endif // BEHAVIOR_MODE_HPP
