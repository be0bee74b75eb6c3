/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/BehaviorMode.hpp"
#include <boost/container/small_vector.hpp>
#include <cmath>

namespace Nightfall {

const char* modeName(BehaviorMode mode) {
    switch (mode) {
        case BehaviorMode::CHASE: return "chase";
        case BehaviorMode::FLEE: return "flee";
        case BehaviorMode::HALT: return "halt";
    }
    return "unknown";
}

const char* signalName(DayNightSignal signal) {
    switch (signal) {
        case DayNightSignal::NIGHT_BEGIN: return "night-begin";
        case DayNightSignal::HALT_WINDOW_ELAPSED: return "halt-window-elapsed";
        case DayNightSignal::DAY_BEGIN: return "day-begin";
    }
    return "unknown";
}

const char* facingName(Facing facing) {
    switch (facing) {
        case Facing::DOWN: return "down";
        case Facing::UP: return "up";
        case Facing::LEFT: return "left";
        case Facing::RIGHT: return "right";
    }
    return "unknown";
}

BehaviorMode transitionOnSignal(BehaviorMode mode, DayNightSignal signal) {
    switch (signal) {
        case DayNightSignal::NIGHT_BEGIN:
            return BehaviorMode::HALT;
        case DayNightSignal::HALT_WINDOW_ELAPSED:
            return (mode == BehaviorMode::HALT) ? BehaviorMode::FLEE : mode;
        case DayNightSignal::DAY_BEGIN:
            return BehaviorMode::CHASE;
    }
    return mode;
}

std::optional<GridCell> selectGoal(BehaviorMode mode, const GridCell& agentCell,
                                   const GridCell& playerCell, const NavGrid& grid) {
    if (mode == BehaviorMode::CHASE) {
        return playerCell;
    }
    if (mode != BehaviorMode::FLEE) {
        return std::nullopt;
    }

    GridCell mirrored = grid.clampCell(GridCell{agentCell.x + (agentCell.x - playerCell.x),
                                                agentCell.y + (agentCell.y - playerCell.y)});
    if (!grid.isBlocked(mirrored)) {
        return mirrored;
    }

    const int lastCol = grid.getCols() - 1;
    const int lastRow = grid.getRows() - 1;
    const boost::container::small_vector<GridCell, 4> corners{
        GridCell{0, 0}, GridCell{lastCol, 0}, GridCell{0, lastRow}, GridCell{lastCol, lastRow}};

    std::optional<GridCell> best;
    float bestDistance = -1.0f;
    for (const auto& corner : corners) {
        if (grid.isBlocked(corner)) continue;
        float d = std::hypot(static_cast<float>(corner.x - playerCell.x),
                             static_cast<float>(corner.y - playerCell.y));
        // First corner wins ties
        if (d > bestDistance) {
            bestDistance = d;
            best = corner;
        }
    }
    return best;
}

Facing facingFromVector(const Vector2D& v) {
    if (v.getX() == 0.0f && v.getY() == 0.0f) {
        return Facing::DOWN;
    }
    if (std::fabs(v.getX()) > std::fabs(v.getY())) {
        return v.getX() > 0.0f ? Facing::RIGHT : Facing::LEFT;
    }
    return v.getY() > 0.0f ? Facing::DOWN : Facing::UP;
}

std::string animationKey(BehaviorMode mode, Facing facing, bool moving) {
    if (mode == BehaviorMode::HALT) {
        return "halt";
    }
    return std::string(moving ? "run_" : "idle_") + facingName(facing);
}

} // namespace Nightfall
