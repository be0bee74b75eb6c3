/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ROUND_EVENTS_HPP
#define ROUND_EVENTS_HPP

#include "controllers/world/DayNightController.hpp"
#include "entities/Agent.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>
#include <ostream>
#include <vector>

namespace Nightfall {

/**
 * @brief Kinds of round outcomes reported to the presentation layer
 */
enum class RoundEventType : uint8_t
{
    Catch,    // Player caught a fleeing agent (player pauses briefly)
    Despawn,  // Caught agent removed after its delay (player gains a heart)
    Contact   // Non-fleeing agent touched the player (player loses a heart)
};

inline std::ostream& operator<<(std::ostream& os, RoundEventType type)
{
    switch (type) {
        case RoundEventType::Catch: return os << "Catch";
        case RoundEventType::Despawn: return os << "Despawn";
        case RoundEventType::Contact: return os << "Contact";
    }
    return os << "Unknown";
}

struct RoundEvent
{
    RoundEventType type;
    AgentID agentId;
    Vector2D position;  // Agent position when the event fired
    float time;         // Round clock value passed to update()
};

/**
 * @brief Everything one RoundManager tick produced, in occurrence order
 */
struct RoundEvents
{
    DayNightSignals signals;
    std::vector<RoundEvent> events;

    bool empty() const { return signals.empty() && events.empty(); }

    size_t count(RoundEventType type) const
    {
        size_t n = 0;
        for (const auto& e : events) {
            if (e.type == type) ++n;
        }
        return n;
    }
};

} // namespace Nightfall

#endif // ROUND_EVENTS_HPP
