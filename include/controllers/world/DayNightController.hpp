/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DAY_NIGHT_CONTROLLER_HPP
#define DAY_NIGHT_CONTROLLER_HPP

/**
 * @file DayNightController.hpp
 * @brief Cycle clock that produces the day/night signals agents react to
 *
 * One cycle is dayLength seconds of day followed by nightLength seconds of
 * night. The first haltWindow seconds of every night are the halt phase.
 *
 *   t = 0                 day begins (cycle start)
 *   t = dayLength         NIGHT_BEGIN
 *   t = dayLength + halt  HALT_WINDOW_ELAPSED
 *   t = cycle length      DAY_BEGIN, clock wraps to 0
 *
 * Ownership: RoundManager owns the controller instance (not a singleton).
 */

#include "ai/BehaviorMode.hpp"
#include "ai/NavConfig.hpp"
#include <boost/container/small_vector.hpp>
#include <cstdint>

namespace Nightfall {

enum class DayPhase : uint8_t { Day, NightHalt, NightFlee };

using DayNightSignals = boost::container::small_vector<DayNightSignal, 4>;

class DayNightController
{
public:
    /**
     * @throws std::invalid_argument for non-positive lengths or a halt window
     *         outside [0, nightLength]
     */
    explicit DayNightController(const DayNightConfig& config);

    /**
     * @brief Advance the clock by dt seconds
     * @param outSignals receives every boundary crossed, in order, once each
     *        (a large dt may cross several boundaries and whole cycles).
     *        Beyond two whole cycles the earlier cycles are only counted,
     *        so one call emits at most nine signals. Non-finite dt is ignored.
     */
    void update(float dt, DayNightSignals& outSignals);

    // Back to the start of a day
    void reset();

    [[nodiscard]] DayPhase getCurrentPhase() const { return m_phase; }
    [[nodiscard]] const char* getCurrentPhaseString() const;
    [[nodiscard]] bool isNight() const { return m_phase != DayPhase::Day; }
    [[nodiscard]] float getCycleTime() const { return m_cycleTime; }
    [[nodiscard]] uint32_t getCompletedCycles() const { return m_completedCycles; }

private:
    float m_dayLength;
    float m_nightLength;
    float m_haltWindow;

    DayPhase m_phase{DayPhase::Day};
    float m_cycleTime{0.0f};
    uint32_t m_completedCycles{0};

    [[nodiscard]] float nextBoundary() const;
    void crossBoundary(DayNightSignals& outSignals);
    void skipCycles(double cycles);
};

} // namespace Nightfall

#endif // DAY_NIGHT_CONTROLLER_HPP
