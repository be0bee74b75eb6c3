/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/world/DayNightController.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace Nightfall {

namespace {
// Whole cycles replayed signal by signal in one update; older ones are counted only
constexpr double MAX_REPLAYED_CYCLES = 2.0;
}

DayNightController::DayNightController(const DayNightConfig& config)
    : m_dayLength(config.dayLength)
    , m_nightLength(config.nightLength)
    , m_haltWindow(config.haltWindow)
{
    if (!(m_dayLength > 0.0f) || !(m_nightLength > 0.0f)) {
        throw std::invalid_argument("DayNightController lengths must be positive: day " +
                                    std::to_string(m_dayLength) + ", night " +
                                    std::to_string(m_nightLength));
    }
    if (m_haltWindow < 0.0f || m_haltWindow > m_nightLength) {
        throw std::invalid_argument("DayNightController halt window outside the night: " +
                                    std::to_string(m_haltWindow));
    }
}

void DayNightController::update(float dt, DayNightSignals& outSignals)
{
    if (!(dt > 0.0f)) {
        return;
    }
    if (!std::isfinite(dt)) {
        DAYNIGHT_WARN("Ignoring non-finite time step");
        return;
    }

    float remaining = dt;
    const double cycleLength = static_cast<double>(m_dayLength) + m_nightLength;
    const double wholeCycles = std::floor(static_cast<double>(dt) / cycleLength);
    if (wholeCycles > MAX_REPLAYED_CYCLES) {
        skipCycles(wholeCycles - MAX_REPLAYED_CYCLES);
        remaining = static_cast<float>(std::fmod(static_cast<double>(dt), cycleLength) +
                                       MAX_REPLAYED_CYCLES * cycleLength);
    }

    while (true) {
        const float boundary = nextBoundary();
        const float untilBoundary = boundary - m_cycleTime;
        if (remaining < untilBoundary) {
            m_cycleTime += remaining;
            return;
        }
        remaining -= untilBoundary;
        m_cycleTime = boundary;
        crossBoundary(outSignals);
    }
}

void DayNightController::reset()
{
    m_phase = DayPhase::Day;
    m_cycleTime = 0.0f;
    m_completedCycles = 0;
}

void DayNightController::skipCycles(double cycles)
{
    constexpr double maxCycles = std::numeric_limits<uint32_t>::max();
    const double total = static_cast<double>(m_completedCycles) + cycles;
    m_completedCycles = total >= maxCycles ? std::numeric_limits<uint32_t>::max()
                                           : static_cast<uint32_t>(total);
    DAYNIGHT_DEBUG("Skipped " + std::to_string(cycles) + " whole cycles in one step");
}

const char* DayNightController::getCurrentPhaseString() const
{
    switch (m_phase) {
        case DayPhase::Day: return "Day";
        case DayPhase::NightHalt: return "NightHalt";
        case DayPhase::NightFlee: return "NightFlee";
    }
    return "Unknown";
}

float DayNightController::nextBoundary() const
{
    switch (m_phase) {
        case DayPhase::Day: return m_dayLength;
        case DayPhase::NightHalt: return m_dayLength + m_haltWindow;
        case DayPhase::NightFlee: return m_dayLength + m_nightLength;
    }
    return m_dayLength;
}

void DayNightController::crossBoundary(DayNightSignals& outSignals)
{
    switch (m_phase) {
        case DayPhase::Day:
            m_phase = DayPhase::NightHalt;
            outSignals.push_back(DayNightSignal::NIGHT_BEGIN);
            break;
        case DayPhase::NightHalt:
            m_phase = DayPhase::NightFlee;
            outSignals.push_back(DayNightSignal::HALT_WINDOW_ELAPSED);
            break;
        case DayPhase::NightFlee:
            m_phase = DayPhase::Day;
            m_cycleTime = 0.0f;
            ++m_completedCycles;
            outSignals.push_back(DayNightSignal::DAY_BEGIN);
            break;
    }
    DAYNIGHT_DEBUG(std::string("Entered ") + getCurrentPhaseString() + " after " +
                   std::to_string(m_completedCycles) + " full cycles");
}

} // namespace Nightfall
