/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

/**
 * @file Logger.hpp
 * @brief Subsystem-tagged logging for the navigation core and its hosts
 *
 * DEBUG builds print every level to stdout. Release builds keep only
 * CRITICAL and ERROR and append them to nightfall_<timestamp>.log under
 * <directory>/logs once SetLogDirectory() has been called; before that they
 * are dropped. WARN, INFO and DEBUG compile away in release builds, so their
 * message expressions are never evaluated there.
 */

#include <atomic>
#include <cstdint>
#include <string>

namespace Nightfall {

enum class LogLevel : uint8_t {
  CRITICAL = 0,
  ERROR_LEVEL = 1, // ERROR collides with a Windows macro
  WARNING = 2,
  INFO = 3,
  DEBUG_LEVEL = 4  // DEBUG is the build flag
};

class Logger {
public:
  static void Log(LogLevel level, const char *system, const std::string &message);
  static void Log(LogLevel level, const char *system, const char *message);

  // Release builds only; debug builds always print to the console
  static void SetLogDirectory(const std::string &directory);

  // Silences every level, used by long-running tests
  static void SetMuted(bool muted) {
    s_muted.store(muted, std::memory_order_relaxed);
  }
  static bool IsMuted() { return s_muted.load(std::memory_order_relaxed); }

  static const char *LevelName(LogLevel level);

private:
  static inline std::atomic<bool> s_muted{false};
};

} // namespace Nightfall

#define NIGHTFALL_CRITICAL(system, msg)                                        \
  Nightfall::Logger::Log(Nightfall::LogLevel::CRITICAL, system, msg)
#define NIGHTFALL_ERROR(system, msg)                                           \
  Nightfall::Logger::Log(Nightfall::LogLevel::ERROR_LEVEL, system, msg)

#ifdef DEBUG
#define NIGHTFALL_WARN(system, msg)                                            \
  Nightfall::Logger::Log(Nightfall::LogLevel::WARNING, system, msg)
#define NIGHTFALL_INFO(system, msg)                                            \
  Nightfall::Logger::Log(Nightfall::LogLevel::INFO, system, msg)
#define NIGHTFALL_DEBUG(system, msg)                                           \
  Nightfall::Logger::Log(Nightfall::LogLevel::DEBUG_LEVEL, system, msg)
#else
#define NIGHTFALL_WARN(system, msg) ((void)0)
#define NIGHTFALL_INFO(system, msg) ((void)0)
#define NIGHTFALL_DEBUG(system, msg) ((void)0)
#endif

// Navigation
#define NAVGRID_CRITICAL(msg) NIGHTFALL_CRITICAL("NavGrid", msg)
#define NAVGRID_ERROR(msg) NIGHTFALL_ERROR("NavGrid", msg)
#define NAVGRID_WARN(msg) NIGHTFALL_WARN("NavGrid", msg)
#define NAVGRID_INFO(msg) NIGHTFALL_INFO("NavGrid", msg)
#define NAVGRID_DEBUG(msg) NIGHTFALL_DEBUG("NavGrid", msg)

#define PATHFIND_CRITICAL(msg) NIGHTFALL_CRITICAL("Pathfinding", msg)
#define PATHFIND_ERROR(msg) NIGHTFALL_ERROR("Pathfinding", msg)
#define PATHFIND_WARN(msg) NIGHTFALL_WARN("Pathfinding", msg)
#define PATHFIND_INFO(msg) NIGHTFALL_INFO("Pathfinding", msg)
#define PATHFIND_DEBUG(msg) NIGHTFALL_DEBUG("Pathfinding", msg)

// Agents
#define STEERING_CRITICAL(msg) NIGHTFALL_CRITICAL("AgentSteering", msg)
#define STEERING_ERROR(msg) NIGHTFALL_ERROR("AgentSteering", msg)
#define STEERING_WARN(msg) NIGHTFALL_WARN("AgentSteering", msg)
#define STEERING_INFO(msg) NIGHTFALL_INFO("AgentSteering", msg)
#define STEERING_DEBUG(msg) NIGHTFALL_DEBUG("AgentSteering", msg)

#define BEHAVIOR_CRITICAL(msg) NIGHTFALL_CRITICAL("BehaviorMode", msg)
#define BEHAVIOR_ERROR(msg) NIGHTFALL_ERROR("BehaviorMode", msg)
#define BEHAVIOR_WARN(msg) NIGHTFALL_WARN("BehaviorMode", msg)
#define BEHAVIOR_INFO(msg) NIGHTFALL_INFO("BehaviorMode", msg)
#define BEHAVIOR_DEBUG(msg) NIGHTFALL_DEBUG("BehaviorMode", msg)

// World and round flow
#define DAYNIGHT_CRITICAL(msg) NIGHTFALL_CRITICAL("DayNightController", msg)
#define DAYNIGHT_ERROR(msg) NIGHTFALL_ERROR("DayNightController", msg)
#define DAYNIGHT_WARN(msg) NIGHTFALL_WARN("DayNightController", msg)
#define DAYNIGHT_INFO(msg) NIGHTFALL_INFO("DayNightController", msg)
#define DAYNIGHT_DEBUG(msg) NIGHTFALL_DEBUG("DayNightController", msg)

#define ROUND_CRITICAL(msg) NIGHTFALL_CRITICAL("RoundManager", msg)
#define ROUND_ERROR(msg) NIGHTFALL_ERROR("RoundManager", msg)
#define ROUND_WARN(msg) NIGHTFALL_WARN("RoundManager", msg)
#define ROUND_INFO(msg) NIGHTFALL_INFO("RoundManager", msg)
#define ROUND_DEBUG(msg) NIGHTFALL_DEBUG("RoundManager", msg)

#define CONFIG_CRITICAL(msg) NIGHTFALL_CRITICAL("NavConfig", msg)
#define CONFIG_ERROR(msg) NIGHTFALL_ERROR("NavConfig", msg)
#define CONFIG_WARN(msg) NIGHTFALL_WARN("NavConfig", msg)
#define CONFIG_INFO(msg) NIGHTFALL_INFO("NavConfig", msg)
#define CONFIG_DEBUG(msg) NIGHTFALL_DEBUG("NavConfig", msg)

// Host application
#define SIM_CRITICAL(msg) NIGHTFALL_CRITICAL("NightfallSim", msg)
#define SIM_ERROR(msg) NIGHTFALL_ERROR("NightfallSim", msg)
#define SIM_WARN(msg) NIGHTFALL_WARN("NightfallSim", msg)
#define SIM_INFO(msg) NIGHTFALL_INFO("NightfallSim", msg)
#define SIM_DEBUG(msg) NIGHTFALL_DEBUG("NightfallSim", msg)

#define NIGHTFALL_MUTE_LOGS() Nightfall::Logger::SetMuted(true)
#define NIGHTFALL_UNMUTE_LOGS() Nightfall::Logger::SetMuted(false)

#endif // LOGGER_HPP
