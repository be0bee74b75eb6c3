/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/NavConfig.hpp"
#include "core/Logger.hpp"
#include "managers/RoundManager.hpp"
#include "world/RoundSetup.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <limits>
#include <string>
#include <vector>

using namespace Nightfall;

// Sim name goes here.
const std::string SIM_NAME{"Nightfall Sim"};
const char* DEFAULT_CONFIG{"res/nightfall.json"};

namespace {

constexpr float FIXED_TIMESTEP{1.0f / 60.0f};
constexpr float MAX_FRAME_DELTA{0.25f};
constexpr float PLAYER_SPEED{180.0f};
constexpr float PLAYER_PAUSE_ON_CATCH{0.8f};
constexpr float PATROL_INSET{300.0f};

// Stand-in for keyboard input: patrols by day, hunts the nearest agent by night
class ScriptedPlayer {
public:
  ScriptedPlayer(const Vector2D& start, float worldWidth, float worldHeight)
      : m_position(start) {
    m_patrol = {Vector2D(PATROL_INSET, PATROL_INSET),
                Vector2D(worldWidth - PATROL_INSET, PATROL_INSET),
                Vector2D(worldWidth - PATROL_INSET, worldHeight - PATROL_INSET),
                Vector2D(PATROL_INSET, worldHeight - PATROL_INSET)};
  }

  void update(float dt, float now, bool night, const std::vector<Agent>& agents) {
    if (now < m_pauseUntil) {
      return;
    }

    Vector2D target = m_patrol[m_patrolIndex];
    if (night) {
      float best = std::numeric_limits<float>::max();
      for (const auto& agent : agents) {
        if (agent.isHit()) continue;
        float d = Vector2D::distanceSquared(agent.getPosition(), m_position);
        if (d < best) {
          best = d;
          target = agent.getPosition();
        }
      }
    } else if (Vector2D::distance(m_position, target) < 16.0f) {
      m_patrolIndex = (m_patrolIndex + 1) % m_patrol.size();
      target = m_patrol[m_patrolIndex];
    }

    Vector2D step = (target - m_position).clampedToLength(PLAYER_SPEED * dt);
    m_position += step;
  }

  void pause(float now) { m_pauseUntil = now + PLAYER_PAUSE_ON_CATCH; }
  const Vector2D& getPosition() const { return m_position; }

private:
  Vector2D m_position;
  std::vector<Vector2D> m_patrol;
  size_t m_patrolIndex{0};
  float m_pauseUntil{0.0f};
};

void configureLogDirectory() {
  char* prefPath = SDL_GetPrefPath("HammerForgedGames", "Nightfall");
  if (!prefPath) {
    SIM_WARN(std::string("No preference path for logs: ") + SDL_GetError());
    return;
  }
  Logger::SetLogDirectory(prefPath);
  SDL_free(prefPath);
}

void printUsage() {
  std::printf("Usage: nightfall_sim [config.json] [--seconds N] [--fast]\n");
}

} // namespace

int main(int argc, char* argv[]) {
  std::string configPath{DEFAULT_CONFIG};
  float maxSeconds{120.0f};
  bool realTime{true};

  for (int i = 1; i < argc; ++i) {
    std::string arg{argv[i]};
    if (arg == "--fast") {
      realTime = false;
    } else if (arg == "--seconds" && i + 1 < argc) {
      maxSeconds = static_cast<float>(std::atof(argv[++i]));
    } else if (arg == "--help") {
      printUsage();
      return 0;
    } else {
      configPath = arg;
    }
  }

  configureLogDirectory();
  SIM_INFO("Initializing " + SIM_NAME);

  NavConfig config;
  if (!loadNavConfig(configPath, config)) {
    SIM_WARN("Failed to load " + configPath + " - using default navigation config");
  }

  RoundSetup setup;
  if (!loadRoundSetup(configPath, setup)) {
    SIM_CRITICAL("No usable round setup in " + configPath);
    std::fprintf(stderr, "No usable round setup in %s\n", configPath.c_str());
    return -1;
  }

  try {
    RoundManager rounds(config);
    rounds.startRound(setup);

    ScriptedPlayer player(setup.playerStart, setup.worldWidth, setup.worldHeight);

    const Uint64 frequency = SDL_GetPerformanceFrequency();
    Uint64 lastCounter = SDL_GetPerformanceCounter();
    float now{0.0f};
    size_t ticks{0};
    size_t catches{0};
    size_t contacts{0};

    SIM_INFO("Starting Main Loop");

    while (now < maxSeconds && !rounds.roundCleared()) {
      auto frameStart = std::chrono::steady_clock::now();

      // Real time steps by the measured frame time; --fast replays at a fixed step
      float dt{FIXED_TIMESTEP};
      if (realTime) {
        Uint64 counter = SDL_GetPerformanceCounter();
        dt = static_cast<float>(counter - lastCounter) / static_cast<float>(frequency);
        lastCounter = counter;
        if (dt <= 0.0f) {
          continue;
        }
        // Clamp stalls (debugger, window drag)
        dt = std::min(dt, MAX_FRAME_DELTA);
      }
      now += dt;
      ++ticks;

      player.update(dt, now, rounds.getDayNight().isNight(), rounds.getAgents());
      RoundEvents events = rounds.update(dt, now, player.getPosition());

      for (DayNightSignal signal : events.signals) {
        SIM_INFO(std::string("t=") + std::to_string(now) + " signal " + signalName(signal));
      }
      for (const auto& event : events.events) {
        if (event.type == RoundEventType::Catch) {
          ++catches;
          player.pause(now);
        } else if (event.type == RoundEventType::Contact) {
          ++contacts;
        }
      }

      if (realTime) {
        auto elapsed = std::chrono::steady_clock::now() - frameStart;
        auto target = std::chrono::duration<float>(FIXED_TIMESTEP);
        if (elapsed < target) {
          auto remainingNs = std::chrono::duration_cast<std::chrono::nanoseconds>(target - elapsed);
          SDL_DelayPrecise(static_cast<Uint64>(remainingNs.count()));
        }
      }
    }

    // Summary goes to stdout in every build
    const auto& stats = rounds.getPathStats();
    std::printf("%s ended at t=%.2f after %zu ticks%s: %zu catches, %zu contacts, %zu agents left\n",
                SIM_NAME.c_str(), now, ticks, rounds.roundCleared() ? " (cleared)" : "", catches,
                contacts, rounds.getAgents().size());
    std::printf("Path requests: %zu total, %zu found, %zu timed out, %zu invalid endpoints\n",
                static_cast<size_t>(stats.totalRequests), static_cast<size_t>(stats.successfulPaths),
                static_cast<size_t>(stats.timeouts),
                static_cast<size_t>(stats.invalidStarts + stats.invalidGoals));
  } catch (const std::exception& e) {
    SIM_CRITICAL(std::string("Simulation aborted: ") + e.what());
    return -1;
  }

  SIM_INFO(SIM_NAME + " shutting down");
  return 0;
}
