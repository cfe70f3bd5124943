/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - benchmark mode flag
#include <cstdint>
#include <cstdio> // IWYU pragma: keep - printf/fflush in debug builds
#include <mutex>
#include <string> // IWYU pragma: keep - std::string messages in macros

namespace HordeMind {

enum class LogLevel : uint8_t {
  CRITICAL = 0,    // Always logged (console in debug, file in release)
  ERROR_LEVEL = 1, // Always logged (named to avoid the Windows ERROR macro)
  WARNING = 2,     // Debug only
  INFO = 3,        // Debug only
  DEBUG_LEVEL = 4  // Debug only
};

/**
 * @brief Process-wide log sink for the navigation core.
 *
 * Debug builds print every level to stdout. Release builds keep only CRITICAL
 * and ERROR and route them to a rotating file under the SDL preference path
 * (see Logger.cpp); the other levels compile away entirely.
 */
class Logger {
public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static const char *levelName(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }

#ifdef DEBUG
  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }
    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("HordeMind - [%s] %s: %s\n", system, levelName(level), message);
    fflush(stdout);
  }
#else
  // Defined in Logger.cpp, writes to the release log file
  static void Log(LogLevel level, const char *system,
                  const std::string &message);
  static void Log(LogLevel level, const char *system, const char *message);
#endif

private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;
};

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

#define HORDE_CRITICAL(system, msg)                                            \
  HordeMind::Logger::Log(HordeMind::LogLevel::CRITICAL, system, msg)
#define HORDE_ERROR(system, msg)                                               \
  HordeMind::Logger::Log(HordeMind::LogLevel::ERROR_LEVEL, system, msg)

#ifdef DEBUG
#define HORDE_WARN(system, msg)                                                \
  HordeMind::Logger::Log(HordeMind::LogLevel::WARNING, system, msg)
#define HORDE_INFO(system, msg)                                                \
  HordeMind::Logger::Log(HordeMind::LogLevel::INFO, system, msg)
#define HORDE_DEBUG(system, msg)                                               \
  HordeMind::Logger::Log(HordeMind::LogLevel::DEBUG_LEVEL, system, msg)
#else
#define HORDE_WARN(system, msg) ((void)0)
#define HORDE_INFO(system, msg) ((void)0)
#define HORDE_DEBUG(system, msg) ((void)0)
#endif

// Orchestrator and behavior state machine
#define AI_CRITICAL(msg) HORDE_CRITICAL("AIManager", msg)
#define AI_ERROR(msg) HORDE_ERROR("AIManager", msg)
#define AI_WARN(msg) HORDE_WARN("AIManager", msg)
#define AI_INFO(msg) HORDE_INFO("AIManager", msg)
#define AI_DEBUG(msg) HORDE_DEBUG("AIManager", msg)

// Strategies, caches and the request queue
#define PATHFIND_CRITICAL(msg) HORDE_CRITICAL("Pathfinding", msg)
#define PATHFIND_ERROR(msg) HORDE_ERROR("Pathfinding", msg)
#define PATHFIND_WARN(msg) HORDE_WARN("Pathfinding", msg)
#define PATHFIND_INFO(msg) HORDE_INFO("Pathfinding", msg)
#define PATHFIND_DEBUG(msg) HORDE_DEBUG("Pathfinding", msg)

#define SPATIAL_CRITICAL(msg) HORDE_CRITICAL("SpatialGrid", msg)
#define SPATIAL_ERROR(msg) HORDE_ERROR("SpatialGrid", msg)
#define SPATIAL_WARN(msg) HORDE_WARN("SpatialGrid", msg)
#define SPATIAL_INFO(msg) HORDE_INFO("SpatialGrid", msg)
#define SPATIAL_DEBUG(msg) HORDE_DEBUG("SpatialGrid", msg)

// Movement executor and steering
#define NAVIGATION_CRITICAL(msg) HORDE_CRITICAL("Navigation", msg)
#define NAVIGATION_ERROR(msg) HORDE_ERROR("Navigation", msg)
#define NAVIGATION_WARN(msg) HORDE_WARN("Navigation", msg)
#define NAVIGATION_INFO(msg) HORDE_INFO("Navigation", msg)
#define NAVIGATION_DEBUG(msg) HORDE_DEBUG("Navigation", msg)

#define HORDE_ENABLE_BENCHMARK_MODE() HordeMind::Logger::SetBenchmarkMode(true)
#define HORDE_DISABLE_BENCHMARK_MODE()                                         \
  HordeMind::Logger::SetBenchmarkMode(false)

} // namespace HordeMind

#endif // LOGGER_HPP
