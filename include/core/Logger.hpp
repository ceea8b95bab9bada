/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstddef> // IWYU pragma: keep - Required for size_t
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace ShoalEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  // Debug builds log to stdout; file output is only used by release builds
  static void SetLogDirectory(const std::string &) {}
  static void SetMaxLogFiles(size_t) {}

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Shoal Engine - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
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
};

// Debug build macros - full functionality
#define SHOAL_CRITICAL(system, msg)                                            \
  ShoalEngine::Logger::Log(ShoalEngine::LogLevel::CRITICAL, system, msg)
#define SHOAL_ERROR(system, msg)                                               \
  ShoalEngine::Logger::Log(ShoalEngine::LogLevel::ERROR_LEVEL, system, msg)
#define SHOAL_WARN(system, msg)                                                \
  ShoalEngine::Logger::Log(ShoalEngine::LogLevel::WARNING, system, msg)
#define SHOAL_INFO(system, msg)                                                \
  ShoalEngine::Logger::Log(ShoalEngine::LogLevel::INFO, system, msg)
#define SHOAL_DEBUG(system, msg)                                               \
  ShoalEngine::Logger::Log(ShoalEngine::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL and ERROR only, written to a rotating log file
// (see Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  // Both must be called before the first message is written to take effect
  static void SetLogDirectory(const std::string &directory);
  // Number of log files kept in the directory, including the current one
  static void SetMaxLogFiles(size_t maxFiles);

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define SHOAL_CRITICAL(system, msg)                                            \
  ShoalEngine::Logger::Log("CRITICAL", system, msg)

#define SHOAL_ERROR(system, msg) ShoalEngine::Logger::Log("ERROR", system, msg)

#define SHOAL_WARN(system, msg) ((void)0)  // Zero overhead
#define SHOAL_INFO(system, msg) ((void)0)  // Zero overhead
#define SHOAL_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
#ifdef DEBUG
inline std::mutex Logger::s_logMutex{};
#endif

// Convenience macros for each subsystem

// Core Systems
#define THREADSYSTEM_CRITICAL(msg) SHOAL_CRITICAL("ThreadSystem", msg)
#define THREADSYSTEM_ERROR(msg) SHOAL_ERROR("ThreadSystem", msg)
#define THREADSYSTEM_WARN(msg) SHOAL_WARN("ThreadSystem", msg)
#define THREADSYSTEM_INFO(msg) SHOAL_INFO("ThreadSystem", msg)
#define THREADSYSTEM_DEBUG(msg) SHOAL_DEBUG("ThreadSystem", msg)

#define SHOAL_MAIN_CRITICAL(msg) SHOAL_CRITICAL("ShoalMain", msg)
#define SHOAL_MAIN_ERROR(msg) SHOAL_ERROR("ShoalMain", msg)
#define SHOAL_MAIN_WARN(msg) SHOAL_WARN("ShoalMain", msg)
#define SHOAL_MAIN_INFO(msg) SHOAL_INFO("ShoalMain", msg)
#define SHOAL_MAIN_DEBUG(msg) SHOAL_DEBUG("ShoalMain", msg)

// Simulation Systems
#define FLOCK_CRITICAL(msg) SHOAL_CRITICAL("FlockEngine", msg)
#define FLOCK_ERROR(msg) SHOAL_ERROR("FlockEngine", msg)
#define FLOCK_WARN(msg) SHOAL_WARN("FlockEngine", msg)
#define FLOCK_INFO(msg) SHOAL_INFO("FlockEngine", msg)
#define FLOCK_DEBUG(msg) SHOAL_DEBUG("FlockEngine", msg)

#define SIMULATION_CRITICAL(msg) SHOAL_CRITICAL("SimulationInstance", msg)
#define SIMULATION_ERROR(msg) SHOAL_ERROR("SimulationInstance", msg)
#define SIMULATION_WARN(msg) SHOAL_WARN("SimulationInstance", msg)
#define SIMULATION_INFO(msg) SHOAL_INFO("SimulationInstance", msg)
#define SIMULATION_DEBUG(msg) SHOAL_DEBUG("SimulationInstance", msg)

#define CHANNEL_CRITICAL(msg) SHOAL_CRITICAL("SubscriberChannel", msg)
#define CHANNEL_ERROR(msg) SHOAL_ERROR("SubscriberChannel", msg)
#define CHANNEL_WARN(msg) SHOAL_WARN("SubscriberChannel", msg)
#define CHANNEL_INFO(msg) SHOAL_INFO("SubscriberChannel", msg)
#define CHANNEL_DEBUG(msg) SHOAL_DEBUG("SubscriberChannel", msg)

// Manager Systems
#define REGISTRY_CRITICAL(msg) SHOAL_CRITICAL("SimulationManager", msg)
#define REGISTRY_ERROR(msg) SHOAL_ERROR("SimulationManager", msg)
#define REGISTRY_WARN(msg) SHOAL_WARN("SimulationManager", msg)
#define REGISTRY_INFO(msg) SHOAL_INFO("SimulationManager", msg)
#define REGISTRY_DEBUG(msg) SHOAL_DEBUG("SimulationManager", msg)

#define SETTINGS_CRITICAL(msg) SHOAL_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) SHOAL_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) SHOAL_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) SHOAL_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) SHOAL_DEBUG("SettingsManager", msg)

// Benchmark mode convenience macros
#define SHOAL_ENABLE_BENCHMARK_MODE()                                          \
  ShoalEngine::Logger::SetBenchmarkMode(true)
#define SHOAL_DISABLE_BENCHMARK_MODE()                                         \
  ShoalEngine::Logger::SetBenchmarkMode(false)

} // namespace ShoalEngine

#endif // LOGGER_HPP
