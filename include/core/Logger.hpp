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
// - mutex: Required for serialized output
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep
#include <cstdint> // IWYU pragma: keep
#include <cstdio> // IWYU pragma: keep
#include <mutex> // IWYU pragma: keep
#include <string> // IWYU pragma: keep

namespace RiverForge {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

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

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("RiverForge - [%s] %s: %s\n", system, getLevelString(level),
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

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

#define RIVERFORGE_CRITICAL(system, msg)                                       \
  RiverForge::Logger::Log(RiverForge::LogLevel::CRITICAL, system, msg)
#define RIVERFORGE_ERROR(system, msg)                                          \
  RiverForge::Logger::Log(RiverForge::LogLevel::ERROR_LEVEL, system, msg)

#ifdef DEBUG
// Debug build macros - full functionality
#define RIVERFORGE_WARN(system, msg)                                           \
  RiverForge::Logger::Log(RiverForge::LogLevel::WARNING, system, msg)
#define RIVERFORGE_INFO(system, msg)                                           \
  RiverForge::Logger::Log(RiverForge::LogLevel::INFO, system, msg)
#define RIVERFORGE_DEBUG(system, msg)                                          \
  RiverForge::Logger::Log(RiverForge::LogLevel::DEBUG_LEVEL, system, msg)
#else
#define RIVERFORGE_WARN(system, msg) ((void)0)  // Zero overhead
#define RIVERFORGE_INFO(system, msg) ((void)0)  // Zero overhead
#define RIVERFORGE_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Convenience macros for each streaming system

#define TERRAIN_CRITICAL(msg) RIVERFORGE_CRITICAL("TerrainManager", msg)
#define TERRAIN_ERROR(msg) RIVERFORGE_ERROR("TerrainManager", msg)
#define TERRAIN_WARN(msg) RIVERFORGE_WARN("TerrainManager", msg)
#define TERRAIN_INFO(msg) RIVERFORGE_INFO("TerrainManager", msg)
#define TERRAIN_DEBUG(msg) RIVERFORGE_DEBUG("TerrainManager", msg)

#define CHUNK_CRITICAL(msg) RIVERFORGE_CRITICAL("TerrainChunk", msg)
#define CHUNK_ERROR(msg) RIVERFORGE_ERROR("TerrainChunk", msg)
#define CHUNK_WARN(msg) RIVERFORGE_WARN("TerrainChunk", msg)
#define CHUNK_INFO(msg) RIVERFORGE_INFO("TerrainChunk", msg)
#define CHUNK_DEBUG(msg) RIVERFORGE_DEBUG("TerrainChunk", msg)

#define BIOME_CRITICAL(msg) RIVERFORGE_CRITICAL("BiomeManager", msg)
#define BIOME_ERROR(msg) RIVERFORGE_ERROR("BiomeManager", msg)
#define BIOME_WARN(msg) RIVERFORGE_WARN("BiomeManager", msg)
#define BIOME_INFO(msg) RIVERFORGE_INFO("BiomeManager", msg)
#define BIOME_DEBUG(msg) RIVERFORGE_DEBUG("BiomeManager", msg)

#define DECORATION_CRITICAL(msg) RIVERFORGE_CRITICAL("Decoration", msg)
#define DECORATION_ERROR(msg) RIVERFORGE_ERROR("Decoration", msg)
#define DECORATION_WARN(msg) RIVERFORGE_WARN("Decoration", msg)
#define DECORATION_INFO(msg) RIVERFORGE_INFO("Decoration", msg)
#define DECORATION_DEBUG(msg) RIVERFORGE_DEBUG("Decoration", msg)

#define COLLISION_CRITICAL(msg) RIVERFORGE_CRITICAL("CollisionCorridor", msg)
#define COLLISION_ERROR(msg) RIVERFORGE_ERROR("CollisionCorridor", msg)
#define COLLISION_WARN(msg) RIVERFORGE_WARN("CollisionCorridor", msg)
#define COLLISION_INFO(msg) RIVERFORGE_INFO("CollisionCorridor", msg)
#define COLLISION_DEBUG(msg) RIVERFORGE_DEBUG("CollisionCorridor", msg)

#define CONFIG_CRITICAL(msg) RIVERFORGE_CRITICAL("StreamingConfig", msg)
#define CONFIG_ERROR(msg) RIVERFORGE_ERROR("StreamingConfig", msg)
#define CONFIG_WARN(msg) RIVERFORGE_WARN("StreamingConfig", msg)
#define CONFIG_INFO(msg) RIVERFORGE_INFO("StreamingConfig", msg)
#define CONFIG_DEBUG(msg) RIVERFORGE_DEBUG("StreamingConfig", msg)

#define DEMO_CRITICAL(msg) RIVERFORGE_CRITICAL("Demo", msg)
#define DEMO_ERROR(msg) RIVERFORGE_ERROR("Demo", msg)
#define DEMO_WARN(msg) RIVERFORGE_WARN("Demo", msg)
#define DEMO_INFO(msg) RIVERFORGE_INFO("Demo", msg)
#define DEMO_DEBUG(msg) RIVERFORGE_DEBUG("Demo", msg)

// Benchmark mode convenience macros
#define RIVERFORGE_ENABLE_BENCHMARK_MODE()                                     \
  RiverForge::Logger::SetBenchmarkMode(true)
#define RIVERFORGE_DISABLE_BENCHMARK_MODE()                                    \
  RiverForge::Logger::SetBenchmarkMode(false)

} // namespace RiverForge

#endif // LOGGER_HPP
