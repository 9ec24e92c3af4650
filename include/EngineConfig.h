/**
 * @file EngineConfig.h
 * @brief Runtime configuration: defaults, then SANDGLASS_* environment overrides, then command-line flags.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "AutomatonStep.h"

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

/** @brief Thrown for a malformed configuration value; parseConfig catches it and keeps the previous value. */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct EngineConfig
 * @brief Everything the engine and the host loop can be tuned with.
 */
struct EngineConfig {
    std::uint32_t quantumSeconds{1};           /**< tracked seconds per grain */
    std::size_t maxPerTick{8};                 /**< grains drained per tick */
    SpawnPolicy spawnPolicy{SpawnPolicy::RoundRobin};
    std::uint32_t seed{0};                     /**< PRNG seed; 0 = seed from std::random_device */
    int physicsMs{32};                         /**< milliseconds per automaton tick */
    int spawnMs{1000};                         /**< milliseconds per session accrual pulse (whole seconds) */
    int targetFps{24};                         /**< redraw cap */
    int maxCatchUpTicks{8};                    /**< ticks run at most per loop iteration after a stall */
    bool flushOnStop{false};                   /**< accrue session time only when the session stops */
    bool braille{true};                        /**< 2×4 braille packing instead of one cell per grain */
};

/** @brief Environment lookup used by parseConfig; returns nullptr for unset variables. */
using EnvLookup = std::function<const char*(const char*)>;

/**
 * @brief Build a config from defaults, @p env (SANDGLASS_QUANTUM, SANDGLASS_MAX_PER_TICK, SANDGLASS_SPAWN_POLICY,
 *        SANDGLASS_SEED, SANDGLASS_PHYSICS_MS, SANDGLASS_SPAWN_MS, SANDGLASS_FPS, SANDGLASS_FLUSH_ON_STOP,
 *        SANDGLASS_BRAILLE) and @p argv. Invalid values are logged at warn level and ignored.
 * @param warnings optional sink collecting one message per rejected value.
 */
EngineConfig parseConfig(int argc, const char* const* argv, const EnvLookup& env,
                         std::vector<std::string>* warnings = nullptr);

/** @brief parseConfig using the process environment. */
EngineConfig loadConfig(int argc, const char* const* argv);

/** @brief One-line summary for the log. */
std::string describeConfig(const EngineConfig& cfg);
