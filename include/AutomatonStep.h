/**
 * @file AutomatonStep.h
 * @brief Declares AutomatonStep: one deterministic tick of the falling-sand automaton.
 *
 * A tick is a spawn phase (drain up to maxPerTick grains into the top row) followed by a fall phase
 * (bottom-to-top, left-to-right scan; straight down, else a free diagonal, else stay). The only
 * randomness comes from the std::mt19937 passed in by the caller, so equal inputs give equal grids.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Grid.h"
#include "GrainSpawner.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

/** @brief How the spawn phase picks a top-row column for each grain. */
enum class SpawnPolicy {
    RoundRobin,       /**< next free top-row cell after a cursor that starts at the center */
    FixedPerCategory, /**< one hashed column per category id */
    Random            /**< a column drawn from the tick PRNG, with one retry */
};

const char* spawnPolicyName(SpawnPolicy p);
/** @brief Parse "round-robin", "fixed" or "random" (case-insensitive). */
std::optional<SpawnPolicy> parseSpawnPolicy(const std::string& text);

/** @brief Counters for a single tick. */
struct TickStats {
    size_t spawned{0}; /**< grains placed in the top row */
    size_t held{0};    /**< grains returned to the queue because their column was blocked */
    size_t moved{0};   /**< grains that fell straight or diagonally */
};

/**
 * @class AutomatonStep
 * @brief Tick procedure plus the small amount of state it carries between ticks (the round-robin cursor
 *        and a reusable moved-this-tick map).
 */
class AutomatonStep {
public:
    explicit AutomatonStep(size_t maxPerTick = 8, SpawnPolicy policy = SpawnPolicy::RoundRobin);

    size_t maxPerTick() const { return perTick; }
    SpawnPolicy policy() const { return spawnPolicy; }

    /** @brief Run one tick: spawn phase then fall phase. */
    TickStats step(Grid& grid, GrainSpawner& spawner, std::mt19937& rng);

    /** @brief Place up to maxPerTick queued grains in the top row; blocked grains go back to the queue front. */
    size_t spawnPhase(Grid& grid, GrainSpawner& spawner, std::mt19937& rng, size_t& held);
    /** @brief Move every grain at most once, scanning bottom-to-top. Returns the number of moves. */
    size_t fallPhase(Grid& grid, std::mt19937& rng);

    /**
     * @brief Place @p grain at its spawn column and let it fall until it rests, in one call.
     * @return false if no spawn column was free; the grid is then unchanged.
     */
    bool dropToRest(Grid& grid, const Grain& grain, std::mt19937& rng);

    /** @brief Re-center the round-robin cursor (used after resize and clear). */
    void resetCursor() { rrCursor = -1; }

    /** @brief Column used by FixedPerCategory for @p id in a grid @p width wide. */
    static int fixedColumnFor(CategoryId id, int width);

    /**
     * @brief Fall rule for the grain at (x,y): straight down, else a free diagonal (coin flip when both are
     *        free), else none. Out-of-grid diagonals count as blocked.
     * @return true and the destination column in @p nx when the grain can move to row y+1.
     */
    static bool fallTarget(const Grid& grid, int x, int y, std::mt19937& rng, int& nx);

private:
    std::optional<int> chooseColumn(const Grid& grid, CategoryId id, std::mt19937& rng);

    size_t perTick;
    SpawnPolicy spawnPolicy;
    int rrCursor{-1};            /**< next round-robin column; -1 = center */
    std::vector<std::uint8_t> moved; /**< 1 for cells that received a grain this tick */
};
