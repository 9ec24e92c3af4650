/**
 * @file SandEngine.h
 * @brief Declares SandEngine: owner of the grid, the pending-grain queue, the tick procedure and the PRNG state.
 *
 * The host drives it once per frame (addElapsed / tick / render) from a single thread. Operations either apply
 * completely or throw before changing anything; in particular resize() builds the new grid off to the side and
 * swaps it in only when it is complete.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "AutomatonStep.h"
#include "Category.h"
#include "EngineConfig.h"
#include "GrainSpawner.h"
#include "Grid.h"
#include "Renderer.h"

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

/** @brief Historical tracked time for one category, used to pre-populate the pile. */
struct CategoryTotal {
    CategoryId id;
    std::uint64_t seconds{0};
};

/**
 * @class SandEngine
 * @brief Facade over Grid, GrainSpawner and AutomatonStep.
 */
class SandEngine {
public:
    /** @brief Construct an empty @p width × @p height pile; throws DegenerateResize. */
    SandEngine(int width, int height, const EngineConfig& cfg = EngineConfig());

    int width() const { return grid_.width(); }
    int height() const { return grid_.height(); }
    const Grid& grid() const { return grid_; }
    const GrainSpawner& spawner() const { return spawner_; }
    std::uint64_t tickCount() const { return ticks; }

    // Input from the session layer
    /** @brief Add tracked seconds for @p id; returns grains queued as a result. */
    size_t addElapsed(CategoryId id, std::uint64_t seconds);
    /** @brief Queue @p count grains for @p id directly. */
    void addGrains(CategoryId id, size_t count);
    /**
     * @brief Accrue historical totals and settle the resulting grains immediately, in the given order.
     * @return grains placed; grains that did not fit stay queued.
     */
    size_t seedFromTotals(const std::vector<CategoryTotal>& totals);

    // Input from the host loop
    /** @brief Advance one tick. */
    TickStats tick();
    /** @brief Replace the PRNG state with a fresh seed. */
    void reseedRandom(std::uint32_t seed);
    /** @brief Rebuild the grid at a new size (see GridResize.h); throws DegenerateResize and keeps the old grid. */
    void resize(int newWidth, int newHeight);
    /** @brief Empty the grid and drop pending grains. */
    void clear();
    /** @brief Remove one category's grains from the grid and the queue; returns grid cells freed. */
    size_t clearCategory(CategoryId id);

    // Output to the host
    Frame render(const CategoryTable& table) const;
    Frame renderBraille(const CategoryTable& table) const;
    Occupancy occupancy() const { return grid_.occupancy(); }
    /** @brief True when the last tick moved nothing and no grains are pending. */
    bool isSettled() const { return lastMoved == 0 && spawner_.empty(); }
    const TickStats& lastTick() const { return last; }

private:
    Grid grid_;
    GrainSpawner spawner_;
    AutomatonStep stepper;
    std::mt19937 prng;
    std::uint64_t ticks{0};
    size_t lastMoved{0};
    TickStats last{};
};
