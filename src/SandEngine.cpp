/**
 * @file SandEngine.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SandEngine.h"
#include "GridResize.h"
#include "Logger.h"

#include <string>
#include <utility>

namespace {
std::uint32_t effectiveSeed(std::uint32_t seed) {
    if (seed != 0) return seed;
    std::random_device rd;
    return rd();
}
}

SandEngine::SandEngine(int width, int height, const EngineConfig& cfg)
    : grid_(width, height),
      spawner_(cfg.quantumSeconds),
      stepper(cfg.maxPerTick, cfg.spawnPolicy),
      prng(effectiveSeed(cfg.seed)) {
    Logger::info("SandEngine: " + std::to_string(width) + "x" + std::to_string(height) +
                 " policy=" + spawnPolicyName(cfg.spawnPolicy));
}

size_t SandEngine::addElapsed(CategoryId id, std::uint64_t seconds) {
    return spawner_.accrue(id, seconds);
}

void SandEngine::addGrains(CategoryId id, size_t count) {
    spawner_.enqueue(id, count);
}

size_t SandEngine::seedFromTotals(const std::vector<CategoryTotal>& totals) {
    for (const auto& t : totals) spawner_.accrue(t.id, t.seconds);

    size_t placed = 0;
    std::vector<Grain> all = spawner_.drain(spawner_.pending());
    std::vector<Grain> leftover;
    for (const auto& g : all) {
        if (stepper.dropToRest(grid_, g, prng)) ++placed;
        else leftover.push_back(g);
    }
    if (!leftover.empty()) spawner_.requeueFront(leftover);
    Logger::info("SandEngine::seedFromTotals: placed=" + std::to_string(placed) +
                 " queued=" + std::to_string(leftover.size()));
    return placed;
}

TickStats SandEngine::tick() {
    last = stepper.step(grid_, spawner_, prng);
    lastMoved = last.moved;
    ++ticks;
    if (last.held > 0) {
        Logger::debug("tick " + std::to_string(ticks) + ": held " + std::to_string(last.held) +
                      " grains, spawn row blocked");
    }
    return last;
}

void SandEngine::reseedRandom(std::uint32_t seed) {
    prng.seed(seed);
}

void SandEngine::resize(int newWidth, int newHeight) {
    size_t discarded = 0;
    // remapGrid throws before anything here changes.
    Grid next = remapGrid(grid_, newWidth, newHeight, discarded);
    const int oldW = grid_.width();
    const int oldH = grid_.height();
    grid_ = std::move(next);
    stepper.resetCursor();
    lastMoved = 1; // migrated grains may be floating until the next tick
    Logger::info("SandEngine::resize: " + std::to_string(oldW) + "x" + std::to_string(oldH) + " -> " +
                 std::to_string(newWidth) + "x" + std::to_string(newHeight) +
                 " discarded=" + std::to_string(discarded));
}

void SandEngine::clear() {
    grid_.clear();
    spawner_.clearPending();
    stepper.resetCursor();
    lastMoved = 0;
    Logger::info("SandEngine::clear");
}

size_t SandEngine::clearCategory(CategoryId id) {
    size_t removed = grid_.clearCategory(id);
    size_t dropped = spawner_.discardPending(id);
    if (removed > 0) lastMoved = 1;
    Logger::info("SandEngine::clearCategory: id=" + std::to_string(id.value) +
                 " removed=" + std::to_string(removed) + " dropped=" + std::to_string(dropped));
    return removed;
}

Frame SandEngine::render(const CategoryTable& table) const {
    return Renderer::render(grid_, table);
}

Frame SandEngine::renderBraille(const CategoryTable& table) const {
    return Renderer::renderBraille(grid_, table);
}
