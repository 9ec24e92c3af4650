/**
 * @file AutomatonStep.cpp
 * @brief Spawn and fall phases of the sand automaton.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "AutomatonStep.h"

#include <algorithm>
#include <cctype>

const char* spawnPolicyName(SpawnPolicy p) {
    switch (p) {
        case SpawnPolicy::RoundRobin: return "round-robin";
        case SpawnPolicy::FixedPerCategory: return "fixed";
        case SpawnPolicy::Random: return "random";
    }
    return "round-robin";
}

std::optional<SpawnPolicy> parseSpawnPolicy(const std::string& text) {
    std::string v(text);
    for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "round-robin" || v == "roundrobin" || v == "rr") return SpawnPolicy::RoundRobin;
    if (v == "fixed" || v == "fixed-per-category") return SpawnPolicy::FixedPerCategory;
    if (v == "random") return SpawnPolicy::Random;
    return std::nullopt;
}

AutomatonStep::AutomatonStep(size_t maxPerTick, SpawnPolicy policy)
    : perTick(maxPerTick), spawnPolicy(policy) {}

int AutomatonStep::fixedColumnFor(CategoryId id, int width) {
    if (width <= 0) return 0;
    // Fibonacci hashing spreads consecutive ids across the width.
    std::uint64_t hv = (id.value + 1) * 0x9E3779B97F4A7C15ULL;
    return static_cast<int>((hv >> 32) % static_cast<std::uint64_t>(width));
}

bool AutomatonStep::fallTarget(const Grid& grid, int x, int y, std::mt19937& rng, int& nx) {
    const int below = y + 1;
    if (below >= grid.height()) return false;
    if (grid.isEmpty(x, below)) {
        nx = x;
        return true;
    }
    const bool left = grid.isEmpty(x - 1, below);
    const bool right = grid.isEmpty(x + 1, below);
    if (left && right) {
        nx = (rng() & 1u) ? x + 1 : x - 1;
        return true;
    }
    if (left) { nx = x - 1; return true; }
    if (right) { nx = x + 1; return true; }
    return false;
}

std::optional<int> AutomatonStep::chooseColumn(const Grid& grid, CategoryId id, std::mt19937& rng) {
    const int w = grid.width();
    switch (spawnPolicy) {
        case SpawnPolicy::RoundRobin: {
            int start = rrCursor < 0 ? w / 2 : rrCursor % w;
            for (int i = 0; i < w; ++i) {
                int c = (start + i) % w;
                if (grid.isEmpty(c, 0)) {
                    rrCursor = (c + 1) % w;
                    return c;
                }
            }
            return std::nullopt;
        }
        case SpawnPolicy::FixedPerCategory: {
            int c = fixedColumnFor(id, w);
            if (grid.isEmpty(c, 0)) return c;
            return std::nullopt;
        }
        case SpawnPolicy::Random: {
            for (int attempt = 0; attempt < 2; ++attempt) {
                int c = static_cast<int>(rng() % static_cast<std::uint32_t>(w));
                if (grid.isEmpty(c, 0)) return c;
            }
            return std::nullopt;
        }
    }
    return std::nullopt;
}

size_t AutomatonStep::spawnPhase(Grid& grid, GrainSpawner& spawner, std::mt19937& rng, size_t& held) {
    held = 0;
    if (perTick == 0 || spawner.empty()) return 0;
    std::vector<Grain> batch = spawner.drain(perTick);
    std::vector<Grain> blocked;
    size_t placed = 0;
    for (const auto& g : batch) {
        auto col = chooseColumn(grid, g.category, rng);
        if (!col) {
            blocked.push_back(g);
            continue;
        }
        grid.set(*col, 0, Cell::grain(g.category));
        ++placed;
    }
    if (!blocked.empty()) {
        held = blocked.size();
        spawner.requeueFront(blocked);
    }
    return placed;
}

size_t AutomatonStep::fallPhase(Grid& grid, std::mt19937& rng) {
    const int w = grid.width();
    const int h = grid.height();
    moved.assign(grid.capacity(), 0);
    size_t count = 0;
    // Bottom-to-top: a grain that moves lands in a row that has already been scanned.
    for (int y = h - 2; y >= 0; --y) {
        for (int x = 0; x < w; ++x) {
            const size_t i = static_cast<size_t>(y) * static_cast<size_t>(w) + static_cast<size_t>(x);
            if (moved[i] || grid.isEmpty(x, y)) continue;
            int nx = x;
            if (!fallTarget(grid, x, y, rng, nx)) continue;
            grid.move(x, y, nx, y + 1);
            moved[static_cast<size_t>(y + 1) * static_cast<size_t>(w) + static_cast<size_t>(nx)] = 1;
            ++count;
        }
    }
    return count;
}

TickStats AutomatonStep::step(Grid& grid, GrainSpawner& spawner, std::mt19937& rng) {
    TickStats stats;
    stats.spawned = spawnPhase(grid, spawner, rng, stats.held);
    stats.moved = fallPhase(grid, rng);
    return stats;
}

bool AutomatonStep::dropToRest(Grid& grid, const Grain& grain, std::mt19937& rng) {
    auto col = chooseColumn(grid, grain.category, rng);
    if (!col) return false;
    int x = *col;
    int y = 0;
    grid.set(x, y, Cell::grain(grain.category));
    int nx = x;
    while (fallTarget(grid, x, y, rng, nx)) {
        grid.move(x, y, nx, y + 1);
        x = nx;
        ++y;
    }
    return true;
}
