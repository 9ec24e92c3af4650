/**
 * @file SandEngineTests.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SandEngine.h"
#include <gtest/gtest.h>

namespace {
const CategoryId kA{1};
const CategoryId kB{2};

EngineConfig seeded(std::uint32_t seed, SpawnPolicy policy = SpawnPolicy::RoundRobin) {
    EngineConfig cfg;
    cfg.seed = seed;
    cfg.spawnPolicy = policy;
    return cfg;
}

void runUntilSettled(SandEngine& engine, int limit = 500) {
    for (int i = 0; i < limit; ++i) {
        engine.tick();
        if (engine.isSettled()) return;
    }
}
}

TEST(SandEngineTest, RejectsDegenerateSize) {
    EXPECT_THROW(SandEngine(0, 5), DegenerateResize);
    EXPECT_THROW(SandEngine(5, -1), DegenerateResize);
}

TEST(SandEngineTest, ElapsedTimeBecomesGrainsPerQuantum) {
    EngineConfig cfg = seeded(1);
    cfg.quantumSeconds = 60;
    SandEngine engine(8, 6, cfg);
    EXPECT_EQ(engine.addElapsed(kA, 59), 0u);
    EXPECT_EQ(engine.addElapsed(kA, 1), 1u);
    EXPECT_EQ(engine.addElapsed(kA, 600), 10u);
    EXPECT_EQ(engine.spawner().pending(), 11u);
}

TEST(SandEngineTest, TicksSettleThePile) {
    SandEngine engine(10, 5, seeded(3));
    engine.addElapsed(kA, 6);
    engine.addGrains(kB, 4);
    EXPECT_FALSE(engine.isSettled());

    runUntilSettled(engine);
    EXPECT_TRUE(engine.isSettled());
    EXPECT_EQ(engine.occupancy().total, 10u);
    EXPECT_EQ(engine.occupancy().count(kA), 6u);
    EXPECT_EQ(engine.occupancy().count(kB), 4u);
    EXPECT_GT(engine.tickCount(), 0u);
    EXPECT_EQ(engine.lastTick().moved, 0u);
}

TEST(SandEngineTest, OccupancyNeverExceedsEnqueued) {
    SandEngine engine(4, 3, seeded(5));
    engine.addElapsed(kA, 20);
    engine.addGrains(kB, 20);
    for (int i = 0; i < 80; ++i) {
        engine.tick();
        const Occupancy occ = engine.occupancy();
        EXPECT_LE(occ.count(kA), engine.spawner().totalEnqueued(kA));
        EXPECT_LE(occ.count(kB), engine.spawner().totalEnqueued(kB));
        EXPECT_LE(occ.total, engine.grid().capacity());
    }
}

TEST(SandEngineTest, SeedFromTotalsPlacesGrainsAtRest) {
    SandEngine engine(10, 5, seeded(7));
    const size_t placed = engine.seedFromTotals({{kA, 5}, {kB, 3}});
    EXPECT_EQ(placed, 8u);
    EXPECT_EQ(engine.occupancy().count(kA), 5u);
    EXPECT_EQ(engine.occupancy().count(kB), 3u);
    EXPECT_TRUE(engine.spawner().empty());
    EXPECT_TRUE(engine.isSettled());
    EXPECT_EQ(engine.tick().moved, 0u);
}

TEST(SandEngineTest, SeedFromTotalsQueuesWhatDoesNotFit) {
    SandEngine engine(2, 2, seeded(7));
    EXPECT_EQ(engine.seedFromTotals({{kA, 10}}), 4u);
    EXPECT_EQ(engine.occupancy().total, 4u);
    EXPECT_EQ(engine.spawner().pending(), 6u);
    EXPECT_EQ(engine.spawner().timeDerivedGrains(kA), 10u);
}

TEST(SandEngineTest, FailedResizeKeepsGrid) {
    SandEngine engine(6, 4, seeded(11));
    engine.seedFromTotals({{kA, 7}});
    const Grid before = engine.grid();

    EXPECT_THROW(engine.resize(0, 4), DegenerateResize);
    EXPECT_THROW(engine.resize(6, 0), DegenerateResize);
    EXPECT_EQ(engine.grid(), before);
    EXPECT_EQ(engine.width(), 6);
    EXPECT_EQ(engine.height(), 4);
}

TEST(SandEngineTest, ResizeMigratesGrains) {
    SandEngine engine(6, 4, seeded(11));
    engine.seedFromTotals({{kA, 7}, {kB, 2}});
    const size_t total = engine.occupancy().total;

    engine.resize(12, 8);
    EXPECT_EQ(engine.width(), 12);
    EXPECT_EQ(engine.height(), 8);
    EXPECT_EQ(engine.occupancy().total, total);
    EXPECT_FALSE(engine.isSettled());

    engine.resize(1, 1);
    EXPECT_EQ(engine.occupancy().total, 1u);
    engine.tick();
    EXPECT_EQ(engine.occupancy().total, 1u);
}

TEST(SandEngineTest, ClearEmptiesGridAndQueue) {
    SandEngine engine(5, 5, seeded(2));
    engine.seedFromTotals({{kA, 4}});
    engine.addGrains(kB, 3);

    engine.clear();
    EXPECT_EQ(engine.occupancy().total, 0u);
    EXPECT_TRUE(engine.spawner().empty());
    EXPECT_TRUE(engine.isSettled());
}

TEST(SandEngineTest, ClearCategoryRemovesGridAndQueuedGrains) {
    SandEngine engine(5, 5, seeded(2));
    engine.seedFromTotals({{kA, 3}, {kB, 2}});
    engine.addGrains(kA, 4);
    engine.addGrains(kB, 1);

    EXPECT_EQ(engine.clearCategory(kA), 3u);
    EXPECT_EQ(engine.occupancy().count(kA), 0u);
    EXPECT_EQ(engine.occupancy().count(kB), 2u);
    EXPECT_EQ(engine.spawner().pendingFor(kA), 0u);
    EXPECT_EQ(engine.spawner().pendingFor(kB), 1u);
}

TEST(SandEngineTest, SameSeedSameHistory) {
    SandEngine a(9, 6, seeded(31, SpawnPolicy::Random));
    SandEngine b(9, 6, seeded(31, SpawnPolicy::Random));
    for (int i = 0; i < 40; ++i) {
        a.addElapsed(kA, 1);
        b.addElapsed(kA, 1);
        if (i % 3 == 0) {
            a.addGrains(kB, 1);
            b.addGrains(kB, 1);
        }
        a.tick();
        b.tick();
    }
    EXPECT_EQ(a.grid(), b.grid());

    a.reseedRandom(5);
    b.reseedRandom(5);
    a.addGrains(kA, 12);
    b.addGrains(kA, 12);
    for (int i = 0; i < 30; ++i) {
        a.tick();
        b.tick();
    }
    EXPECT_EQ(a.grid(), b.grid());
}

TEST(SandEngineTest, RenderMatchesGridSize) {
    SandEngine engine(7, 9, seeded(4));
    CategoryTable table;
    EXPECT_EQ(engine.render(table).width, 7);
    EXPECT_EQ(engine.render(table).height, 9);
    Frame braille = engine.renderBraille(table);
    EXPECT_EQ(braille.width, 4);
    EXPECT_EQ(braille.height, 3);
}
