/**
 * @file GrainSpawnerTests.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "GrainSpawner.h"
#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

namespace {
const CategoryId kA{1};
const CategoryId kB{2};
const CategoryId kC{3};
}

TEST(GrainSpawnerTest, ZeroQuantumIsRejected) {
    EXPECT_THROW(GrainSpawner(0), std::invalid_argument);
}

TEST(GrainSpawnerTest, AccrueReturnsFreshGrains) {
    GrainSpawner s(5);
    EXPECT_EQ(s.accrue(kA, 4), 0u);
    EXPECT_EQ(s.accrue(kA, 1), 1u);
    EXPECT_EQ(s.accrue(kA, 12), 2u);
    EXPECT_EQ(s.elapsedSeconds(kA), 17u);
    EXPECT_EQ(s.timeDerivedGrains(kA), 3u);
    EXPECT_EQ(s.pending(), 3u);
}

TEST(GrainSpawnerTest, GrainCountIsIndependentOfBatching) {
    GrainSpawner once(7), perSecond(7), mixed(7);

    once.accrue(kA, 100);
    for (int i = 0; i < 100; ++i) perSecond.accrue(kA, 1);
    for (std::uint64_t part : {3u, 50u, 0u, 47u}) mixed.accrue(kA, part);

    for (const GrainSpawner* s : {&once, &perSecond, &mixed}) {
        EXPECT_EQ(s->timeDerivedGrains(kA), 14u);
        EXPECT_EQ(s->pendingFor(kA), 14u);
        EXPECT_EQ(s->elapsedSeconds(kA), 100u);
    }
}

TEST(GrainSpawnerTest, LedgersAreKeptPerCategory) {
    GrainSpawner s(2);
    s.accrue(kA, 3);
    s.accrue(kB, 3);
    s.accrue(kA, 1);
    EXPECT_EQ(s.timeDerivedGrains(kA), 2u);
    EXPECT_EQ(s.timeDerivedGrains(kB), 1u);
    EXPECT_EQ(s.timeDerivedGrains(kC), 0u);
}

TEST(GrainSpawnerTest, DrainIsFifoAndBounded) {
    GrainSpawner s;
    s.enqueue(kA, 2);
    s.enqueue(kB, 1);

    auto first = s.drain(2);
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].category, kA);
    EXPECT_EQ(first[1].category, kA);

    auto rest = s.drain(5);
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0].category, kB);
    EXPECT_TRUE(s.empty());
    EXPECT_TRUE(s.drain(3).empty());
}

TEST(GrainSpawnerTest, RequeuedGrainsComeOutFirstInOrder) {
    GrainSpawner s;
    s.enqueue(kA, 1);
    s.enqueue(kB, 1);
    auto held = s.drain(2);
    s.enqueue(kC, 1);
    s.requeueFront(held);

    auto out = s.drain(3);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].category, kA);
    EXPECT_EQ(out[1].category, kB);
    EXPECT_EQ(out[2].category, kC);
}

TEST(GrainSpawnerTest, DiscardAndClearKeepLedger) {
    GrainSpawner s;
    s.enqueue(kA, 3);
    s.accrue(kB, 2);
    EXPECT_EQ(s.pendingFor(kA), 3u);

    EXPECT_EQ(s.discardPending(kA), 3u);
    EXPECT_EQ(s.pending(), 2u);
    EXPECT_EQ(s.totalEnqueued(kA), 3u);

    s.clearPending();
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.totalEnqueued(kB), 2u);
    EXPECT_EQ(s.accrue(kB, 1), 1u);
}

TEST(GrainSpawnerTest, TotalCountsTimeAndExplicitGrains) {
    GrainSpawner s(10);
    s.accrue(kA, 25);
    s.enqueue(kA, 4);
    s.enqueue(kA, 0);
    EXPECT_EQ(s.totalEnqueued(kA), 6u);
    EXPECT_EQ(s.timeDerivedGrains(kA), 2u);
}
