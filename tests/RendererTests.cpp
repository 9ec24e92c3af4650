/**
 * @file RendererTests.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Renderer.h"
#include <gtest/gtest.h>

class RendererTest : public ::testing::Test {
protected:
    CategoryTable table;
    CategoryId work;
    CategoryId play;

    void SetUp() override {
        work = *table.add("work", "", 3);
        play = *table.add("play", "", 9);
    }
};

TEST_F(RendererTest, ResolvesLiveOrphanAndEmptyCells) {
    EXPECT_EQ(Renderer::resolveColor(Cell::empty(), table), kBackgroundColorIndex);
    EXPECT_EQ(Renderer::resolveColor(Cell::grain(work), table), 3);
    EXPECT_EQ(Renderer::resolveColor(Cell::grain(CategoryId(500)), table), kFallbackColorIndex);
    EXPECT_EQ(Renderer::resolveColor(Cell{true, std::nullopt}, table), kFallbackColorIndex);
    EXPECT_EQ(Renderer::resolveColor(Cell::grain(kNoneCategoryId), table), kFallbackColorIndex);
}

TEST_F(RendererTest, OneCellPerGrain) {
    Grid grid(3, 2);
    grid.set(0, 1, Cell::grain(work));
    grid.set(2, 1, Cell::grain(play));

    Frame f = Renderer::render(grid, table);
    ASSERT_EQ(f.width, 3);
    ASSERT_EQ(f.height, 2);
    EXPECT_EQ(f.at(0, 1), (FrameCell{Renderer::kGrainGlyph, 3}));
    EXPECT_EQ(f.at(2, 1), (FrameCell{Renderer::kGrainGlyph, 9}));
    EXPECT_EQ(f.at(1, 1), FrameCell());
    EXPECT_EQ(f.at(0, 0).glyph, U' ');
    EXPECT_THROW(f.at(3, 0), OutOfBounds);
}

TEST_F(RendererTest, ReorderKeepsFrameIdentical) {
    Grid grid(2, 2);
    grid.set(0, 1, Cell::grain(work));
    grid.set(1, 1, Cell::grain(play));

    Frame before = Renderer::render(grid, table);
    ASSERT_TRUE(table.moveDown(1));
    Frame after = Renderer::render(grid, table);
    EXPECT_EQ(before.cells, after.cells);
}

TEST_F(RendererTest, RecolorAppliesToExistingGrains) {
    Grid grid(1, 1);
    grid.set(0, 0, Cell::grain(work));
    ASSERT_TRUE(table.setColorIndex(work, 0));
    EXPECT_EQ(Renderer::render(grid, table).at(0, 0).colorIndex, 0);
}

TEST_F(RendererTest, DeletedCategoryRendersFallback) {
    Grid grid(1, 1);
    grid.set(0, 0, Cell::grain(play));
    ASSERT_TRUE(table.remove(play));
    EXPECT_EQ(Renderer::render(grid, table).at(0, 0).colorIndex, kFallbackColorIndex);
    EXPECT_EQ(grid.get(0, 0), Cell::grain(play));
}

TEST_F(RendererTest, FrameIsIndependentOfLaterGridChanges) {
    Grid grid(2, 1);
    grid.set(1, 0, Cell::grain(work));
    Frame f = Renderer::render(grid, table);
    grid.clear();
    EXPECT_EQ(f.at(1, 0).glyph, Renderer::kGrainGlyph);
    EXPECT_EQ(f.at(1, 0).colorIndex, 3);
}

TEST_F(RendererTest, BrailleBitLayout) {
    EXPECT_EQ(Renderer::brailleBit(0, 0), 0x01u);
    EXPECT_EQ(Renderer::brailleBit(0, 1), 0x02u);
    EXPECT_EQ(Renderer::brailleBit(0, 2), 0x04u);
    EXPECT_EQ(Renderer::brailleBit(1, 0), 0x08u);
    EXPECT_EQ(Renderer::brailleBit(1, 1), 0x10u);
    EXPECT_EQ(Renderer::brailleBit(1, 2), 0x20u);
    EXPECT_EQ(Renderer::brailleBit(0, 3), 0x40u);
    EXPECT_EQ(Renderer::brailleBit(1, 3), 0x80u);
    EXPECT_EQ(Renderer::brailleBit(2, 0), 0u);
}

TEST_F(RendererTest, BrailleFrameSizeRoundsUp) {
    Grid grid(3, 5);
    Frame f = Renderer::renderBraille(grid, table);
    EXPECT_EQ(f.width, 2);
    EXPECT_EQ(f.height, 2);
    for (const auto& c : f.cells) {
        EXPECT_EQ(c.glyph, Renderer::kBrailleBase);
        EXPECT_EQ(c.colorIndex, kBackgroundColorIndex);
    }
}

TEST_F(RendererTest, BraillePacksDots) {
    Grid full(2, 4);
    for (int y = 0; y < 4; ++y)
        for (int x = 0; x < 2; ++x) full.set(x, y, Cell::grain(work));
    EXPECT_EQ(Renderer::renderBraille(full, table).at(0, 0).glyph, U'\u28FF');

    Grid single(2, 4);
    single.set(1, 3, Cell::grain(work));
    Frame f = Renderer::renderBraille(single, table);
    EXPECT_EQ(f.at(0, 0).glyph, U'\u2880');
    EXPECT_EQ(f.at(0, 0).colorIndex, 3);
}

TEST_F(RendererTest, BrailleColorIsDominantCategory) {
    Grid grid(2, 4);
    grid.set(0, 3, Cell::grain(work));
    grid.set(1, 3, Cell::grain(play));
    grid.set(1, 2, Cell::grain(play));
    grid.set(0, 2, Cell::grain(play));
    EXPECT_EQ(Renderer::renderBraille(grid, table).at(0, 0).colorIndex, 9);
}

TEST_F(RendererTest, BrailleTieGoesToSmallerId) {
    ASSERT_LT(work, play);
    Grid grid(2, 4);
    grid.set(0, 3, Cell::grain(play));
    grid.set(1, 3, Cell::grain(play));
    grid.set(0, 2, Cell::grain(work));
    grid.set(1, 2, Cell::grain(work));
    EXPECT_EQ(Renderer::renderBraille(grid, table).at(0, 0).colorIndex, 3);
}

TEST_F(RendererTest, BrailleFallbackVotes) {
    Grid tie(2, 4);
    tie.set(0, 3, Cell::grain(work));
    tie.set(1, 3, Cell::grain(CategoryId(404)));
    EXPECT_EQ(Renderer::renderBraille(tie, table).at(0, 0).colorIndex, 3);

    Grid orphans(2, 4);
    orphans.set(0, 3, Cell::grain(work));
    orphans.set(1, 3, Cell::grain(CategoryId(404)));
    orphans.set(1, 2, Cell{true, std::nullopt});
    EXPECT_EQ(Renderer::renderBraille(orphans, table).at(0, 0).colorIndex, kFallbackColorIndex);
}
