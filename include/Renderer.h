/**
 * @file Renderer.h
 * @brief Declares Frame and Renderer: pure mapping from Grid + CategoryTable to (glyph, colorIndex) cells.
 *
 * Rendering never touches the grid and performs no I/O. A Frame is a value: mutating the grid after
 * rendering never changes a frame already produced.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Category.h"
#include "Grid.h"

#include <cstddef>
#include <vector>

/** @brief One output cell: a Unicode code point and a palette index (kBackgroundColorIndex for empty). */
struct FrameCell {
    char32_t glyph{U' '};
    int colorIndex{kBackgroundColorIndex};

    friend bool operator==(const FrameCell& a, const FrameCell& b) {
        return a.glyph == b.glyph && a.colorIndex == b.colorIndex;
    }
    friend bool operator!=(const FrameCell& a, const FrameCell& b) { return !(a == b); }
};

/**
 * @struct Frame
 * @brief Row-major block of FrameCell sized in terminal cells.
 */
struct Frame {
    int width{0};
    int height{0};
    std::vector<FrameCell> cells;

    Frame() = default;
    Frame(int w, int h) : width(w), height(h), cells(static_cast<size_t>(w) * static_cast<size_t>(h)) {}

    /** @brief Cell at (x,y); throws OutOfBounds. */
    const FrameCell& at(int x, int y) const;
    FrameCell& at(int x, int y);
};

/**
 * @class Renderer
 * @brief Stateless renderers for the two supported layouts.
 */
class Renderer {
public:
    /** @brief Glyph used for a grain in the one-cell-per-grain layout (U+2588 FULL BLOCK). */
    static constexpr char32_t kGrainGlyph = U'\u2588';
    /** @brief Blank braille pattern; braille glyphs are kBrailleBase | dot bits. */
    static constexpr char32_t kBrailleBase = U'\u2800';
    /** @brief Grid cells packed per terminal cell in the braille layout. */
    static constexpr int kDotWidth = 2;
    static constexpr int kDotHeight = 4;

    /** @brief Color for one grid cell: live category color, fallback for orphans/uncategorized, background when empty. */
    static int resolveColor(const Cell& cell, const CategoryTable& table);

    /** @brief One FrameCell per grid cell. */
    static Frame render(const Grid& grid, const CategoryTable& table);

    /**
     * @brief Pack each 2×4 block of grid cells into one braille glyph. The block color is the category with
     *        the most dots (smaller id on ties); orphaned or uncategorized dots count toward the fallback color.
     *        Frame size is ceil(W/2) × ceil(H/4).
     */
    static Frame renderBraille(const Grid& grid, const CategoryTable& table);

    /** @brief Braille bit for the dot at (dx,dy) within a 2×4 block (standard dots 1–8 numbering). */
    static unsigned brailleBit(int dx, int dy);
};
