/**
 * @file Renderer.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Renderer.h"

#include <map>

const FrameCell& Frame::at(int x, int y) const {
    if (x < 0 || y < 0 || x >= width || y >= height) throw OutOfBounds(x, y, width, height);
    return cells[static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)];
}

FrameCell& Frame::at(int x, int y) {
    if (x < 0 || y < 0 || x >= width || y >= height) throw OutOfBounds(x, y, width, height);
    return cells[static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)];
}

int Renderer::resolveColor(const Cell& cell, const CategoryTable& table) {
    if (!cell.occupied) return kBackgroundColorIndex;
    if (!cell.category) return kFallbackColorIndex;
    return table.colorFor(*cell.category);
}

Frame Renderer::render(const Grid& grid, const CategoryTable& table) {
    Frame f(grid.width(), grid.height());
    for (int y = 0; y < grid.height(); ++y) {
        for (int x = 0; x < grid.width(); ++x) {
            const Cell& c = grid.get(x, y);
            FrameCell& out = f.at(x, y);
            out.colorIndex = resolveColor(c, table);
            out.glyph = c.occupied ? kGrainGlyph : U' ';
        }
    }
    return f;
}

unsigned Renderer::brailleBit(int dx, int dy) {
    // Dots 1-3 and 4-6 run down the two columns; dots 7 and 8 sit in the bottom row.
    static const unsigned bits[kDotWidth][kDotHeight] = {
        {0x01, 0x02, 0x04, 0x40},
        {0x08, 0x10, 0x20, 0x80},
    };
    if (dx < 0 || dx >= kDotWidth || dy < 0 || dy >= kDotHeight) return 0;
    return bits[dx][dy];
}

Frame Renderer::renderBraille(const Grid& grid, const CategoryTable& table) {
    const int fw = (grid.width() + kDotWidth - 1) / kDotWidth;
    const int fh = (grid.height() + kDotHeight - 1) / kDotHeight;
    Frame f(fw, fh);
    std::map<CategoryId, int> votes;
    for (int cy = 0; cy < fh; ++cy) {
        for (int cx = 0; cx < fw; ++cx) {
            unsigned dots = 0;
            int fallbackVotes = 0;
            votes.clear();
            for (int dy = 0; dy < kDotHeight; ++dy) {
                for (int dx = 0; dx < kDotWidth; ++dx) {
                    const int gx = cx * kDotWidth + dx;
                    const int gy = cy * kDotHeight + dy;
                    if (!grid.inBounds(gx, gy)) continue;
                    const Cell& c = grid.get(gx, gy);
                    if (!c.occupied) continue;
                    dots |= brailleBit(dx, dy);
                    if (c.category && table.find(*c.category)) ++votes[*c.category];
                    else ++fallbackVotes;
                }
            }

            FrameCell& out = f.at(cx, cy);
            out.glyph = kBrailleBase + dots;
            if (dots == 0) {
                out.colorIndex = kBackgroundColorIndex;
                continue;
            }
            // std::map iterates in id order, so the first strict maximum is the smallest id on ties.
            int best = 0;
            CategoryId bestId;
            for (const auto& v : votes) {
                if (v.second > best) { best = v.second; bestId = v.first; }
            }
            out.colorIndex = (best > 0 && best >= fallbackVotes) ? table.colorFor(bestId) : kFallbackColorIndex;
        }
    }
    return f;
}
