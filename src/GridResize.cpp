/**
 * @file GridResize.cpp
 * @brief Floor-anchored, center-out grid migration.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "GridResize.h"

#include <algorithm>
#include <cstdint>
#include <cstdlib>

namespace {
/** @brief Lowest empty row in column @p x, or -1 if the column is full. */
int lowestFreeRow(const Grid& g, int x) {
    for (int y = g.height() - 1; y >= 0; --y) {
        if (g.isEmpty(x, y)) return y;
    }
    return -1;
}
}

std::vector<int> centerOutColumns(int width) {
    std::vector<int> cols(static_cast<size_t>(std::max(0, width)));
    for (int i = 0; i < width; ++i) cols[static_cast<size_t>(i)] = i;
    // Distance from center in half-columns keeps the comparison integral for odd and even widths.
    std::stable_sort(cols.begin(), cols.end(), [width](int a, int b) {
        return std::abs(2 * a + 1 - width) < std::abs(2 * b + 1 - width);
    });
    return cols;
}

Grid remapGrid(const Grid& old, int newWidth, int newHeight) {
    size_t discarded = 0;
    return remapGrid(old, newWidth, newHeight, discarded);
}

Grid remapGrid(const Grid& old, int newWidth, int newHeight, size_t& discarded) {
    discarded = 0;
    if (newWidth <= 0 || newHeight <= 0) throw DegenerateResize(newWidth, newHeight);

    const int oldW = old.width();
    const int oldH = old.height();
    if (oldW == newWidth && oldH == newHeight) return old;

    Grid out(newWidth, newHeight);
    for (int x : centerOutColumns(oldW)) {
        const int nx = static_cast<int>(static_cast<std::int64_t>(x) * newWidth / oldW);
        for (int y = oldH - 1; y >= 0; --y) {
            const Cell& c = old.get(x, y);
            if (!c.occupied) continue;
            const int depth = oldH - 1 - y;
            int ty = newHeight - 1 - depth;
            if (ty < 0 || !out.isEmpty(nx, ty)) ty = lowestFreeRow(out, nx);
            if (ty < 0) {
                ++discarded;
                continue;
            }
            out.set(nx, ty, c);
        }
    }
    return out;
}
