/**
 * @file Grid.cpp
 * @brief Grid storage, bounds checking and occupancy scans.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Grid.h"
#include "GridResize.h"

namespace {
std::string outOfBoundsMessage(int x, int y, int w, int h) {
    return "cell (" + std::to_string(x) + "," + std::to_string(y) + ") outside " +
           std::to_string(w) + "x" + std::to_string(h) + " grid";
}
}

OutOfBounds::OutOfBounds(int x, int y, int width, int height)
    : std::out_of_range(outOfBoundsMessage(x, y, width, height)), px(x), py(y) {}

DegenerateResize::DegenerateResize(int width, int height)
    : std::invalid_argument("degenerate grid size " + std::to_string(width) + "x" + std::to_string(height)) {}

Grid::Grid(int width, int height) : w(width), h(height) {
    if (width <= 0 || height <= 0) throw DegenerateResize(width, height);
    cells.resize(static_cast<size_t>(width) * static_cast<size_t>(height));
}

void Grid::checkBounds(int x, int y) const {
    if (!inBounds(x, y)) throw OutOfBounds(x, y, w, h);
}

const Cell& Grid::get(int x, int y) const {
    checkBounds(x, y);
    return cells[index(x, y)];
}

void Grid::set(int x, int y, const Cell& cell) {
    checkBounds(x, y);
    Cell& dst = cells[index(x, y)];
    dst = cell;
    if (dst.category) dst.occupied = true;
}

void Grid::move(int x1, int y1, int x2, int y2) {
    checkBounds(x1, y1);
    checkBounds(x2, y2);
    Cell& src = cells[index(x1, y1)];
    cells[index(x2, y2)] = src;
    src = Cell::empty();
}

void Grid::clear() {
    for (auto& c : cells) c = Cell::empty();
}

size_t Grid::clearCategory(CategoryId id) {
    size_t removed = 0;
    for (auto& c : cells) {
        if (c.category && *c.category == id) {
            c = Cell::empty();
            ++removed;
        }
    }
    return removed;
}

Grid Grid::resized(int newWidth, int newHeight) const {
    return remapGrid(*this, newWidth, newHeight);
}

size_t Grid::occupiedCount() const {
    size_t n = 0;
    for (const auto& c : cells) if (c.occupied) ++n;
    return n;
}

Occupancy Grid::occupancy() const {
    Occupancy occ;
    for (const auto& c : cells) {
        if (!c.occupied) continue;
        ++occ.total;
        if (c.category) ++occ.byCategory[*c.category];
        else ++occ.uncategorized;
    }
    return occ;
}
