/**
 * @file Grid.h
 * @brief Declares Cell and Grid: the rectangular cell array the sand automaton runs on.
 *
 * Coordinates are (x,y) with x growing right and y growing down; row 0 is the top (spawn) row and
 * row height()-1 is the floor. Every coordinate access is bounds-checked; automaton code tests
 * edges explicitly through inBounds()/isEmpty() instead of relying on clamping or wrap-around.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Category.h"

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/** @brief Thrown when a coordinate lies outside the current grid dimensions. */
class OutOfBounds : public std::out_of_range {
public:
    OutOfBounds(int x, int y, int width, int height);
    int x() const { return px; }
    int y() const { return py; }

private:
    int px, py;
};

/** @brief Thrown when a grid is created or resized to a width or height <= 0. */
class DegenerateResize : public std::invalid_argument {
public:
    DegenerateResize(int width, int height);
};

/**
 * @struct Cell
 * @brief One grid cell. Invariant: a cell carrying a category is occupied.
 */
struct Cell {
    bool occupied{false};                /**< whether a grain sits here */
    std::optional<CategoryId> category;  /**< owning category, if known */

    /** @brief An empty cell. */
    static Cell empty() { return Cell{}; }
    /** @brief An occupied cell tagged with @p id. */
    static Cell grain(CategoryId id) { return Cell{true, id}; }

    friend bool operator==(const Cell& a, const Cell& b) {
        return a.occupied == b.occupied && a.category == b.category;
    }
    friend bool operator!=(const Cell& a, const Cell& b) { return !(a == b); }
};

/**
 * @struct Occupancy
 * @brief Aggregate grain counts derived by scanning the grid.
 */
struct Occupancy {
    std::map<CategoryId, size_t> byCategory; /**< grains per category id (live or orphaned) */
    size_t uncategorized{0};                 /**< occupied cells with no category */
    size_t total{0};                         /**< all occupied cells */

    /** @brief Count for @p id, 0 when absent. */
    size_t count(CategoryId id) const {
        auto it = byCategory.find(id);
        return it == byCategory.end() ? 0 : it->second;
    }
};

/**
 * @class Grid
 * @brief Owns a W×H array of Cell stored row-major in one vector.
 */
class Grid {
public:
    /** @brief Construct an empty grid; throws DegenerateResize if either dimension is <= 0. */
    Grid(int width, int height);

    int width() const { return w; }
    int height() const { return h; }
    /** @brief Number of cells (W·H). */
    size_t capacity() const { return cells.size(); }

    /** @brief Check if coordinates are within the grid. */
    bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < w && y < h; }
    /** @brief True only for in-bounds, unoccupied cells. */
    bool isEmpty(int x, int y) const { return inBounds(x, y) && !cells[index(x, y)].occupied; }

    /** @brief Read a cell; throws OutOfBounds. */
    const Cell& get(int x, int y) const;
    /** @brief Write a cell; throws OutOfBounds. A cell with a category is stored as occupied. */
    void set(int x, int y, const Cell& cell);
    /** @brief Move the content of (x1,y1) into (x2,y2) and empty the source; both must be in bounds. */
    void move(int x1, int y1, int x2, int y2);

    /** @brief Empty every cell. */
    void clear();
    /** @brief Empty every cell tagged with @p id; returns how many were removed. */
    size_t clearCategory(CategoryId id);

    /** @brief Build a new grid of the given size, migrating grains (see GridResize.h). */
    Grid resized(int newWidth, int newHeight) const;

    /** @brief Count occupied cells. */
    size_t occupiedCount() const;
    /** @brief Per-category counts. */
    Occupancy occupancy() const;

    friend bool operator==(const Grid& a, const Grid& b) {
        return a.w == b.w && a.h == b.h && a.cells == b.cells;
    }
    friend bool operator!=(const Grid& a, const Grid& b) { return !(a == b); }

private:
    size_t index(int x, int y) const { return static_cast<size_t>(y) * static_cast<size_t>(w) + static_cast<size_t>(x); }
    void checkBounds(int x, int y) const;

    int w, h;               /**< grid dimensions */
    std::vector<Cell> cells; /**< flattened storage of size w*h */
};
