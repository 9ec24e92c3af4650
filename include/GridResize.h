/**
 * @file GridResize.h
 * @brief Best-effort migration of settled grains into a grid of different dimensions.
 *
 * Columns are scaled proportionally (nx = x·newW/oldW) and rows are anchored to the floor, so a
 * grain d rows above the old floor targets d rows above the new floor. Old columns are migrated
 * from the center outward; a grain whose target is taken or above the new top drops into the
 * lowest free cell of its new column, and is discarded only when that column is full. Outer
 * columns therefore lose grains first, and nothing ever wraps.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Grid.h"

#include <cstddef>
#include <vector>

/**
 * @brief Build a @p newWidth × @p newHeight grid holding as many grains of @p old as fit.
 * @throws DegenerateResize if either new dimension is <= 0; @p old is never modified.
 */
Grid remapGrid(const Grid& old, int newWidth, int newHeight);

/** @brief As remapGrid, also reporting how many grains were discarded. */
Grid remapGrid(const Grid& old, int newWidth, int newHeight, size_t& discarded);

/** @brief Old-column visiting order used by remapGrid: center first, left before right on ties. */
std::vector<int> centerOutColumns(int width);
