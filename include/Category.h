/**
 * @file Category.h
 * @brief Declares CategoryId, Category and CategoryTable: stable category identity plus display order.
 *
 * A CategoryId is assigned once and never reused. Display order lives in the table only, so reordering,
 * renaming or recoloring never touches grains already in the grid; colors are resolved lazily by id.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @struct CategoryId
 * @brief Opaque stable handle for a category.
 */
struct CategoryId {
    std::uint64_t value{0};

    constexpr CategoryId() = default;
    constexpr explicit CategoryId(std::uint64_t v) : value(v) {}

    friend constexpr bool operator==(CategoryId a, CategoryId b) { return a.value == b.value; }
    friend constexpr bool operator!=(CategoryId a, CategoryId b) { return a.value != b.value; }
    friend constexpr bool operator<(CategoryId a, CategoryId b) { return a.value < b.value; }
};

namespace std {
template <>
struct hash<CategoryId> {
    size_t operator()(CategoryId id) const noexcept { return std::hash<std::uint64_t>{}(id.value); }
};
}

/** @brief Id of the built-in "none" category; always present at display index 0. */
constexpr CategoryId kNoneCategoryId{0};

/** @brief Number of entries in the fixed category palette. */
constexpr int kPaletteSize = 12;
/** @brief Neutral (white) color used for "none", orphaned ids and uncategorized grains. */
constexpr int kFallbackColorIndex = kPaletteSize;
/** @brief Color index of empty cells; the host maps it to the terminal default background. */
constexpr int kBackgroundColorIndex = -1;

/** @brief RGB triple for a palette entry. */
struct PaletteColor {
    std::uint8_t r, g, b;
};

/** @brief RGB value for @p colorIndex; the fallback and any out-of-range index map to white. */
PaletteColor paletteColor(int colorIndex);

/**
 * @struct Category
 * @brief A user-visible category. karmaEffect is carried for the report layer and ignored by the simulation.
 */
struct Category {
    CategoryId id;
    std::string name;
    std::string description;
    int colorIndex{kFallbackColorIndex};
    int karmaEffect{0};
};

/**
 * @class CategoryTable
 * @brief Id-keyed category storage with a separate display order.
 *
 * The engine only ever reads a table (by const reference, once per frame). Lookups may fail at any
 * time because categories can be deleted while grains still reference them.
 */
class CategoryTable {
public:
    /** @brief Construct a table holding only the "none" category. */
    CategoryTable();

    /** @brief Number of categories including "none". */
    size_t size() const { return order.size(); }

    /**
     * @brief Add a category; returns its new id, or nothing if the name is blank or already used
     *        (case-insensitive). Without @p colorIndex the next palette slot is used.
     */
    std::optional<CategoryId> add(const std::string& name,
                                  const std::string& description = std::string(),
                                  std::optional<int> colorIndex = std::nullopt);
    /** @brief Remove a category by id. "none" cannot be removed. */
    bool remove(CategoryId id);

    /** @brief Swap the category at @p index with the one above it; index 0 and 1 are fixed. */
    bool moveUp(size_t index);
    /** @brief Swap the category at @p index with the one below it. */
    bool moveDown(size_t index);

    bool setColorIndex(CategoryId id, int colorIndex);
    bool setDescription(CategoryId id, const std::string& description);
    bool setKarmaEffect(CategoryId id, int karmaEffect);

    /** @brief Look up by id; nullptr for orphaned ids. */
    const Category* find(CategoryId id) const;
    /** @brief Look up by display index; nullptr if out of range. */
    const Category* at(size_t index) const;
    std::optional<size_t> indexOf(CategoryId id) const;
    std::optional<CategoryId> idByName(const std::string& name) const;
    /** @brief Categories in display order. */
    std::vector<Category> ordered() const;

    /** @brief Color for @p id, falling back to kFallbackColorIndex when the id does not resolve. */
    int colorFor(CategoryId id) const;

private:
    std::unordered_map<CategoryId, Category> byId;
    std::vector<CategoryId> order;
    std::uint64_t nextId{1};
};
