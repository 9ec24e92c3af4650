/**
 * @file Category.cpp
 * @brief CategoryTable implementation and the fixed palette.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Category.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace {
const std::array<PaletteColor, kPaletteSize> kPalette{{
    {0, 176, 80},
    {128, 255, 0},
    {255, 255, 0},
    {255, 204, 0},
    {255, 153, 0},
    {255, 51, 0},
    {255, 0, 0},
    {153, 0, 255},
    {102, 51, 255},
    {0, 0, 255},
    {0, 153, 255},
    {0, 255, 255},
}};

std::string lowered(const std::string& s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string trimmed(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    if (first >= last) return std::string();
    return std::string(first, last);
}

bool validColor(int colorIndex) {
    return colorIndex >= 0 && colorIndex <= kFallbackColorIndex;
}
}

PaletteColor paletteColor(int colorIndex) {
    if (colorIndex < 0 || colorIndex >= kPaletteSize) return PaletteColor{255, 255, 255};
    return kPalette[static_cast<size_t>(colorIndex)];
}

CategoryTable::CategoryTable() {
    Category none;
    none.id = kNoneCategoryId;
    none.name = "none";
    none.colorIndex = kFallbackColorIndex;
    byId.emplace(none.id, none);
    order.push_back(none.id);
}

std::optional<CategoryId> CategoryTable::add(const std::string& name,
                                             const std::string& description,
                                             std::optional<int> colorIndex) {
    std::string clean = trimmed(name);
    if (clean.empty()) return std::nullopt;
    const std::string key = lowered(clean);
    for (const auto& id : order) {
        auto it = byId.find(id);
        if (it != byId.end() && lowered(it->second.name) == key) return std::nullopt;
    }
    if (colorIndex && !validColor(*colorIndex)) return std::nullopt;

    Category c;
    c.id = CategoryId(nextId++);
    c.name = clean;
    c.description = description;
    c.colorIndex = colorIndex ? *colorIndex : static_cast<int>(order.size() % kPaletteSize);
    c.karmaEffect = 1;
    byId.emplace(c.id, c);
    order.push_back(c.id);
    return c.id;
}

bool CategoryTable::remove(CategoryId id) {
    if (id == kNoneCategoryId) return false;
    auto it = std::find(order.begin(), order.end(), id);
    if (it == order.end()) return false;
    order.erase(it);
    byId.erase(id);
    return true;
}

bool CategoryTable::moveUp(size_t index) {
    if (index <= 1 || index >= order.size()) return false;
    std::swap(order[index - 1], order[index]);
    return true;
}

bool CategoryTable::moveDown(size_t index) {
    if (index == 0 || index + 1 >= order.size()) return false;
    std::swap(order[index], order[index + 1]);
    return true;
}

bool CategoryTable::setColorIndex(CategoryId id, int colorIndex) {
    if (id == kNoneCategoryId || !validColor(colorIndex)) return false;
    auto it = byId.find(id);
    if (it == byId.end()) return false;
    it->second.colorIndex = colorIndex;
    return true;
}

bool CategoryTable::setDescription(CategoryId id, const std::string& description) {
    auto it = byId.find(id);
    if (it == byId.end()) return false;
    it->second.description = description;
    return true;
}

bool CategoryTable::setKarmaEffect(CategoryId id, int karmaEffect) {
    if (id == kNoneCategoryId) return false;
    auto it = byId.find(id);
    if (it == byId.end()) return false;
    it->second.karmaEffect = karmaEffect;
    return true;
}

const Category* CategoryTable::find(CategoryId id) const {
    auto it = byId.find(id);
    return it == byId.end() ? nullptr : &it->second;
}

const Category* CategoryTable::at(size_t index) const {
    if (index >= order.size()) return nullptr;
    return find(order[index]);
}

std::optional<size_t> CategoryTable::indexOf(CategoryId id) const {
    auto it = std::find(order.begin(), order.end(), id);
    if (it == order.end()) return std::nullopt;
    return static_cast<size_t>(it - order.begin());
}

std::optional<CategoryId> CategoryTable::idByName(const std::string& name) const {
    for (const auto& id : order) {
        auto it = byId.find(id);
        if (it != byId.end() && it->second.name == name) return id;
    }
    return std::nullopt;
}

std::vector<Category> CategoryTable::ordered() const {
    std::vector<Category> out;
    out.reserve(order.size());
    for (const auto& id : order) {
        auto it = byId.find(id);
        if (it != byId.end()) out.push_back(it->second);
    }
    return out;
}

int CategoryTable::colorFor(CategoryId id) const {
    const Category* c = find(id);
    if (!c || !validColor(c->colorIndex)) return kFallbackColorIndex;
    return c->colorIndex;
}
