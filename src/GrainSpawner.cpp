/**
 * @file GrainSpawner.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "GrainSpawner.h"

#include <algorithm>
#include <stdexcept>

GrainSpawner::GrainSpawner(std::uint32_t quantumSeconds) : quantumSec(quantumSeconds) {
    if (quantumSeconds == 0) throw std::invalid_argument("grain quantum must be at least one second");
}

void GrainSpawner::enqueue(CategoryId id, size_t count) {
    if (count == 0) return;
    ledgers[id].explicitCount += count;
    queue.insert(queue.end(), count, Grain{id});
}

size_t GrainSpawner::accrue(CategoryId id, std::uint64_t seconds) {
    Ledger& l = ledgers[id];
    l.seconds += seconds;
    const std::uint64_t due = l.seconds / quantumSec;
    const std::uint64_t fresh = due - l.fromTime;
    l.fromTime = due;
    queue.insert(queue.end(), static_cast<size_t>(fresh), Grain{id});
    return static_cast<size_t>(fresh);
}

std::vector<Grain> GrainSpawner::drain(size_t maxCount) {
    const size_t n = std::min(maxCount, queue.size());
    std::vector<Grain> out(queue.begin(), queue.begin() + static_cast<std::ptrdiff_t>(n));
    queue.erase(queue.begin(), queue.begin() + static_cast<std::ptrdiff_t>(n));
    return out;
}

void GrainSpawner::requeueFront(const std::vector<Grain>& grains) {
    queue.insert(queue.begin(), grains.begin(), grains.end());
}

void GrainSpawner::clearPending() {
    queue.clear();
}

size_t GrainSpawner::discardPending(CategoryId id) {
    const size_t before = queue.size();
    queue.erase(std::remove(queue.begin(), queue.end(), Grain{id}), queue.end());
    return before - queue.size();
}

size_t GrainSpawner::pendingFor(CategoryId id) const {
    return static_cast<size_t>(std::count(queue.begin(), queue.end(), Grain{id}));
}

std::uint64_t GrainSpawner::totalEnqueued(CategoryId id) const {
    auto it = ledgers.find(id);
    if (it == ledgers.end()) return 0;
    return it->second.fromTime + it->second.explicitCount;
}

std::uint64_t GrainSpawner::timeDerivedGrains(CategoryId id) const {
    auto it = ledgers.find(id);
    return it == ledgers.end() ? 0 : it->second.fromTime;
}

std::uint64_t GrainSpawner::elapsedSeconds(CategoryId id) const {
    auto it = ledgers.find(id);
    return it == ledgers.end() ? 0 : it->second.seconds;
}
