/**
 * @file GrainSpawner.h
 * @brief Declares GrainSpawner: turns tracked session time and explicit requests into a FIFO of pending grains.
 *
 * For every category the number of time-derived grains ever enqueued equals
 * floor(total accrued seconds / quantum), so pile size is a non-decreasing function of tracked time
 * no matter how the seconds are batched (streamed per second or flushed when a session stops).
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Category.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <unordered_map>
#include <vector>

/** @brief A queued spawn request; it becomes grid state once placed. */
struct Grain {
    CategoryId category;

    friend bool operator==(const Grain& a, const Grain& b) { return a.category == b.category; }
};

/**
 * @class GrainSpawner
 * @brief Owns the PendingQueue and the per-category production ledger.
 */
class GrainSpawner {
public:
    /** @brief Construct with @p quantumSeconds seconds of tracked time per grain; throws std::invalid_argument if 0. */
    explicit GrainSpawner(std::uint32_t quantumSeconds = 1);

    std::uint32_t quantum() const { return quantumSec; }

    /** @brief Queue @p count explicit grains for @p id. */
    void enqueue(CategoryId id, size_t count);
    /**
     * @brief Record @p seconds of tracked time for @p id and queue the grains it completes.
     * @return number of grains queued by this call.
     */
    size_t accrue(CategoryId id, std::uint64_t seconds);

    /** @brief Remove and return up to @p maxCount grains from the front, oldest first. */
    std::vector<Grain> drain(size_t maxCount);
    /** @brief Put grains that could not be placed back at the front, preserving their order. */
    void requeueFront(const std::vector<Grain>& grains);

    /** @brief Drop every pending grain (the ledger is kept). */
    void clearPending();
    /** @brief Drop pending grains of @p id; returns how many were dropped. */
    size_t discardPending(CategoryId id);

    size_t pending() const { return queue.size(); }
    size_t pendingFor(CategoryId id) const;
    bool empty() const { return queue.empty(); }

    /** @brief All grains ever queued for @p id (time-derived plus explicit). */
    std::uint64_t totalEnqueued(CategoryId id) const;
    /** @brief Grains queued from accrued time only; always elapsedSeconds(id) / quantum(). */
    std::uint64_t timeDerivedGrains(CategoryId id) const;
    /** @brief Seconds accrued for @p id. */
    std::uint64_t elapsedSeconds(CategoryId id) const;

private:
    struct Ledger {
        std::uint64_t seconds{0};   /**< accrued tracked time */
        std::uint64_t fromTime{0};  /**< grains produced from time */
        std::uint64_t explicitCount{0};
    };

    std::uint32_t quantumSec;
    std::deque<Grain> queue;
    std::unordered_map<CategoryId, Ledger> ledgers;
};
