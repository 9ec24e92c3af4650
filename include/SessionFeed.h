/**
 * @file SessionFeed.h
 * @brief Turns an active work session into (CategoryId, elapsedSeconds) increments for the engine.
 *
 * In streamed mode every accrual pulse forwards one period of time while a session runs; in flush-on-stop mode
 * time is buffered and forwarded when the session stops or switches category. Either way the engine sees the
 * same total seconds per category.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Category.h"
#include "SandEngine.h"

#include <cstdint>
#include <optional>

class SessionFeed {
public:
    /** @param secondsPerPulse tracked seconds represented by one accrual pulse */
    SessionFeed(SandEngine& engine, bool flushOnStop, std::uint64_t secondsPerPulse = 1);

    /** @brief Begin tracking @p id; a running session for another category is stopped first. */
    void start(CategoryId id);
    /** @brief Stop the running session, flushing buffered time. Returns the session length in seconds. */
    std::uint64_t stop();
    bool active() const { return current.has_value(); }
    std::optional<CategoryId> category() const { return current; }

    /** @brief Account @p pulses accrual periods of the running session; no-op when idle. */
    void pulse(std::uint64_t pulses);

    /** @brief Seconds tracked in the running session so far. */
    std::uint64_t sessionSeconds() const { return sessionSec; }
    /** @brief Seconds waiting for the next flush (always 0 in streamed mode). */
    std::uint64_t bufferedSeconds() const { return buffered; }

private:
    SandEngine& engine;
    bool flushOnStop;
    std::uint64_t secondsPerPulse;
    std::optional<CategoryId> current;
    std::uint64_t sessionSec{0};
    std::uint64_t buffered{0};
};
