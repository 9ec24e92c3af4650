/**
 * @file SessionFeed.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SessionFeed.h"
#include "Logger.h"

#include <string>

SessionFeed::SessionFeed(SandEngine& engine_, bool flushOnStop_, std::uint64_t secondsPerPulse_)
    : engine(engine_), flushOnStop(flushOnStop_), secondsPerPulse(secondsPerPulse_ ? secondsPerPulse_ : 1) {}

void SessionFeed::start(CategoryId id) {
    if (current && *current == id) return;
    if (current) stop();
    current = id;
    sessionSec = 0;
    buffered = 0;
    Logger::info("session start: category=" + std::to_string(id.value));
}

std::uint64_t SessionFeed::stop() {
    if (!current) return 0;
    if (buffered > 0) {
        size_t grains = engine.addElapsed(*current, buffered);
        Logger::debug("session flush: " + std::to_string(buffered) + "s -> " + std::to_string(grains) + " grains");
    }
    std::uint64_t total = sessionSec;
    Logger::info("session stop: category=" + std::to_string(current->value) +
                 " seconds=" + std::to_string(total));
    current.reset();
    sessionSec = 0;
    buffered = 0;
    return total;
}

void SessionFeed::pulse(std::uint64_t pulses) {
    if (!current || pulses == 0) return;
    const std::uint64_t seconds = pulses * secondsPerPulse;
    sessionSec += seconds;
    if (flushOnStop) {
        buffered += seconds;
        return;
    }
    engine.addElapsed(*current, seconds);
}
