/**
 * @file SimulationClock.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SimulationClock.h"

#include <algorithm>

SimulationClock::SimulationClock(std::chrono::milliseconds tickPeriod_,
                                 std::chrono::milliseconds pulsePeriod_,
                                 std::chrono::milliseconds framePeriod_,
                                 int maxCatchUp_)
    : tickPeriod(std::max(tickPeriod_, std::chrono::milliseconds(1))),
      pulsePeriod(std::max(pulsePeriod_, std::chrono::milliseconds(1))),
      framePeriod(std::max(framePeriod_, std::chrono::milliseconds(1))),
      maxCatchUp(std::max(1, maxCatchUp_)) {}

void SimulationClock::reset(Clock::time_point now) {
    last = now;
    started = true;
    tickAcc = Clock::duration::zero();
    pulseAcc = Clock::duration::zero();
    frameAcc = Clock::duration::zero();
}

void SimulationClock::resume(Clock::time_point now) {
    paused = false;
    // keep partial accumulators but do not count the paused interval
    last = now;
    started = true;
}

SimulationClock::Due SimulationClock::advance(Clock::time_point now) {
    Due due;
    if (!started) {
        reset(now);
        return due;
    }
    Clock::duration elapsed = now - last;
    last = now;
    if (elapsed < Clock::duration::zero()) elapsed = Clock::duration::zero();

    frameAcc += elapsed;
    if (frameAcc >= framePeriod) {
        due.render = true;
        frameAcc = Clock::duration::zero();
    }
    if (paused) return due;

    tickAcc += elapsed;
    std::int64_t ticks = tickAcc / tickPeriod;
    tickAcc -= ticks * tickPeriod;
    if (ticks > maxCatchUp) {
        dropped += static_cast<std::uint64_t>(ticks - maxCatchUp);
        ticks = maxCatchUp;
    }
    due.ticks = static_cast<int>(ticks);

    pulseAcc += elapsed;
    std::int64_t pulses = pulseAcc / pulsePeriod;
    pulseAcc -= pulses * pulsePeriod;
    due.pulses = static_cast<std::uint64_t>(pulses);
    return due;
}
