/**
 * @file SimulationClock.h
 * @brief Host-side cadence helper: converts loop time points into automaton ticks and whole accrual seconds.
 *
 * The engine has no timer or thread of its own. The host loop samples steady_clock once per iteration and
 * asks the clock how many ticks are due; time is passed in explicitly so cadence is testable.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <chrono>
#include <cstdint>

class SimulationClock {
public:
    using Clock = std::chrono::steady_clock;

    /** @brief What became due since the previous advance(). */
    struct Due {
        int ticks{0};                  /**< automaton ticks to run now */
        std::uint64_t pulses{0};       /**< accrual pulses (one per spawn period) */
        bool render{false};            /**< a redraw is allowed under the fps cap */
    };

    /**
     * @param tickPeriod time per automaton tick
     * @param pulsePeriod time per accrual pulse (normally one second)
     * @param framePeriod minimum time between redraws
     * @param maxCatchUp ticks returned at most per advance(); excess backlog is dropped
     */
    SimulationClock(std::chrono::milliseconds tickPeriod,
                    std::chrono::milliseconds pulsePeriod,
                    std::chrono::milliseconds framePeriod,
                    int maxCatchUp = 8);

    /** @brief Start measuring from @p now and forget any backlog. */
    void reset(Clock::time_point now);
    /** @brief Accumulate time up to @p now and report what is due. */
    Due advance(Clock::time_point now);

    /** @brief Pause: advance() accumulates nothing until resume(). */
    void pause() { paused = true; }
    void resume(Clock::time_point now);
    bool isPaused() const { return paused; }

    /** @brief Ticks dropped because the backlog exceeded maxCatchUp. */
    std::uint64_t droppedTicks() const { return dropped; }

private:
    std::chrono::milliseconds tickPeriod;
    std::chrono::milliseconds pulsePeriod;
    std::chrono::milliseconds framePeriod;
    int maxCatchUp;

    Clock::time_point last{};
    bool started{false};
    bool paused{false};
    Clock::duration tickAcc{0};
    Clock::duration pulseAcc{0};
    Clock::duration frameAcc{0};
    std::uint64_t dropped{0};
};
