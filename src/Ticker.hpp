/**
 * MIT License
 *
 * @brief Fixed-period, phase-locked tick source over a 32-bit microsecond clock.
 *
 * @file Ticker.hpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

#include <cstdint>

namespace ppm
{
    /**
     * @brief Deadlines at t0 + k * period.
     *
     * A late poll fires once and skips every whole period it overran, so
     * later ticks keep the original phase. Skipped periods are counted.
     * All comparisons are wrap-safe (micros() rolls over every ~71 minutes).
     */
    class FixedTicker
    {
    public:
        /**
         * @brief Arm the ticker.
         * @param period_us Tick period (µs, > 0).
         * @param now_us Current time; the first tick is due immediately.
         * Clears the dropped-period count.
         */
        void start(std::uint32_t period_us, std::uint32_t now_us)
        {
            period_ = period_us ? period_us : 1u;
            next_ = now_us;
            dropped_ = 0;
            armed_ = true;
        }

        /// @brief Disarm; due() returns false until start() is called again.
        void stop() { armed_ = false; }

        /**
         * @brief Poll the ticker.
         * @param now_us Current time.
         * @return true if a tick is due (the deadline advances).
         */
        bool due(std::uint32_t now_us)
        {
            if (!armed_)
                return false;
            const std::int32_t late = static_cast<std::int32_t>(now_us - next_);
            if (late < 0)
                return false;
            const std::uint32_t missed = static_cast<std::uint32_t>(late) / period_;
            dropped_ += missed;
            next_ += (missed + 1u) * period_;
            return true;
        }

        /// @brief Microseconds until the next tick (0 if due or disarmed).
        std::uint32_t remaining(std::uint32_t now_us) const
        {
            const std::int32_t d = static_cast<std::int32_t>(next_ - now_us);
            return (armed_ && d > 0) ? static_cast<std::uint32_t>(d) : 0u;
        }

        std::uint32_t period() const noexcept { return period_; }
        std::uint32_t next_deadline() const noexcept { return next_; }
        std::uint32_t dropped() const noexcept { return dropped_; }
        bool armed() const noexcept { return armed_; }

    private:
        std::uint32_t period_{1};  ///< Tick period (µs).
        std::uint32_t next_{0};    ///< Next deadline (µs).
        std::uint32_t dropped_{0}; ///< Periods skipped after overruns.
        bool armed_{false};        ///< Running.
    };

} ///< namespace ppm.
