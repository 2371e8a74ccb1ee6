/**
 * MIT License
 *
 * @brief PPM pulse output on a GPIO pin, timed by a Teensy IntervalTimer.
 *
 * @file PpmTimer_Teensy.hpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <Arduino.h>
#include <IntervalTimer.h>
#include <Types.hpp>
#include <Waveform.hpp>
#include <Registry.hpp>

namespace ppm
{
    /// @brief Lock policy that masks interrupts (shared state with an ISR).
    struct IrqLock
    {
        void lock() noexcept { noInterrupts(); }
        void unlock() noexcept { interrupts(); }
    };

    /**
     * @brief Waveform backend: plays staged frames back-to-back on one pin.
     *
     * The timer reload only takes effect after the interval in flight, so the
     * ISR always loads the duration one step ahead of the level it writes.
     * Only one instance may be active (the ISR has no context argument).
     */
    class PpmTimerOutput
    {
    public:
        PpmTimerOutput() = default;
        PpmTimerOutput(const PpmTimerOutput &) = delete;
        PpmTimerOutput &operator=(const PpmTimerOutput &) = delete;
        ~PpmTimerOutput() { stop(); }

        /**
         * @brief Claim the pin and park it at the idle level.
         * @param pin Output pin (to the trainer port, through a level shifter if needed).
         * @param p Output polarity.
         * @return true on success (false if another instance is active).
         */
        bool begin(std::uint8_t pin, Polarity p = Polarity::Normal)
        {
            if (instance_ != nullptr && instance_ != this)
                return false;
            instance_ = this;
            pin_ = pin;
            pol_ = p;
            pinMode(pin_, OUTPUT);
            digitalWriteFast(pin_, idle_level(pol_));
            begun_ = true;
            return true;
        }

        /**
         * @brief Replace the waveform; takes effect at the next frame boundary.
         * @param w Complete waveform (kStepsPerFrame steps).
         * @return false if not begun, the waveform is malformed, or the timer failed to start.
         */
        bool submit(const Waveform &w)
        {
            if (!begun_ || !waveform_valid(w))
                return false;

            {
                std::lock_guard<IrqLock> g(irq_);
                seq_.stage(w);
            }
            if (running_)
                return true;

            // First frame: prime the pin and the two-step pipeline.
            const PulseStep first = seq_.next();
            digitalWriteFast(pin_, first.level);
            if (!timer_.begin(&PpmTimerOutput::isr, first.us))
            {
                seq_.reset();
                digitalWriteFast(pin_, idle_level(pol_));
                return false;
            }
            std::lock_guard<IrqLock> g(irq_);
            ahead_ = seq_.next();
            timer_.update(ahead_.us);
            running_ = true;
            return true;
        }

        /// @brief Halt pulses and hold the pin at the idle level.
        void stop()
        {
            if (running_)
                timer_.end();
            running_ = false;
            {
                std::lock_guard<IrqLock> g(irq_);
                seq_.reset();
            }
            if (begun_)
                digitalWriteFast(pin_, idle_level(pol_));
        }

        /// @brief True while pulses are on the pin.
        bool active() const noexcept { return running_; }

        /// @brief Frames started by the timer since power-up.
        std::uint32_t frames() const noexcept { return seq_.frames(); }

    private:
        static void isr()
        {
            if (instance_ != nullptr)
                instance_->on_timer();
        }

        void on_timer()
        {
            digitalWriteFast(pin_, ahead_.level);
            ahead_ = seq_.next();
            if (ahead_.us != 0)
                timer_.update(ahead_.us);
        }

        static inline PpmTimerOutput *instance_ = nullptr; ///< Target of the timer ISR.

        IntervalTimer timer_;
        WaveformSequencer seq_{};
        IrqLock irq_{};
        PulseStep ahead_{};          ///< Step written at the next interrupt.
        std::uint8_t pin_{0};
        Polarity pol_{Polarity::Normal};
        bool begun_{false};
        volatile bool running_{false};
    };

} ///< namespace ppm.
