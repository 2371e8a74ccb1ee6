/**
 * MIT License
 *
 * @brief PPM frame to level/duration steps, and the double-buffered step player.
 *
 * @file Waveform.hpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

#include <cstdint>
#include <Types.hpp>
#include <Constants.hpp>

namespace ppm
{
    /// @brief Line level during the marker for a polarity.
    constexpr std::uint8_t marker_level(Polarity p) { return p == Polarity::Normal ? 1 : 0; }

    /// @brief Line level between markers (and when output is stopped).
    constexpr std::uint8_t idle_level(Polarity p) { return p == Polarity::Normal ? 0 : 1; }

    /**
     * @brief Convert a frame into a pulse train.
     *
     * Layout: for each channel and then the sync, a marker of marker_us at the
     * marker level followed by (width - marker_us) at the idle level.
     *
     * @param f Assembled frame.
     * @param t Frame timing (marker width).
     * @param p Output polarity.
     * @return Waveform with kStepsPerFrame steps; total duration equals f.total_us().
     */
    inline Waveform build_waveform(const PulseFrame &f, const FrameTiming &t, Polarity p)
    {
        Waveform w{};
        const std::uint8_t on = marker_level(p);
        const std::uint8_t off = idle_level(p);
        auto push_pulse = [&](std::uint32_t width)
        {
            const std::uint32_t mark = (width > t.marker_us) ? t.marker_us : width / 2;
            w.steps[w.count++] = PulseStep{on, mark};
            w.steps[w.count++] = PulseStep{off, width - mark};
        };
        for (std::size_t i = 0; i < kChannelCount; ++i)
            push_pulse(f.channels[i]);
        push_pulse(f.sync_us);
        return w;
    }

    /// @brief True if @p w is a complete, playable frame.
    inline bool waveform_valid(const Waveform &w)
    {
        if (w.count != kStepsPerFrame)
            return false;
        for (std::uint8_t i = 0; i < w.count; ++i)
            if (w.steps[i].us == 0 || w.steps[i].level > 1)
                return false;
        return true;
    }

    /**
     * @brief Plays a waveform step by step, repeating it until a staged one replaces it.
     *
     * The staged waveform is swapped in only when the playing one wraps, so
     * replacement never cuts a frame short or leaves a gap. stage() is called
     * from the loop and next() from the timer interrupt; the caller serializes
     * them (interrupts masked around stage()).
     */
    class WaveformSequencer
    {
    public:
        /**
         * @brief Queue @p w to start at the next frame boundary (replaces any earlier staged one).
         * @param w Waveform to play.
         */
        void stage(const Waveform &w)
        {
            pending_ = w;
            has_pending_ = true;
        }

        /**
         * @brief Advance playback.
         * @return The step to output now; us == 0 if nothing is loaded.
         */
        PulseStep next()
        {
            if (pos_ >= active_.count)
            {
                pos_ = 0;
                if (has_pending_)
                {
                    active_ = pending_;
                    has_pending_ = false;
                }
                if (active_.count == 0)
                    return PulseStep{};
                ++frames_;
            }
            return active_.steps[pos_++];
        }

        /// @brief Drop both buffers; playback restarts from the next staged waveform.
        void reset()
        {
            active_ = Waveform{};
            pending_ = Waveform{};
            has_pending_ = false;
            pos_ = 0;
        }

        bool loaded() const noexcept { return active_.count != 0 || has_pending_; }
        bool has_pending() const noexcept { return has_pending_; }

        /// @brief Frames started since construction.
        std::uint32_t frames() const noexcept { return frames_; }

        /// @brief Index of the next step to be returned within the active waveform.
        std::uint8_t position() const noexcept { return pos_; }

    private:
        Waveform active_{};           ///< Playing waveform.
        Waveform pending_{};          ///< Staged replacement.
        volatile bool has_pending_{false}; ///< pending_ waits for the next boundary.
        std::uint8_t pos_{0};         ///< Next step in active_.
        std::uint32_t frames_{0};     ///< Frames started.
    };

} ///< namespace ppm.
