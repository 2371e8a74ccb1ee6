/**
 * MIT License
 *
 * @brief Fluent configuration builder and validation.
 *
 * @file Config.hpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <Types.hpp>
#include <Constants.hpp>
#include <SpecParser.hpp>

namespace ppm
{
    struct PpmConfig
    {
        static constexpr std::size_t N = kChannelCount; ///< Channels per frame.

        // Channel sources & shaping.
        ChannelSpec specs[N]{};    ///< Per-channel source.
        ChannelTuning tuning[N]{}; ///< Per-channel trim/expo.

        // Output geometry.
        PulseLimits limits{};                 ///< MIN/MID/MAX pulse widths.
        FrameTiming timing{};                 ///< Frame length, marker, minimum sync.
        Polarity polarity{Polarity::Normal};  ///< Output line polarity.

        // Input normalization (used by the USB adapter).
        AxisCalibration devices[kMaxDevices]{}; ///< Raw HID range per logical device.

        // Indicators & console.
        std::uint16_t heartbeat_ticks{1}; ///< Toggle the alive LED every n ticks.
        std::uint16_t table_ticks{0};     ///< Print the channel table every n ticks (0 = off).

        /**
         * @brief Channel builder.
         *
         * Provides a fluent API to configure one output channel (source,
         * inversion, trim and expo). Writes to an out-of-range channel are ignored.
         */
        struct ChannelB
        {
            ChannelSpec *s;    ///< Spec being edited (nullptr if out of range).
            ChannelTuning *t;  ///< Tuning being edited (nullptr if out of range).
            PpmConfig &cfg;    ///< Parent configuration.

            /**
             * @brief Drive the channel from a joystick axis.
             * @param dev Logical device slot.
             * @param ax Axis index on that device.
             * @return Reference to the current ChannelB builder (for chaining).
             */
            ChannelB &axis(std::uint8_t dev, std::uint8_t ax)
            {
                if (s)
                    *s = ChannelSpec::axis(dev, ax, s->inverted);
                return *this;
            }

            /**
             * @brief Drive the channel from a button (released = low end, pressed = high end).
             * @param dev Logical device slot.
             * @param btn Button index.
             * @return Reference to the current ChannelB builder.
             */
            ChannelB &button(std::uint8_t dev, std::uint8_t btn)
            {
                if (s)
                    *s = ChannelSpec::button(dev, btn, s->inverted);
                return *this;
            }

            /**
             * @brief Drive the channel from one direction of a hat switch.
             * @param dev Logical device slot.
             * @param h Hat index.
             * @param a Horizontal or vertical component.
             * @return Reference to the current ChannelB builder.
             */
            ChannelB &hat(std::uint8_t dev, std::uint8_t h, HatAxis a)
            {
                if (s)
                    *s = ChannelSpec::hat(dev, h, a, s->inverted);
                return *this;
            }

            /// @brief Leave the channel unmapped (neutral).
            ChannelB &none()
            {
                if (s)
                    *s = ChannelSpec::none();
                return *this;
            }

            /**
             * @brief Invert the source.
             * @param inv If true, inverts the sample (default = true).
             * @return Reference to the current ChannelB builder.
             */
            ChannelB &invert(bool inv = true)
            {
                if (s)
                    s->inverted = inv;
                return *this;
            }

            /**
             * @brief Set trim in microseconds (clamped to ±kTrimLimitUs).
             * @param us Trim offset.
             * @return Reference to the current ChannelB builder.
             */
            ChannelB &trim_us(int us)
            {
                if (us < -kTrimLimitUs)
                    us = -kTrimLimitUs;
                if (us > kTrimLimitUs)
                    us = kTrimLimitUs;
                if (t)
                    t->trim_us = static_cast<std::int16_t>(us);
                return *this;
            }

            /**
             * @brief Set exponential curve factor.
             * @param e Expo factor (0 = linear, 1 = maximum curve).
             * @return Reference to the current ChannelB builder.
             */
            ChannelB &expo(float e)
            {
                if (!(e == e) || e < 0)
                    e = 0;
                if (e > 1)
                    e = 1;
                if (t)
                    t->expo = e;
                return *this;
            }

            /**
             * @brief Finalize channel configuration and return to parent config.
             * @return Reference to the PpmConfig object.
             */
            PpmConfig &done() { return cfg; }
        };

        /**
         * @brief Configure an output channel.
         * @param ch Channel index [0..7].
         * @return ChannelB Builder object for that channel.
         */
        ChannelB channel(std::size_t ch)
        {
            if (ch < N)
                return ChannelB{&specs[ch], &tuning[ch], *this};
            return ChannelB{nullptr, nullptr, *this};
        }

        /**
         * @brief Map a channel from its text form, e.g. "!joy0:axis:1".
         * @param ch Channel index [0..7].
         * @param text Mapping text (see SpecParser.hpp).
         * @return true if accepted; the channel is left unchanged otherwise.
         */
        bool map(std::size_t ch, const char *text)
        {
            if (ch >= N)
                return false;
            return parse_channel_spec(text, specs[ch]);
        }

        // ---- Output geometry ---- //

        /**
         * @brief Set pulse limits.
         * @param min Full negative deflection (µs).
         * @param mid Neutral (µs); must be the midpoint of min..max.
         * @param max Full positive deflection (µs).
         * @return Reference to the current PpmConfig instance (for chaining).
         */
        PpmConfig &pulse_range(std::uint16_t min, std::uint16_t mid, std::uint16_t max)
        {
            limits.min_us = min;
            limits.mid_us = mid;
            limits.max_us = max;
            return *this;
        }

        /// @brief Set the nominal frame length (µs).
        PpmConfig &frame_us(std::uint32_t us)
        {
            timing.frame_us = us;
            return *this;
        }

        /// @brief Set the fixed marker that opens every pulse (µs).
        PpmConfig &marker_us(std::uint16_t us)
        {
            timing.marker_us = us;
            return *this;
        }

        /// @brief Set the shortest sync pulse allowed (µs).
        PpmConfig &min_sync_us(std::uint16_t us)
        {
            timing.min_sync_us = us;
            return *this;
        }

        /// @brief Select normal or inverted output.
        PpmConfig &set_polarity(Polarity p)
        {
            polarity = p;
            return *this;
        }

        /**
         * @brief Set the raw HID range of a logical device.
         * @param dev Logical device slot.
         * @param lo Reading at full negative deflection.
         * @param hi Reading at full positive deflection.
         * @param center Reading at rest.
         * @return Reference to the current PpmConfig instance (for chaining).
         */
        PpmConfig &calibrate(std::size_t dev, std::int32_t lo, std::int32_t hi, std::int32_t center)
        {
            if (dev < kMaxDevices)
            {
                devices[dev].raw_lo = lo;
                devices[dev].raw_hi = hi;
                devices[dev].raw_center = center;
            }
            return *this;
        }

        // ---- Misc ---- //

        /// @brief Toggle the alive indicator every @p ticks ticks (0 is treated as 1).
        PpmConfig &heartbeat_every(std::uint16_t ticks)
        {
            heartbeat_ticks = ticks ? ticks : 1;
            return *this;
        }

        /// @brief Print the channel table every @p ticks ticks (0 = never).
        PpmConfig &print_table_every(std::uint16_t ticks)
        {
            table_ticks = ticks;
            return *this;
        }
    };

    /**
     * @brief Check a configuration before it is handed to the scheduler.
     * @param c Configuration.
     * @return ConfigError::None if usable, else the first problem found.
     */
    inline ConfigError validate(const PpmConfig &c)
    {
        const PulseLimits &l = c.limits;
        if (!(l.min_us < l.mid_us && l.mid_us < l.max_us) || l.min_us < kPulseFloorUs || l.max_us > kPulseCeilUs)
            return ConfigError::BadPulseRange;

        const int skew = static_cast<int>(l.min_us) + static_cast<int>(l.max_us) - 2 * static_cast<int>(l.mid_us);
        if (skew > 2 || skew < -2)
            return ConfigError::AsymmetricPulseRange;

        const FrameTiming &t = c.timing;
        if (t.marker_us == 0 || t.marker_us >= l.min_us)
            return ConfigError::BadMarker;

        if (t.frame_us < kFrameFloorUs || t.frame_us > kFrameCeilUs ||
            t.min_sync_us <= t.marker_us || t.min_sync_us >= t.frame_us)
            return ConfigError::BadFrameTiming;

        for (std::size_t i = 0; i < PpmConfig::N; ++i)
        {
            if (c.specs[i].mapped() && c.specs[i].device >= kMaxDevices)
                return ConfigError::BadChannelSpec;
            const float e = c.tuning[i].expo;
            if (!(e >= 0.0f && e <= 1.0f))
                return ConfigError::BadExpo;
        }

        for (std::size_t d = 0; d < kMaxDevices; ++d)
        {
            const AxisCalibration &a = c.devices[d];
            const std::int32_t lo = (a.raw_lo < a.raw_hi) ? a.raw_lo : a.raw_hi;
            const std::int32_t hi = (a.raw_lo < a.raw_hi) ? a.raw_hi : a.raw_lo;
            if (lo == hi || a.raw_center <= lo || a.raw_center >= hi)
                return ConfigError::BadDevice;
        }

        return ConfigError::None;
    }

} ///< namespace ppm.
