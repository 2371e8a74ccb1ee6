/**
 * MIT License
 *
 * @brief Core public datatypes for PpmTrainer.
 *
 * @file Types.hpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <Constants.hpp>

namespace ppm
{
    // ---- Channel sources ---- //
    enum class SourceKind : std::uint8_t
    {
        Unmapped, ///< Channel idles at neutral.
        Axis,     ///< Analog joystick axis.
        Button,   ///< Button: released = -1, pressed = +1.
        Hat       ///< One direction of a hat switch: -1, 0 or +1.
    };

    enum class HatAxis : std::uint8_t
    {
        Horizontal, ///< Left = -1, right = +1.
        Vertical    ///< Up = +1, down = -1.
    };

    /**
     * @brief Parsed, validated channel source.
     *
     * Device and control indices are logical; they are resolved against the
     * registry on every read, never cached as hardware handles.
     */
    struct ChannelSpec
    {
        SourceKind kind{SourceKind::Unmapped}; ///< Source type.
        std::uint8_t device{0};                ///< Logical device slot.
        std::uint8_t index{0};                 ///< Axis, button or hat index.
        HatAxis hat_axis{HatAxis::Horizontal}; ///< Hat direction (Hat only).
        bool inverted{false};                  ///< Negate the sample.

        /// @brief Unmapped (neutral) channel.
        static constexpr ChannelSpec none() { return ChannelSpec{}; }

        /// @brief Joystick axis source.
        static constexpr ChannelSpec axis(std::uint8_t dev, std::uint8_t ax, bool inv = false)
        {
            return ChannelSpec{SourceKind::Axis, dev, ax, HatAxis::Horizontal, inv};
        }

        /// @brief Joystick button source.
        static constexpr ChannelSpec button(std::uint8_t dev, std::uint8_t btn, bool inv = false)
        {
            return ChannelSpec{SourceKind::Button, dev, btn, HatAxis::Horizontal, inv};
        }

        /// @brief Hat switch source.
        static constexpr ChannelSpec hat(std::uint8_t dev, std::uint8_t h, HatAxis a, bool inv = false)
        {
            return ChannelSpec{SourceKind::Hat, dev, h, a, inv};
        }

        bool mapped() const noexcept { return kind != SourceKind::Unmapped; }

        bool operator==(const ChannelSpec &o) const noexcept
        {
            if (kind != o.kind)
                return false;
            if (kind == SourceKind::Unmapped)
                return true;
            return device == o.device && index == o.index && inverted == o.inverted &&
                   (kind != SourceKind::Hat || hat_axis == o.hat_axis);
        }
        bool operator!=(const ChannelSpec &o) const noexcept { return !(*this == o); }
    };

    struct ChannelTuning
    {
        std::int16_t trim_us{0}; ///< Offset added after scaling (µs).
        float expo{0.0f};        ///< 0 = linear, 1 = pure cubic.
    };

    // ---- Pulse and frame geometry ---- //
    struct PulseLimits
    {
        std::uint16_t min_us{kDefaultMinPulseUs}; ///< Full negative deflection.
        std::uint16_t mid_us{kDefaultMidPulseUs}; ///< Neutral.
        std::uint16_t max_us{kDefaultMaxPulseUs}; ///< Full positive deflection.
    };

    struct FrameTiming
    {
        std::uint32_t frame_us{kDefaultFrameUs};       ///< Nominal frame period.
        std::uint16_t marker_us{kDefaultMarkerUs};     ///< Marker opening each pulse.
        std::uint16_t min_sync_us{kDefaultMinSyncUs};  ///< Floor for the sync pulse.
    };

    enum class Polarity : std::uint8_t
    {
        Normal,  ///< Marker high, idle low.
        Inverted ///< Marker low, idle high.
    };

    /// @brief Raw HID range of one device, used to normalize integer samples.
    struct AxisCalibration
    {
        std::int32_t raw_lo{0};       ///< Reading at full negative deflection.
        std::int32_t raw_hi{255};     ///< Reading at full positive deflection.
        std::int32_t raw_center{128}; ///< Reading at rest.
    };

    /**
     * @brief One assembled PPM frame.
     *
     * Channel widths always lie in [min_us, max_us]. sum(channels) + sync_us equals
     * the nominal frame length unless sync_clamped is set.
     */
    struct PulseFrame
    {
        std::uint16_t channels[kChannelCount]{}; ///< Channel widths (µs).
        std::uint32_t sync_us{0};                ///< Trailing sync width (µs).
        bool sync_clamped{false};                ///< Sync was raised to the minimum.
        std::uint8_t degraded_mask{0};           ///< Bit n set: channel n fell back to neutral.

        /// @brief Sum of all channel widths.
        std::uint32_t channel_sum() const noexcept
        {
            std::uint32_t s = 0;
            for (std::size_t i = 0; i < kChannelCount; ++i)
                s += channels[i];
            return s;
        }

        /// @brief Duration of the whole frame including sync.
        std::uint32_t total_us() const noexcept { return channel_sum() + sync_us; }

        bool operator==(const PulseFrame &o) const noexcept
        {
            for (std::size_t i = 0; i < kChannelCount; ++i)
                if (channels[i] != o.channels[i])
                    return false;
            return sync_us == o.sync_us && sync_clamped == o.sync_clamped && degraded_mask == o.degraded_mask;
        }
    };

    // ---- Devices ---- //
    struct DeviceInfo
    {
        std::uint8_t axis_count{0};   ///< Highest usable axis index + 1.
        std::uint8_t button_count{0}; ///< Buttons reported.
        std::uint8_t hat_count{0};    ///< Hat switches reported.
    };

    enum class HotplugKind : std::uint8_t
    {
        Attach,
        Detach
    };

    /// @brief Queued hotplug notification.
    template <typename Device>
    struct HotplugEvent
    {
        HotplugKind kind{HotplugKind::Attach};
        Device *handle{nullptr};
        DeviceInfo info{};
        int slot{-1}; ///< Slot assigned or freed once applied (-1 = rejected/unknown).
    };

    // ---- Waveform ---- //
    struct PulseStep
    {
        std::uint8_t level{0};    ///< Line level for this step (0/1).
        std::uint32_t us{0};      ///< Step duration (µs).
    };

    /// @brief Ordered level/duration steps for one frame; played repeatedly until replaced.
    struct Waveform
    {
        PulseStep steps[kStepsPerFrame]{}; ///< Steps in playback order.
        std::uint8_t count{0};             ///< Valid steps.

        std::uint32_t total_us() const noexcept
        {
            std::uint32_t t = 0;
            for (std::uint8_t i = 0; i < count; ++i)
                t += steps[i].us;
            return t;
        }
    };

    // ---- Scheduler status ---- //
    enum class SchedulerState : std::uint8_t
    {
        Idle,    ///< No input devices; backend silent.
        Emitting ///< Waveform active.
    };

    struct SchedulerStatus
    {
        SchedulerState state{SchedulerState::Idle}; ///< Current state.
        std::uint32_t ticks{0};                      ///< Ticks run.
        std::uint32_t frames{0};                     ///< Waveforms accepted by the backend.
        std::uint32_t rejected{0};                   ///< Submissions refused by the backend.
        std::uint32_t dropped_ticks{0};              ///< Periods skipped after an overrun.
        std::uint32_t attaches{0};                   ///< Devices attached.
        std::uint32_t detaches{0};                   ///< Devices detached.
        std::uint16_t fps{0};                        ///< Accepted frames per second (estimate).
        std::uint8_t devices{0};                     ///< Devices present after the last tick.
    };

    // ---- Configuration errors ---- //
    enum class ConfigError : std::uint8_t
    {
        None,                 ///< Configuration is usable.
        BadPulseRange,        ///< MIN/MID/MAX out of order or out of bounds.
        AsymmetricPulseRange, ///< MID is not the midpoint of MIN..MAX.
        BadMarker,            ///< Marker not shorter than the shortest pulse.
        BadFrameTiming,       ///< Frame length or minimum sync unusable.
        BadChannel,           ///< Channel index outside 0..7.
        BadChannelSpec,       ///< Mapping string or indices rejected.
        BadExpo,              ///< Expo outside [0, 1].
        BadDevice,            ///< Device calibration unusable.
        JsonSyntax,           ///< Document did not parse.
        JsonSchema            ///< Document parsed but fields have the wrong shape.
    };

    /// @brief Name of a configuration error for log output.
    inline const char *to_string(ConfigError e)
    {
        switch (e)
        {
        case ConfigError::None:
            return "None";
        case ConfigError::BadPulseRange:
            return "BadPulseRange";
        case ConfigError::AsymmetricPulseRange:
            return "AsymmetricPulseRange";
        case ConfigError::BadMarker:
            return "BadMarker";
        case ConfigError::BadFrameTiming:
            return "BadFrameTiming";
        case ConfigError::BadChannel:
            return "BadChannel";
        case ConfigError::BadChannelSpec:
            return "BadChannelSpec";
        case ConfigError::BadExpo:
            return "BadExpo";
        case ConfigError::BadDevice:
            return "BadDevice";
        case ConfigError::JsonSyntax:
            return "JsonSyntax";
        case ConfigError::JsonSchema:
            return "JsonSchema";
        default:
            return "Unknown";
        }
    }

    inline const char *to_string(SchedulerState s)
    {
        return (s == SchedulerState::Emitting) ? "Emitting" : "Idle";
    }

} ///< namespace ppm.
