/**
 * MIT License
 *
 * @brief Channel mapper: resolves a ChannelSpec against the attached devices.
 *
 * @file Mapper.hpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

#include <cstdint>
#include <Types.hpp>
#include <Registry.hpp>
#include <Shaper.hpp>

namespace ppm
{
    /// @brief Outcome of one channel read.
    struct RawRead
    {
        bool ok{false};    ///< false = Unavailable (device/control missing or read would block).
        float value{0.0f}; ///< Normalized sample in [-1, 1] (valid when ok).

        static constexpr RawRead unavailable() { return RawRead{false, 0.0f}; }
        static constexpr RawRead of(float v) { return RawRead{true, v}; }
    };

    /// @brief Neutral raw value used for unmapped and unavailable channels.
    constexpr float kNeutralRaw = 0.0f;

    /**
     * @brief Decode a HID hat direction into one component.
     *
     * Directions 0..7 run clockwise from North; any other value is centered.
     * Right and up are +1.
     *
     * @param dir HID hat value.
     * @param a Component to extract.
     * @return -1, 0 or +1.
     */
    inline float hat_component(std::int32_t dir, HatAxis a)
    {
        static constexpr std::int8_t kX[8] = {0, 1, 1, 1, 0, -1, -1, -1};
        static constexpr std::int8_t kY[8] = {1, 1, 0, -1, -1, -1, 0, 1};
        if (dir < 0 || dir > 7)
            return 0.0f;
        return static_cast<float>(a == HatAxis::Horizontal ? kX[dir] : kY[dir]);
    }

    /**
     * @brief Read a channel's current raw value.
     *
     * Device requirements (non-blocking, return false if no sample is ready):
     * - bool readAxis(std::uint8_t axis, float &out)
     * - bool readButton(std::uint8_t button, bool &pressed)
     * - bool readHat(std::uint8_t hat, HatAxis a, float &out)
     *
     * @tparam Device Device type held by the registry.
     * @param spec Channel source.
     * @param snap Registry snapshot for this tick.
     * @return Neutral for Unmapped, unavailable() if the source is missing, else the
     *         (optionally inverted) sample clamped to [-1, 1].
     */
    template <typename Device>
    RawRead resolve_channel(const ChannelSpec &spec, const RegistrySnapshot<Device> &snap)
    {
        if (spec.kind == SourceKind::Unmapped)
            return RawRead::of(kNeutralRaw);

        const DeviceSlot<Device> *slot = snap.find(spec.device);
        if (slot == nullptr)
            return RawRead::unavailable();

        float v = 0.0f;
        switch (spec.kind)
        {
        case SourceKind::Axis:
            if (spec.index >= slot->info.axis_count || !slot->handle->readAxis(spec.index, v))
                return RawRead::unavailable();
            break;

        case SourceKind::Button:
        {
            bool pressed = false;
            if (spec.index >= slot->info.button_count || !slot->handle->readButton(spec.index, pressed))
                return RawRead::unavailable();
            v = pressed ? 1.0f : -1.0f;
            break;
        }

        case SourceKind::Hat:
            if (spec.index >= slot->info.hat_count || !slot->handle->readHat(spec.index, spec.hat_axis, v))
                return RawRead::unavailable();
            break;

        default:
            return RawRead::unavailable();
        }

        v = clampf(v, -1.0f, 1.0f);
        return RawRead::of(spec.inverted ? -v : v);
    }

} ///< namespace ppm.
