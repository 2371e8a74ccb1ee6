/**
 * MIT License
 *
 * @brief Signal shaping: expo, symmetric scaling to pulse width, trim and clamp.
 *
 * @file Shaper.hpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

#include <cstdint>
#include <Types.hpp>

namespace ppm
{
    /// @brief Clamp integer v to [lo, hi].
    static inline int clampi(int v, int lo, int hi)
    {
        return (v < lo) ? lo : ((v > hi) ? hi : v);
    }

    /// @brief Clamp float v to [lo, hi]; NaN maps to 0.
    static inline float clampf(float v, float lo, float hi)
    {
        if (!(v == v))
            return 0.0f;
        return (v < lo) ? lo : ((v > hi) ? hi : v);
    }

    /// @brief Round half away from zero.
    static inline int round_away(float y)
    {
        return static_cast<int>(y >= 0 ? y + 0.5f : y - 0.5f);
    }

    /**
     * @brief Cubic expo blend: (1 - e) * x + e * x^3.
     * @param x Normalized input in [-1, 1].
     * @param e Expo factor in [0, 1].
     * @return Shaped value; keeps the sign and the ±1 endpoints.
     */
    static inline float apply_expo(float x, float e)
    {
        if (e <= 0.0f)
            return x;
        if (e >= 1.0f)
            return x * x * x;
        return (1.0f - e) * x + e * (x * x * x);
    }

    /**
     * @brief Convert a normalized control value into a pulse width.
     *
     * MID sits at 0 and the span above and below MID is the same half range,
     * so equal |raw| gives equal distance from MID. Trim is applied after scaling
     * and the result never leaves [min_us, max_us].
     *
     * @param raw Control value in [-1, 1] (clamped).
     * @param t Channel trim and expo.
     * @param lim Pulse limits.
     * @return Pulse width in microseconds.
     */
    static inline std::uint16_t shape(float raw, const ChannelTuning &t, const PulseLimits &lim)
    {
        const float x = apply_expo(clampf(raw, -1.0f, 1.0f), clampf(t.expo, 0.0f, 1.0f));
        const float half = 0.5f * static_cast<float>(lim.max_us - lim.min_us);
        int us = static_cast<int>(lim.mid_us) + round_away(x * half);
        us += t.trim_us;
        return static_cast<std::uint16_t>(clampi(us, lim.min_us, lim.max_us));
    }

    /**
     * @brief Map an integer HID reading to [-1, 1] using a device's calibration.
     *
     * Each side of the center is scaled on its own, so an off-center rest
     * position still reaches both ends. raw_lo may be above raw_hi for a
     * reversed control.
     *
     * @param raw HID sample.
     * @param cal Calibration (lo, hi, center).
     * @return Normalized value; 0 at center, clamped to [-1, 1].
     */
    static inline float normalize_axis(std::int32_t raw, const AxisCalibration &cal)
    {
        const float d = static_cast<float>(raw - cal.raw_center);
        const std::int32_t edge = (((raw - cal.raw_center) >= 0) == (cal.raw_hi >= cal.raw_center)) ? cal.raw_hi : cal.raw_lo;
        const float span = static_cast<float>(edge - cal.raw_center);
        if (span == 0.0f)
            return 0.0f;
        float x = d / span;
        if (edge == cal.raw_lo)
            x = -x;
        return clampf(x, -1.0f, 1.0f);
    }

} ///< namespace ppm.
