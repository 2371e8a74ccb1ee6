/**
 * MIT License
 *
 * @brief Central constants.
 *
 * @file Constants.hpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace ppm
{
    // Frame layout.
    constexpr std::size_t kChannelCount = 8;                          ///< Channels per PPM frame.
    constexpr std::size_t kStepsPerFrame = 2 * (kChannelCount + 1);   ///< Marker + remainder for each channel and the sync.
    constexpr std::size_t kMaxDevices = 4;                            ///< Logical joystick slots.
    constexpr std::size_t kEventQueueDepth = 16;                      ///< Pending hotplug events.

    // Default pulse widths (µs).
    constexpr std::uint16_t kDefaultMinPulseUs = 988;  ///< Full negative deflection.
    constexpr std::uint16_t kDefaultMidPulseUs = 1500; ///< Neutral.
    constexpr std::uint16_t kDefaultMaxPulseUs = 2012; ///< Full positive deflection.

    // Default frame timing (µs).
    constexpr std::uint32_t kDefaultFrameUs = 20000;  ///< Nominal frame period.
    constexpr std::uint16_t kDefaultMarkerUs = 300;   ///< Fixed marker that opens every pulse.
    constexpr std::uint16_t kDefaultMinSyncUs = 3000; ///< Shortest sync a receiver still recognises.

    // Sanity bounds for configuration.
    constexpr std::uint16_t kPulseFloorUs = 500;    ///< Lowest accepted MIN pulse.
    constexpr std::uint16_t kPulseCeilUs = 2500;    ///< Highest accepted MAX pulse.
    constexpr std::uint32_t kFrameFloorUs = 5000;   ///< Shortest accepted frame.
    constexpr std::uint32_t kFrameCeilUs = 40000;   ///< Longest accepted frame.
    constexpr std::int16_t kTrimLimitUs = 500;      ///< |trim| accepted by the builder.

    // USB HID joysticks report the hat switch as generic-desktop usage 0x39.
    constexpr std::uint8_t kHatAxisIndex = 9; ///< Axis slot holding the hat direction (0..7, else centred).
} ///< namespace ppm.
