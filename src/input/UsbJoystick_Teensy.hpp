/**
 * MIT License
 *
 * @brief USB host joystick input for Teensy 3.6/4.x (USBHost_t36).
 *
 * @file UsbJoystick_Teensy.hpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

#include <USBHost_t36.h>
#include <Registry.hpp>
#include <input/HidJoystick.hpp>

namespace ppm
{
    /// @brief Joystick read through a USBHost_t36 JoystickController.
    using UsbJoystick = HidJoystick<JoystickController>;

    /// @brief Hotplug poller over UsbJoystick adapters.
    template <typename Lock = NullLock>
    using UsbHotplug = HidHotplug<UsbJoystick, Lock>;

} ///< namespace ppm.
