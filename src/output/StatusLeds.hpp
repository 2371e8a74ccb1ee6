/**
 * MIT License
 *
 * @brief Two status LEDs: "ready" (steady) and "alive" (heartbeat).
 *
 * @file StatusLeds.hpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

#include <cstdint>
#include <Arduino.h>

namespace ppm
{
    class StatusLeds
    {
    public:
        /**
         * @brief Configure both pins and switch the LEDs off.
         * @param readyPin Ready LED (red).
         * @param alivePin Heartbeat LED (green).
         * @param activeHigh true if a HIGH pin lights the LED.
         */
        void begin(std::uint8_t readyPin, std::uint8_t alivePin, bool activeHigh = true)
        {
            ready_ = readyPin;
            alive_ = alivePin;
            on_ = activeHigh ? HIGH : LOW;
            pinMode(ready_, OUTPUT);
            pinMode(alive_, OUTPUT);
            setReady(false);
            setAlive(false);
        }

        void setReady(bool on) { digitalWrite(ready_, on ? on_ : !on_); }
        void setAlive(bool on) { digitalWrite(alive_, on ? on_ : !on_); }

    private:
        std::uint8_t ready_{LED_BUILTIN};
        std::uint8_t alive_{LED_BUILTIN};
        std::uint8_t on_{HIGH};
    };

} ///< namespace ppm.
