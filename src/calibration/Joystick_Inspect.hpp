/**
 * MIT License
 *
 * @brief Interactive USB joystick inspector (live events + calibration suggestions).
 *
 * @file Joystick_Inspect.hpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <Arduino.h>
#include <USBHost_t36.h>
#include <Constants.hpp>
#include <input/UsbJoystick_Teensy.hpp>

namespace ppm::inspect
{
    // ---- Tunables ---- //

    constexpr int kMotionThresh = 2;     ///< Raw delta reported as motion.
    constexpr int kMaxAxes = 16;         ///< Axes tracked per joystick.
    constexpr int kSettleMs = 500;       ///< Rest period used for the center estimate.

    /// @brief Per-joystick running stats.
    struct Stats
    {
        int minv[kMaxAxes]{};    ///< Lowest raw value seen.
        int maxv[kMaxAxes]{};    ///< Highest raw value seen.
        int last[kMaxAxes]{};    ///< Last reported raw value.
        int rest[kMaxAxes]{};    ///< Value at the start (assumed centered).
        std::uint32_t buttons{0}; ///< Last button bitmap.
        int hat{-1};             ///< Last hat direction.
        bool seen{false};        ///< Connected at least once.
    };

    /// @brief Reset @p s to "nothing observed".
    static inline void reset(Stats &s)
    {
        for (int i = 0; i < kMaxAxes; ++i)
        {
            s.minv[i] = 32767;
            s.maxv[i] = -32768;
            s.last[i] = -99999;
            s.rest[i] = -99999;
        }
        s.buttons = 0;
        s.hat = -1;
        s.seen = false;
    }

    static inline const char *hat_name(int dir)
    {
        static const char *const kNames[8] = {"N", "NE", "E", "SE", "S", "SW", "W", "NW"};
        return (dir >= 0 && dir < 8) ? kNames[dir] : "centered";
    }

    /**
     * @brief Print every axis, button and hat change until a key is pressed, then
     * suggest a "devices" block for the JSON configuration.
     *
     * @param usb Host stack (serviced here).
     * @param devs Joystick adapters (index = logical joyN).
     * @param n Entries in @p devs (≤ kMaxDevices are reported).
     */
    inline void run_joysticks(USBHost &usb, UsbJoystick *const *devs, std::size_t n)
    {
        if (n > kMaxDevices)
            n = kMaxDevices;

        Stats st[kMaxDevices];
        for (std::size_t d = 0; d < n; ++d)
            reset(st[d]);

        delay(3000); ///< Allow time for serial monitor to start.

        // Banners (press key to begin).
        Serial.println(F("\n------------------------------- Joystick Inspector -------------------------------\n"));
        Serial.println(F("• Plug in your joystick(s); each one is listed as joyN in attach order."));
        Serial.println(F("• Leave the sticks centered when sampling starts."));
        Serial.println(F("• Then move every axis to both extremes, press buttons and work the hat."));
        Serial.println(F("• Press ANY key to BEGIN sampling. Press ANY key again to STOP.\n"));
        Serial.println(F("----------------------------------------------------------------------------------\n"));
        Serial.print(F("Waiting for key to begin... "));
        while (!Serial.available())
        {
            usb.Task();
            delay(10);
        }
        while (Serial.available())
            (void)Serial.read();
        Serial.println(F("Go!\n"));

        const std::uint32_t t0 = millis();
        while (true)
        {
            if (Serial.available())
            {
                while (Serial.available())
                    (void)Serial.read();
                break;
            }

            usb.Task();
            const bool settling = (millis() - t0) < static_cast<std::uint32_t>(kSettleMs);

            for (std::size_t d = 0; d < n; ++d)
            {
                UsbJoystick &js = *devs[d];
                Stats &s = st[d];
                if (!js.connected())
                {
                    if (s.seen)
                    {
                        Serial.printf("[joy%u] disconnected\n", static_cast<unsigned>(d));
                        reset(s);
                    }
                    continue;
                }
                if (!s.seen)
                {
                    const DeviceInfo info = js.info();
                    Serial.printf("[joy%u] %04x:%04x, %u axes, %u hat(s)\n", static_cast<unsigned>(d),
                                  static_cast<unsigned>(js.vendor()), static_cast<unsigned>(js.product()),
                                  static_cast<unsigned>(info.axis_count), static_cast<unsigned>(info.hat_count));
                    s.seen = true;
                }

                const DeviceInfo info = js.info();
                const int axes = info.axis_count < kMaxAxes ? info.axis_count : kMaxAxes;
                for (int a = 0; a < axes; ++a)
                {
                    if (a == kHatAxisIndex && info.hat_count)
                        continue;
                    const int raw = js.rawAxis(static_cast<std::uint8_t>(a));
                    if (settling || s.rest[a] == -99999)
                        s.rest[a] = raw;
                    if (raw < s.minv[a])
                        s.minv[a] = raw;
                    if (raw > s.maxv[a])
                        s.maxv[a] = raw;
                    if (s.last[a] == -99999 || std::abs(raw - s.last[a]) >= kMotionThresh)
                    {
                        s.last[a] = raw;
                        float v = 0.0f;
                        (void)js.readAxis(static_cast<std::uint8_t>(a), v);
                        Serial.printf("[joy%u] axis %d: raw %d (%.3f)\n", static_cast<unsigned>(d), a, raw, static_cast<double>(v));
                    }
                }

                const std::uint32_t b = js.rawButtons();
                const std::uint32_t changed = b ^ s.buttons;
                for (int i = 0; i < 32; ++i)
                    if (changed & (1u << i))
                        Serial.printf("[joy%u] button %d %s\n", static_cast<unsigned>(d), i,
                                      (b & (1u << i)) ? "pressed" : "released");
                s.buttons = b;

                if (info.hat_count)
                {
                    int h = js.rawAxis(kHatAxisIndex);
                    if (h < 0 || h > 7)
                        h = -1;
                    if (h != s.hat)
                    {
                        s.hat = h;
                        Serial.printf("[joy%u] hat 0: %s (x %d, y %d)\n", static_cast<unsigned>(d), hat_name(h),
                                      static_cast<int>(hat_component(h, HatAxis::Horizontal)),
                                      static_cast<int>(hat_component(h, HatAxis::Vertical)));
                    }
                }
            }
            delay(5);
        }

        // Summary (raw).
        Serial.println(F("\n---------------------------------- Summary (raw) ----------------------------------\n"));
        Serial.println(F("Joy | Axis |    Min |    Max |   Rest"));
        Serial.println(F("----|------|--------|--------|-------"));
        for (std::size_t d = 0; d < n; ++d)
        {
            for (int a = 0; a < kMaxAxes; ++a)
            {
                if (st[d].minv[a] > st[d].maxv[a])
                    continue;
                Serial.printf("%3u | %4d | %6d | %6d | %6d\n", static_cast<unsigned>(d), a,
                              st[d].minv[a], st[d].maxv[a], st[d].rest[a]);
            }
        }

        // One calibration per device: widest observed axis range, median rest.
        Serial.println(F("\n----------------------------------- Suggestions -----------------------------------\n"));
        Serial.println(F("\"devices\": ["));
        for (std::size_t d = 0; d < n; ++d)
        {
            int lo = 32767, hi = -32768;
            long rest_sum = 0;
            int rest_n = 0;
            for (int a = 0; a < kMaxAxes; ++a)
            {
                if (st[d].minv[a] > st[d].maxv[a])
                    continue;
                if (st[d].minv[a] < lo)
                    lo = st[d].minv[a];
                if (st[d].maxv[a] > hi)
                    hi = st[d].maxv[a];
                rest_sum += st[d].rest[a];
                ++rest_n;
            }
            const AxisCalibration cur = devs[d]->calibration();
            if (rest_n == 0 || hi - lo < 2)
            {
                lo = cur.raw_lo;
                hi = cur.raw_hi;
            }
            int center = rest_n ? static_cast<int>(rest_sum / rest_n) : (lo + hi) / 2;
            if (center <= lo || center >= hi)
                center = (lo + hi) / 2;
            Serial.printf("  { \"raw\": [%d, %d, %d] }%s\n", lo, hi, center, (d + 1 < n) ? "," : "");
        }
        Serial.println(F("]"));
        Serial.println(F("\nCopy this block into your JSON configuration; map channels as joyN:axis:A."));
    }

} ///< namespace ppm::inspect.
