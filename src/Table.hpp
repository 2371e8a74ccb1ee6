/**
 * MIT License
 *
 * @brief Console channel table (mapping and computed pulse width per channel).
 *
 * @file Table.hpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <Types.hpp>
#include <Config.hpp>
#include <SpecParser.hpp>

namespace ppm
{
    constexpr std::size_t kTableLineLen = 64; ///< Longest table line incl. NUL.

    /**
     * @brief Print the channel table.
     *
     * Use it to check mappings and trims before connecting the transmitter.
     *
     * @tparam Log Any Print-like sink with print(const char*) and println().
     * @param log Sink (e.g. Serial).
     * @param cfg Active configuration.
     * @param frame Last assembled frame, or nullptr while idle (pulses shown as "-").
     * @param devices Attached device count.
     */
    template <typename Log>
    inline void print_table(Log &log, const PpmConfig &cfg, const PulseFrame *frame, std::size_t devices)
    {
        static const char *const kRule = "------------------------------------------";
        char line[kTableLineLen];
        char map[32];

        log.print("PPM Channels Output (us):");
        log.println();
        log.print(kRule);
        log.println();
        std::snprintf(line, sizeof(line), "%-4s%-25s%10s", "Ch", "Mapping", "Pulse (us)");
        log.print(line);
        log.println();
        log.print(kRule);
        log.println();

        for (std::size_t i = 0; i < kChannelCount; ++i)
        {
            format_channel_spec(cfg.specs[i], map, sizeof(map));
            if (frame)
                std::snprintf(line, sizeof(line), "%-4u%-25s%10u", static_cast<unsigned>(i), map,
                              static_cast<unsigned>(frame->channels[i]));
            else
                std::snprintf(line, sizeof(line), "%-4u%-25s%10s", static_cast<unsigned>(i), map, "-");
            log.print(line);
            log.println();
        }

        log.print(kRule);
        log.println();
        if (devices == 0)
            log.print("No joystick detected, so no PPM output is sent.");
        else
            log.print("Joystick(s) detected.");
        log.println();
    }

} ///< namespace ppm.
