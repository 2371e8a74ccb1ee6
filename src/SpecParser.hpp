/**
 * MIT License
 *
 * @brief Text form of channel sources: "none" | "[!]joy<D>:axis:<A>" | "[!]joy<D>:button:<B>" | "[!]joy<D>:hat:<H>:<0|1>".
 *
 * @file SpecParser.hpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <Types.hpp>
#include <Constants.hpp>

namespace ppm
{
    namespace detail
    {
        /// @brief Consume a literal prefix; advances @p p on success.
        inline bool eat(const char *&p, const char *lit)
        {
            const std::size_t n = std::strlen(lit);
            if (std::strncmp(p, lit, n) != 0)
                return false;
            p += n;
            return true;
        }

        /// @brief Consume a decimal number in [0, max]; advances @p p on success.
        inline bool eat_uint(const char *&p, unsigned max, unsigned &out)
        {
            if (*p < '0' || *p > '9')
                return false;
            unsigned v = 0;
            while (*p >= '0' && *p <= '9')
            {
                v = v * 10u + static_cast<unsigned>(*p - '0');
                if (v > max)
                    return false;
                ++p;
            }
            out = v;
            return true;
        }
    } ///< namespace detail.

    /**
     * @brief Parse a mapping string into a channel spec.
     * @param text Mapping text (NUL-terminated). nullptr and "" are treated as "none".
     * @param out Receives the parsed spec; untouched on failure.
     * @return true if the text was well formed and the indices are in range.
     */
    inline bool parse_channel_spec(const char *text, ChannelSpec &out)
    {
        if (text == nullptr || *text == '\0' || std::strcmp(text, "none") == 0)
        {
            out = ChannelSpec::none();
            return true;
        }

        const char *p = text;
        const bool inv = (*p == '!');
        if (inv)
            ++p;

        unsigned dev = 0;
        if (!detail::eat(p, "joy") || !detail::eat_uint(p, static_cast<unsigned>(kMaxDevices - 1), dev) || !detail::eat(p, ":"))
            return false;

        unsigned idx = 0;
        ChannelSpec s{};
        if (detail::eat(p, "axis:"))
        {
            if (!detail::eat_uint(p, 255, idx))
                return false;
            s = ChannelSpec::axis(static_cast<std::uint8_t>(dev), static_cast<std::uint8_t>(idx), inv);
        }
        else if (detail::eat(p, "button:"))
        {
            if (!detail::eat_uint(p, 255, idx))
                return false;
            s = ChannelSpec::button(static_cast<std::uint8_t>(dev), static_cast<std::uint8_t>(idx), inv);
        }
        else if (detail::eat(p, "hat:"))
        {
            unsigned sub = 0;
            if (!detail::eat_uint(p, 255, idx) || !detail::eat(p, ":") || !detail::eat_uint(p, 1, sub))
                return false;
            s = ChannelSpec::hat(static_cast<std::uint8_t>(dev), static_cast<std::uint8_t>(idx),
                                 sub == 0 ? HatAxis::Horizontal : HatAxis::Vertical, inv);
        }
        else
        {
            return false;
        }

        if (*p != '\0')
            return false; ///< Trailing garbage.

        out = s;
        return true;
    }

    /**
     * @brief Render a spec back to its mapping text.
     * @param s Spec to render.
     * @param buf Output buffer (always NUL-terminated when n > 0).
     * @param n Buffer size.
     * @return Characters that the full text needs (excluding NUL), as snprintf.
     */
    inline int format_channel_spec(const ChannelSpec &s, char *buf, std::size_t n)
    {
        const char *bang = s.inverted ? "!" : "";
        switch (s.kind)
        {
        case SourceKind::Axis:
            return std::snprintf(buf, n, "%sjoy%u:axis:%u", bang, static_cast<unsigned>(s.device), static_cast<unsigned>(s.index));
        case SourceKind::Button:
            return std::snprintf(buf, n, "%sjoy%u:button:%u", bang, static_cast<unsigned>(s.device), static_cast<unsigned>(s.index));
        case SourceKind::Hat:
            return std::snprintf(buf, n, "%sjoy%u:hat:%u:%u", bang, static_cast<unsigned>(s.device), static_cast<unsigned>(s.index),
                                 s.hat_axis == HatAxis::Horizontal ? 0u : 1u);
        case SourceKind::Unmapped:
        default:
            return std::snprintf(buf, n, "none");
        }
    }

} ///< namespace ppm.
