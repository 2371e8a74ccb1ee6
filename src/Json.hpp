/**
 * MIT License
 *
 * @brief Load a PpmConfig from a JSON document (ArduinoJson 7).
 *
 * @file Json.hpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ArduinoJson.h>
#include <Types.hpp>
#include <Config.hpp>

namespace ppm
{
    /*
     * Document shape (every key optional; absent keys keep the current value):
     * {
     *   "channels": ["joy0:axis:0", "!joy0:axis:1", "joy1:button:3", "joy0:hat:0:1", "none", ...],
     *   "trim": [0, 0, 12, 0, 0, 0, 0, 0],
     *   "expo": [0.3, 0.3, 0, 0.2, 0, 0, 0, 0],
     *   "pulse": [988, 1500, 2012],
     *   "frame_us": 20000, "marker_us": 300, "min_sync_us": 3000,
     *   "polarity": "normal",
     *   "heartbeat_ticks": 25, "table_ticks": 25,
     *   "devices": [ { "raw": [0, 1023, 512] } ]
     * }
     */

    namespace detail
    {
        /// @brief Read an optional unsigned field into @p out; false if present but not an integer in [lo, hi].
        template <typename T>
        bool json_uint(JsonVariantConst v, std::uint32_t lo, std::uint32_t hi, T &out)
        {
            if (v.isNull())
                return true;
            if (!v.is<std::uint32_t>())
                return false;
            const std::uint32_t x = v.as<std::uint32_t>();
            if (x < lo || x > hi)
                return false;
            out = static_cast<T>(x);
            return true;
        }

        /**
         * @brief Fetch an optional array.
         * @param v Field.
         * @param max_len Longest accepted array.
         * @param out Array (left empty if the field is absent).
         * @param too_long Error to report when the array has more than @p max_len items.
         * @return None, JsonSchema for a non-array, or @p too_long.
         */
        inline ConfigError json_array(JsonVariantConst v, std::size_t max_len, JsonArrayConst &out,
                                      ConfigError too_long = ConfigError::JsonSchema)
        {
            out = JsonArrayConst();
            if (v.isNull())
                return ConfigError::None;
            if (!v.is<JsonArrayConst>())
                return ConfigError::JsonSchema;
            out = v.as<JsonArrayConst>();
            return (out.size() <= max_len) ? ConfigError::None : too_long;
        }
    } ///< namespace detail.

    /**
     * @brief Parse @p json and apply it on top of @p cfg.
     *
     * The result is validated before it is written back; on any error @p cfg is
     * left untouched.
     *
     * @param cfg Configuration to update.
     * @param json NUL-terminated JSON text.
     * @return ConfigError::None on success, JsonSyntax/JsonSchema for malformed
     *         documents, BadChannelSpec for a rejected mapping string, BadChannel
     *         for more than eight channel entries, or the validate() result.
     */
    inline ConfigError load_json(PpmConfig &cfg, const char *json)
    {
        if (json == nullptr)
            return ConfigError::JsonSyntax;

        JsonDocument doc;
        const DeserializationError derr = deserializeJson(doc, json);
        if (derr)
            return ConfigError::JsonSyntax;
        if (!doc.is<JsonObjectConst>())
            return ConfigError::JsonSchema;
        const JsonObjectConst root = doc.as<JsonObjectConst>();

        PpmConfig c = cfg;
        JsonArrayConst arr;
        ConfigError err = ConfigError::None;

        // ---- Channels ---- //
        err = detail::json_array(root["channels"], PpmConfig::N, arr, ConfigError::BadChannel);
        if (err != ConfigError::None)
            return err;
        std::size_t i = 0;
        for (JsonVariantConst v : arr)
        {
            if (!v.is<const char *>())
                return ConfigError::JsonSchema;
            if (!c.map(i, v.as<const char *>()))
                return ConfigError::BadChannelSpec;
            ++i;
        }

        // ---- Trim & expo ---- //
        err = detail::json_array(root["trim"], PpmConfig::N, arr, ConfigError::BadChannel);
        if (err != ConfigError::None)
            return err;
        i = 0;
        for (JsonVariantConst v : arr)
        {
            if (!v.is<int>())
                return ConfigError::JsonSchema;
            c.channel(i++).trim_us(v.as<int>());
        }

        err = detail::json_array(root["expo"], PpmConfig::N, arr, ConfigError::BadChannel);
        if (err != ConfigError::None)
            return err;
        i = 0;
        for (JsonVariantConst v : arr)
        {
            if (!v.is<float>())
                return ConfigError::JsonSchema;
            const float e = v.as<float>();
            if (!(e >= 0.0f && e <= 1.0f))
                return ConfigError::BadExpo;
            c.tuning[i++].expo = e;
        }

        // ---- Pulse limits & timing ---- //
        JsonVariantConst pulse = root["pulse"];
        if (!pulse.isNull())
        {
            if (!pulse.is<JsonArrayConst>() || pulse.size() != 3)
                return ConfigError::JsonSchema;
            for (std::size_t k = 0; k < 3; ++k)
                if (!pulse[k].is<std::uint16_t>())
                    return ConfigError::JsonSchema;
            c.pulse_range(pulse[0].as<std::uint16_t>(), pulse[1].as<std::uint16_t>(), pulse[2].as<std::uint16_t>());
        }

        if (!detail::json_uint(root["frame_us"], 1u, 0xFFFFFFFFu, c.timing.frame_us) ||
            !detail::json_uint(root["marker_us"], 1u, 0xFFFFu, c.timing.marker_us) ||
            !detail::json_uint(root["min_sync_us"], 1u, 0xFFFFu, c.timing.min_sync_us) ||
            !detail::json_uint(root["heartbeat_ticks"], 1u, 0xFFFFu, c.heartbeat_ticks) ||
            !detail::json_uint(root["table_ticks"], 0u, 0xFFFFu, c.table_ticks))
            return ConfigError::JsonSchema;

        JsonVariantConst pol = root["polarity"];
        if (!pol.isNull())
        {
            const char *p = pol.as<const char *>();
            if (p == nullptr)
                return ConfigError::JsonSchema;
            if (std::strcmp(p, "normal") == 0)
                c.polarity = Polarity::Normal;
            else if (std::strcmp(p, "inverted") == 0)
                c.polarity = Polarity::Inverted;
            else
                return ConfigError::JsonSchema;
        }

        // ---- Device calibration ---- //
        err = detail::json_array(root["devices"], kMaxDevices, arr, ConfigError::BadDevice);
        if (err != ConfigError::None)
            return err;
        i = 0;
        for (JsonVariantConst d : arr)
        {
            JsonVariantConst raw = d["raw"];
            if (!raw.is<JsonArrayConst>() || raw.size() != 3 ||
                !raw[0].is<std::int32_t>() || !raw[1].is<std::int32_t>() || !raw[2].is<std::int32_t>())
                return ConfigError::JsonSchema;
            c.calibrate(i++, raw[0].as<std::int32_t>(), raw[1].as<std::int32_t>(), raw[2].as<std::int32_t>());
        }

        err = validate(c);
        if (err != ConfigError::None)
            return err;

        cfg = c;
        return ConfigError::None;
    }

} ///< namespace ppm.
