/**
 * MIT License
 *
 * @brief Frame assembler: eight mapped and shaped channels plus the sync pulse.
 *
 * @file Assembler.hpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

#include <cstdint>
#include <Types.hpp>
#include <Config.hpp>
#include <Registry.hpp>
#include <Mapper.hpp>
#include <Shaper.hpp>

namespace ppm
{
    /**
     * @brief Sync width that completes a frame.
     * @param channel_sum Sum of the channel widths (µs).
     * @param t Frame timing.
     * @param clamped Set to true when the minimum sync was applied.
     * @return frame_us - channel_sum, raised to min_sync_us if shorter.
     */
    static inline std::uint32_t compute_sync(std::uint32_t channel_sum, const FrameTiming &t, bool &clamped)
    {
        const std::uint32_t min_sync = t.min_sync_us;
        clamped = (channel_sum >= t.frame_us) || (t.frame_us - channel_sum < min_sync);
        return clamped ? min_sync : (t.frame_us - channel_sum);
    }

    /**
     * @brief Builds one PulseFrame per tick from the configured channel sources.
     *
     * A channel whose device or control is missing degrades to neutral; the
     * frame itself never fails.
     */
    class FrameAssembler
    {
    public:
        /**
         * @brief Construct over a configuration.
         * @param cfg Validated configuration (not owned; must outlive the assembler).
         */
        explicit FrameAssembler(const PpmConfig &cfg) : cfg_(cfg) {}

        /**
         * @brief Assemble a frame against a registry snapshot.
         * @tparam Device Device type held by the registry.
         * @param snap Snapshot taken for this tick.
         * @return Complete frame.
         */
        template <typename Device>
        PulseFrame assemble(const RegistrySnapshot<Device> &snap) const
        {
            PulseFrame f{};
            for (std::size_t i = 0; i < kChannelCount; ++i)
            {
                RawRead r = resolve_channel(cfg_.specs[i], snap);
                if (!r.ok)
                {
                    r = RawRead::of(kNeutralRaw);
                    f.degraded_mask = static_cast<std::uint8_t>(f.degraded_mask | (1u << i));
                }
                f.channels[i] = shape(r.value, cfg_.tuning[i], cfg_.limits);
            }
            f.sync_us = compute_sync(f.channel_sum(), cfg_.timing, f.sync_clamped);
            return f;
        }

        /**
         * @brief Assemble a frame, taking a fresh snapshot of @p reg.
         * @param reg Device registry.
         * @return Complete frame.
         */
        template <typename Device, typename Lock>
        PulseFrame assemble(const DeviceRegistry<Device, Lock> &reg) const
        {
            return assemble(reg.snapshot());
        }

        /// @brief Frame with every channel at neutral (no devices consulted).
        PulseFrame neutral() const
        {
            PulseFrame f{};
            for (std::size_t i = 0; i < kChannelCount; ++i)
                f.channels[i] = shape(kNeutralRaw, cfg_.tuning[i], cfg_.limits);
            f.sync_us = compute_sync(f.channel_sum(), cfg_.timing, f.sync_clamped);
            return f;
        }

        const PpmConfig &config() const noexcept { return cfg_; }

    private:
        const PpmConfig &cfg_; ///< Active configuration.
    };

} ///< namespace ppm.
