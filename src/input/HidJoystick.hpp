/**
 * MIT License
 *
 * @brief USB HID joystick adapter and hotplug poller over a joystick controller.
 *
 * @file HidJoystick.hpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <Types.hpp>
#include <Constants.hpp>
#include <Shaper.hpp>
#include <Mapper.hpp>
#include <Registry.hpp>

namespace ppm
{
    /**
     * @brief One USB joystick, read through a HID joystick controller.
     *
     * Integer HID samples are normalized with the device's AxisCalibration.
     * The hat switch arrives as axis kHatAxisIndex (direction 0..7).
     *
     * @tparam Controller Provides operator bool, axisMask(), getAxis(i),
     *         getButtons(), idVendor() and idProduct() (USBHost_t36 JoystickController).
     */
    template <typename Controller>
    class HidJoystick
    {
    public:
        explicit HidJoystick(Controller &jc) : jc_(jc) {}

        /// @brief Set the raw HID range used by readAxis().
        void calibrate(const AxisCalibration &c) { cal_ = c; }

        const AxisCalibration &calibration() const noexcept { return cal_; }

        /// @brief True while the controller is claimed by the USB host stack.
        bool connected() { return static_cast<bool>(jc_); }

        /**
         * @brief Capabilities from the report descriptor.
         *
         * Axis count is the highest reported axis + 1, so it may cover unreported
         * slots and the hat slot; readAxis() refuses those. A hat is present when
         * the hat usage is in the axis mask.
         *
         * @return DeviceInfo (all zero if nothing is reported yet).
         */
        DeviceInfo info()
        {
            DeviceInfo d{};
            const std::uint64_t mask = jc_.axisMask();
            for (std::uint8_t i = 0; i < 64; ++i)
                if (mask & (std::uint64_t{1} << i))
                    d.axis_count = static_cast<std::uint8_t>(i + 1);
            d.button_count = kUsbButtons;
            d.hat_count = has_axis(kHatAxisIndex) ? 1 : 0;
            return d;
        }

        /// @brief Normalized axis; false for axes the descriptor does not report and for the hat slot.
        bool readAxis(std::uint8_t axis, float &out)
        {
            if (!connected() || axis >= 64 || axis == kHatAxisIndex || !has_axis(axis))
                return false;
            out = normalize_axis(jc_.getAxis(axis), cal_);
            return true;
        }

        bool readButton(std::uint8_t button, bool &pressed)
        {
            if (!connected() || button >= kUsbButtons)
                return false;
            pressed = (jc_.getButtons() >> button) & 1u;
            return true;
        }

        bool readHat(std::uint8_t hat, HatAxis a, float &out)
        {
            if (!connected() || hat != 0 || !has_axis(kHatAxisIndex))
                return false;
            out = hat_component(jc_.getAxis(kHatAxisIndex), a);
            return true;
        }

        /// @brief Raw access for the inspector.
        int rawAxis(std::uint8_t axis) { return jc_.getAxis(axis); }
        std::uint32_t rawButtons() { return jc_.getButtons(); }
        std::uint16_t vendor() { return jc_.idVendor(); }
        std::uint16_t product() { return jc_.idProduct(); }

        Controller &controller() noexcept { return jc_; }

    private:
        static constexpr std::uint8_t kUsbButtons = 32; ///< getButtons() width.

        bool has_axis(std::uint8_t axis) { return (jc_.axisMask() >> axis) & 1u; }

        Controller &jc_;
        AxisCalibration cal_{};
    };

    /// @brief Scheduler attach hook: use the calibration of the slot the joystick took.
    template <typename Controller>
    inline void apply_calibration(HidJoystick<Controller> &d, const AxisCalibration &c) { d.calibrate(c); }

    /**
     * @brief Polls joystick connection state from loop() and posts hotplug events.
     *
     * A newly connected joystick is only announced once its report descriptor
     * has listed at least one axis, so the captured DeviceInfo is complete.
     * A joystick the registry turned away (all slots taken) is offered again
     * once a slot is free.
     *
     * @tparam Joystick Device type (HidJoystick<...>).
     * @tparam Lock Registry lock policy.
     */
    template <typename Joystick, typename Lock = NullLock>
    class HidHotplug
    {
    public:
        using Registry = DeviceRegistry<Joystick, Lock>;

        /**
         * @param reg Registry receiving the events.
         * @param devs Joystick adapters, one per controller instance.
         * @param n Entries in @p devs (extra entries are ignored).
         */
        HidHotplug(Registry &reg, Joystick *const *devs, std::size_t n)
            : reg_(reg), devs_(devs), n_(n < kPorts ? n : kPorts) {}

        /// @brief Poll all joysticks; posts at most one event per joystick per call.
        void poll()
        {
            for (std::size_t i = 0; i < n_; ++i)
            {
                Joystick *d = devs_[i];
                const bool up = d->connected();
                if (up && posted_[i] && refused(d))
                    posted_[i] = false;
                if (up && !posted_[i])
                {
                    const DeviceInfo info = d->info();
                    if (info.axis_count == 0)
                        continue;
                    posted_[i] = reg_.post_attach(d, info);
                }
                else if (!up && posted_[i])
                {
                    if (reg_.post_detach(d))
                        posted_[i] = false;
                }
            }
        }

    private:
        static constexpr std::size_t kPorts = 8; ///< Controllers tracked.

        /// @brief Attach was applied without a slot and one has since been freed.
        bool refused(const Joystick *d) const
        {
            return !reg_.pending() && reg_.slot_of(d) < 0 && reg_.device_count() < kMaxDevices;
        }

        Registry &reg_;
        Joystick *const *devs_;
        std::size_t n_;
        bool posted_[kPorts]{};
    };

} ///< namespace ppm.
