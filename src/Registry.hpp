/**
 * MIT License
 *
 * @brief DeviceRegistry: lock-guarded table of attached input devices.
 *
 * @file Registry.hpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <Types.hpp>
#include <Constants.hpp>
#include <EventQueue.hpp>

namespace ppm
{
    /// @brief Lock policy for single-context use (hotplug and tick on the same loop).
    struct NullLock
    {
        void lock() noexcept {}
        void unlock() noexcept {}
    };

    /// @brief One logical device slot.
    template <typename Device>
    struct DeviceSlot
    {
        Device *handle{nullptr}; ///< nullptr = Empty.
        DeviceInfo info{};       ///< Capabilities captured at attach.

        bool occupied() const noexcept { return handle != nullptr; }
    };

    /**
     * @brief Copy of the slot table taken under the registry lock.
     *
     * A tick reads every channel against one snapshot, so a frame never mixes
     * the device lists from before and after a hotplug event.
     */
    template <typename Device>
    struct RegistrySnapshot
    {
        DeviceSlot<Device> slots[kMaxDevices]{}; ///< Slot copies.
        std::uint8_t count{0};                   ///< Occupied slots.

        /// @brief Slot at @p idx if occupied, else nullptr.
        const DeviceSlot<Device> *find(std::size_t idx) const noexcept
        {
            return (idx < kMaxDevices && slots[idx].occupied()) ? &slots[idx] : nullptr;
        }
    };

    /**
     * @brief Logical device slots updated by hotplug attach/detach.
     *
     * Slot policy: an attaching device takes the lowest free index. Re-attaching
     * a handle that is already present returns its current index. Every public
     * call holds the lock for its whole duration.
     *
     * @tparam Device Device type (handle = Device*; not owned).
     * @tparam Lock BasicLockable policy for std::lock_guard (NullLock, std::mutex, IrqLock).
     */
    template <typename Device, typename Lock = NullLock>
    class DeviceRegistry
    {
    public:
        using Event = HotplugEvent<Device>;
        using Snapshot = RegistrySnapshot<Device>;

        /**
         * @brief Attach a device immediately.
         * @param handle Device handle (must outlive its slot).
         * @param info Capability metadata.
         * @return Assigned slot, or -1 if @p handle is null or the table is full.
         */
        int on_attach(Device *handle, const DeviceInfo &info)
        {
            std::lock_guard<Lock> g(lock_);
            return attach_locked(handle, info);
        }

        /**
         * @brief Detach a device immediately.
         * @param handle Device handle.
         * @return Freed slot, or -1 if the handle was not attached.
         */
        int on_detach(Device *handle)
        {
            std::lock_guard<Lock> g(lock_);
            return detach_locked(handle);
        }

        /**
         * @brief Queue an attach from the hotplug context; applied by process_events().
         * @return false if the queue is full.
         */
        bool post_attach(Device *handle, const DeviceInfo &info)
        {
            Event e;
            e.kind = HotplugKind::Attach;
            e.handle = handle;
            e.info = info;
            return post(e);
        }

        /**
         * @brief Queue a detach from the hotplug context; applied by process_events().
         * @return false if the queue is full.
         */
        bool post_detach(Device *handle)
        {
            Event e;
            e.kind = HotplugKind::Detach;
            e.handle = handle;
            return post(e);
        }

        /**
         * @brief Apply queued events in arrival order.
         * @param fn Called as fn(const Event&) after each event is applied (lock released);
         *           Event::slot holds the slot assigned/freed or -1.
         * @return Number of events applied.
         */
        template <typename Fn>
        std::size_t process_events(Fn &&fn)
        {
            std::size_t n = 0;
            for (;;)
            {
                Event e;
                {
                    std::lock_guard<Lock> g(lock_);
                    if (!queue_.pop(e))
                        break;
                    e.slot = (e.kind == HotplugKind::Attach) ? attach_locked(e.handle, e.info)
                                                             : detach_locked(e.handle);
                }
                ++n;
                fn(static_cast<const Event &>(e));
            }
            return n;
        }

        /// @brief Apply queued events without a callback.
        std::size_t process_events()
        {
            return process_events([](const Event &) {});
        }

        /// @brief True iff at least one slot is occupied. O(1).
        bool any_present() const
        {
            std::lock_guard<Lock> g(lock_);
            return count_ != 0;
        }

        /// @brief Occupied slot count.
        std::size_t device_count() const
        {
            std::lock_guard<Lock> g(lock_);
            return count_;
        }

        /// @brief Axis count of the device in @p idx, or nullopt if the slot is empty.
        std::optional<std::uint8_t> axis_count(std::size_t idx) const
        {
            std::lock_guard<Lock> g(lock_);
            if (idx >= kMaxDevices || !slots_[idx].occupied())
                return std::nullopt;
            return slots_[idx].info.axis_count;
        }

        /// @brief Slot holding @p handle, or -1.
        int slot_of(const Device *handle) const
        {
            std::lock_guard<Lock> g(lock_);
            return find_locked(handle);
        }

        /// @brief Copy the slot table for one tick.
        Snapshot snapshot() const
        {
            std::lock_guard<Lock> g(lock_);
            Snapshot s;
            for (std::size_t i = 0; i < kMaxDevices; ++i)
                s.slots[i] = slots_[i];
            s.count = count_;
            return s;
        }

        /// @brief True while posted events wait for process_events().
        bool pending() const
        {
            std::lock_guard<Lock> g(lock_);
            return !queue_.empty();
        }

        /// @brief Events refused because the queue was full.
        std::uint32_t dropped_events() const
        {
            std::lock_guard<Lock> g(lock_);
            return dropped_;
        }

        /**
         * @brief Internal consistency check (count matches slots, no duplicate handles).
         * @return true if consistent.
         */
        bool consistent() const
        {
            std::lock_guard<Lock> g(lock_);
            std::uint8_t n = 0;
            for (std::size_t i = 0; i < kMaxDevices; ++i)
            {
                if (!slots_[i].occupied())
                    continue;
                ++n;
                for (std::size_t j = i + 1; j < kMaxDevices; ++j)
                    if (slots_[j].handle == slots_[i].handle)
                        return false;
            }
            return n == count_;
        }

    private:
        bool post(const Event &e)
        {
            std::lock_guard<Lock> g(lock_);
            if (queue_.push(e))
                return true;
            ++dropped_;
            return false;
        }

        int find_locked(const Device *handle) const
        {
            if (handle == nullptr)
                return -1;
            for (std::size_t i = 0; i < kMaxDevices; ++i)
                if (slots_[i].handle == handle)
                    return static_cast<int>(i);
            return -1;
        }

        int attach_locked(Device *handle, const DeviceInfo &info)
        {
            if (handle == nullptr)
                return -1;
            const int existing = find_locked(handle);
            if (existing >= 0)
            {
                slots_[existing].info = info; ///< Capabilities may have grown since the first report.
                return existing;
            }
            for (std::size_t i = 0; i < kMaxDevices; ++i)
            {
                if (!slots_[i].occupied())
                {
                    slots_[i].handle = handle;
                    slots_[i].info = info;
                    ++count_;
                    return static_cast<int>(i);
                }
            }
            return -1;
        }

        int detach_locked(Device *handle)
        {
            const int i = find_locked(handle);
            if (i < 0)
                return -1;
            slots_[i] = DeviceSlot<Device>{};
            --count_;
            return i;
        }

        mutable Lock lock_{};                                ///< Guards everything below.
        DeviceSlot<Device> slots_[kMaxDevices]{};            ///< Logical slots.
        std::uint8_t count_{0};                              ///< Occupied slots.
        EventQueue<Event, kEventQueueDepth> queue_{};        ///< Pending hotplug events.
        std::uint32_t dropped_{0};                           ///< Events lost to a full queue.
    };

} ///< namespace ppm.
