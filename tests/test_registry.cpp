/**
 * MIT License
 *
 * @brief Device registry: slot policy, queued hotplug, snapshots and locking.
 *
 * @file test_registry.cpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <Registry.hpp>
#include <support/Fakes.hpp>

using namespace ppm;
using ppm::test::FakeDevice;

TEST(Registry, LowestFreeSlotAndStableIndices)
{
    FakeDevice a, b, c, d, e;
    DeviceRegistry<FakeDevice> reg;
    EXPECT_FALSE(reg.any_present());

    EXPECT_EQ(reg.on_attach(&a, FakeDevice::info()), 0);
    EXPECT_EQ(reg.on_attach(&b, FakeDevice::info()), 1);
    EXPECT_EQ(reg.on_attach(&c, FakeDevice::info()), 2);
    EXPECT_EQ(reg.device_count(), 3u);

    EXPECT_EQ(reg.on_detach(&b), 1);
    EXPECT_EQ(reg.slot_of(&c), 2); ///< Others keep their index.
    EXPECT_EQ(reg.on_attach(&d, FakeDevice::info()), 1);
    EXPECT_EQ(reg.on_attach(&e, FakeDevice::info()), 3);
    EXPECT_TRUE(reg.consistent());
}

TEST(Registry, FullTableRejectsAttach)
{
    FakeDevice devs[kMaxDevices + 1];
    DeviceRegistry<FakeDevice> reg;
    for (std::size_t i = 0; i < kMaxDevices; ++i)
        EXPECT_EQ(reg.on_attach(&devs[i], FakeDevice::info()), static_cast<int>(i));
    EXPECT_EQ(reg.on_attach(&devs[kMaxDevices], FakeDevice::info()), -1);
    EXPECT_EQ(reg.device_count(), kMaxDevices);
}

TEST(Registry, ReattachKeepsIndexAndUpdatesInfo)
{
    FakeDevice a;
    DeviceRegistry<FakeDevice> reg;
    EXPECT_EQ(reg.on_attach(&a, FakeDevice::info(2, 0, 0)), 0);
    EXPECT_EQ(reg.on_attach(&a, FakeDevice::info(6, 0, 0)), 0);
    EXPECT_EQ(reg.device_count(), 1u);
    EXPECT_EQ(reg.axis_count(0), std::optional<std::uint8_t>(6));
    EXPECT_FALSE(reg.axis_count(1).has_value());
}

TEST(Registry, UnknownDetachIsIgnored)
{
    FakeDevice a, b;
    DeviceRegistry<FakeDevice> reg;
    reg.on_attach(&a, FakeDevice::info());
    EXPECT_EQ(reg.on_detach(&b), -1);
    EXPECT_EQ(reg.on_detach(nullptr), -1);
    EXPECT_EQ(reg.on_attach(nullptr, FakeDevice::info()), -1);
    EXPECT_EQ(reg.device_count(), 1u);
}

TEST(Registry, QueuedEventsApplyInOrder)
{
    FakeDevice a, b;
    DeviceRegistry<FakeDevice> reg;
    EXPECT_TRUE(reg.post_attach(&a, FakeDevice::info()));
    EXPECT_TRUE(reg.post_attach(&b, FakeDevice::info()));
    EXPECT_TRUE(reg.post_detach(&a));
    EXPECT_FALSE(reg.any_present()); ///< Nothing applied yet.
    EXPECT_TRUE(reg.pending());

    std::vector<int> slots;
    EXPECT_EQ(reg.process_events([&](const DeviceRegistry<FakeDevice>::Event &e) { slots.push_back(e.slot); }), 3u);
    EXPECT_EQ(slots, (std::vector<int>{0, 1, 0}));
    EXPECT_EQ(reg.slot_of(&a), -1);
    EXPECT_EQ(reg.slot_of(&b), 1);
    EXPECT_FALSE(reg.pending());
    EXPECT_EQ(reg.process_events(), 0u);
}

TEST(Registry, FullQueueDropsAndCounts)
{
    FakeDevice a;
    DeviceRegistry<FakeDevice> reg;
    std::size_t accepted = 0;
    for (std::size_t i = 0; i < kEventQueueDepth + 4; ++i)
        accepted += reg.post_detach(&a) ? 1u : 0u;
    EXPECT_EQ(accepted, kEventQueueDepth - 1);
    EXPECT_EQ(reg.dropped_events(), 5u);
}

TEST(Registry, SnapshotIsDetachedFromLaterChanges)
{
    FakeDevice a;
    DeviceRegistry<FakeDevice> reg;
    reg.on_attach(&a, FakeDevice::info());
    const auto snap = reg.snapshot();
    reg.on_detach(&a);
    EXPECT_EQ(snap.count, 1u);
    ASSERT_NE(snap.find(0), nullptr);
    EXPECT_EQ(snap.find(0)->handle, &a);
    EXPECT_EQ(snap.find(1), nullptr);
    EXPECT_EQ(snap.find(kMaxDevices), nullptr);
    EXPECT_EQ(reg.snapshot().count, 0u);
}

TEST(Registry, ConcurrentHotplugWithMutexStaysConsistent)
{
    FakeDevice devs[3];
    DeviceRegistry<FakeDevice, std::mutex> reg;
    std::atomic<bool> stop{false};
    std::atomic<int> bad{0};

    std::thread reader([&] {
        while (!stop.load())
        {
            const auto snap = reg.snapshot();
            std::uint8_t n = 0;
            for (const auto &s : snap.slots)
                n += s.occupied() ? 1 : 0;
            if (n != snap.count)
                bad++;
        }
    });

    std::vector<std::thread> writers;
    for (auto &d : devs)
    {
        writers.emplace_back([&reg, &d] {
            for (int i = 0; i < 2000; ++i)
            {
                reg.on_attach(&d, FakeDevice::info());
                reg.on_detach(&d);
            }
            reg.on_attach(&d, FakeDevice::info());
        });
    }
    for (auto &w : writers)
        w.join();
    stop = true;
    reader.join();

    EXPECT_EQ(bad.load(), 0);
    EXPECT_TRUE(reg.consistent());
    EXPECT_EQ(reg.device_count(), 3u);
}

TEST(EventQueue, WrapsAround)
{
    EventQueue<int, 4> q;
    EXPECT_EQ(q.capacity(), 3u);
    int out = 0;
    for (int round = 0; round < 5; ++round)
    {
        EXPECT_TRUE(q.push(round));
        EXPECT_TRUE(q.push(round + 100));
        EXPECT_EQ(q.size(), 2u);
        ASSERT_TRUE(q.pop(out));
        EXPECT_EQ(out, round);
        ASSERT_TRUE(q.pop(out));
        EXPECT_EQ(out, round + 100);
        EXPECT_TRUE(q.empty());
    }
    EXPECT_FALSE(q.pop(out));
}
