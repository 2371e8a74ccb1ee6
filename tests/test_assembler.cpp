/**
 * MIT License
 *
 * @brief Frame assembly: channel order, neutral fallback and sync arithmetic.
 *
 * @file test_assembler.cpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#include <gtest/gtest.h>
#include <Assembler.hpp>
#include <support/Fakes.hpp>

using namespace ppm;
using ppm::test::FakeDevice;

class AssemblerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        cfg.pulse_range(1000, 1500, 2000);
        cfg.channel(0).axis(0, 0).done();
        cfg.channel(1).axis(0, 1).invert().done();
        cfg.channel(2).button(0, 0).done();
        cfg.channel(3).axis(1, 0).done(); ///< Second joystick (absent unless attached).
        ASSERT_EQ(validate(cfg), ConfigError::None);
        ASSERT_EQ(reg.on_attach(&joy0, FakeDevice::info()), 0);
    }

    PpmConfig cfg;
    FakeDevice joy0, joy1;
    DeviceRegistry<FakeDevice> reg;
};

TEST_F(AssemblerTest, FullDeflectionCenterAndUnmapped)
{
    joy0.axes[0] = 1.0f;
    joy0.axes[1] = 1.0f; ///< Inverted.
    joy0.buttons[0] = false;

    const FrameAssembler fa(cfg);
    const PulseFrame f = fa.assemble(reg);
    EXPECT_EQ(f.channels[0], 2000);
    EXPECT_EQ(f.channels[1], 1000);
    EXPECT_EQ(f.channels[2], 1000);
    EXPECT_EQ(f.channels[3], 1500); ///< joy1 absent.
    for (std::size_t i = 4; i < kChannelCount; ++i)
        EXPECT_EQ(f.channels[i], 1500);
    EXPECT_EQ(f.degraded_mask, 1u << 3);
}

TEST_F(AssemblerTest, SyncCompletesTheFrame)
{
    const FrameAssembler fa(cfg);
    const PulseFrame f = fa.assemble(reg);
    EXPECT_EQ(f.channel_sum(), 8u * 1500u - 500u); ///< Button released: 1000.
    EXPECT_EQ(f.sync_us, 20000u - f.channel_sum());
    EXPECT_EQ(f.total_us(), 20000u);
    EXPECT_FALSE(f.sync_clamped);
}

TEST_F(AssemblerTest, SyncIsClampedToMinimum)
{
    PpmConfig c = cfg;
    c.frame_us(18000); ///< 8 x 2000 leaves only 2000 us.
    ASSERT_EQ(validate(c), ConfigError::None);
    joy0.axes[0] = 1.0f;
    joy0.axes[1] = -1.0f;
    joy0.buttons[0] = true;
    for (std::size_t i = 3; i < kChannelCount; ++i)
        c.channel(i).trim_us(500);

    const FrameAssembler fa(c);
    const PulseFrame f = fa.assemble(reg);
    EXPECT_EQ(f.channel_sum(), 16000u);
    EXPECT_TRUE(f.sync_clamped);
    EXPECT_EQ(f.sync_us, 3000u);
    EXPECT_EQ(f.total_us(), 19000u);
}

TEST_F(AssemblerTest, SumLawHoldsAcrossInputs)
{
    const FrameAssembler fa(cfg);
    for (float x : {-1.0f, -0.6f, -0.1f, 0.0f, 0.3f, 0.9f, 1.0f})
    {
        joy0.axes[0] = x;
        joy0.axes[1] = -x;
        const PulseFrame f = fa.assemble(reg);
        EXPECT_FALSE(f.sync_clamped);
        EXPECT_EQ(f.total_us(), cfg.timing.frame_us);
        for (std::size_t i = 0; i < kChannelCount; ++i)
        {
            EXPECT_GE(f.channels[i], cfg.limits.min_us);
            EXPECT_LE(f.channels[i], cfg.limits.max_us);
        }
    }
}

TEST_F(AssemblerTest, SameInputsGiveSameFrame)
{
    joy0.axes[0] = 0.42f;
    joy0.axes[1] = -0.17f;
    const FrameAssembler fa(cfg);
    const PulseFrame a = fa.assemble(reg);
    const PulseFrame b = fa.assemble(reg);
    EXPECT_EQ(a, b);
}

TEST_F(AssemblerTest, NoDevicesGivesNeutralFrame)
{
    ASSERT_EQ(reg.on_detach(&joy0), 0);
    const FrameAssembler fa(cfg);
    const PulseFrame f = fa.assemble(reg);
    PulseFrame expected = fa.neutral();
    expected.degraded_mask = 0x0F; ///< The four mapped channels.
    EXPECT_EQ(f, expected);
    EXPECT_EQ(f.channel_sum(), 8u * 1500u);
}

TEST_F(AssemblerTest, SecondJoystickIsPickedUp)
{
    ASSERT_EQ(reg.on_attach(&joy1, FakeDevice::info()), 1);
    joy1.axes[0] = -1.0f;
    const FrameAssembler fa(cfg);
    const PulseFrame f = fa.assemble(reg);
    EXPECT_EQ(f.channels[3], 1000);
    EXPECT_EQ(f.degraded_mask, 0u);
}

TEST(ComputeSync, Boundaries)
{
    FrameTiming t{};
    bool clamped = false;
    EXPECT_EQ(compute_sync(12000, t, clamped), 8000u);
    EXPECT_FALSE(clamped);
    EXPECT_EQ(compute_sync(17000, t, clamped), 3000u); ///< Exactly the minimum.
    EXPECT_FALSE(clamped);
    EXPECT_EQ(compute_sync(17001, t, clamped), 3000u);
    EXPECT_TRUE(clamped);
    EXPECT_EQ(compute_sync(25000, t, clamped), 3000u);
    EXPECT_TRUE(clamped);
}
