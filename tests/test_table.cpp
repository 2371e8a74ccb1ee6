/**
 * MIT License
 *
 * @brief Console channel table layout.
 *
 * @file test_table.cpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#include <string>
#include <gtest/gtest.h>
#include <Table.hpp>
#include <support/Fakes.hpp>

using namespace ppm;
using ppm::test::FakeLog;

TEST(Table, RowsShowMappingAndPulse)
{
    PpmConfig cfg;
    cfg.map(0, "joy0:axis:0");
    cfg.map(6, "!joy1:hat:0:1");
    PulseFrame f{};
    for (auto &c : f.channels)
        c = 1500;
    f.channels[0] = 1756;

    FakeLog log;
    print_table(log, cfg, &f, 2);

    ASSERT_EQ(log.lines.size(), 14u); ///< Title, rule, header, rule, 8 rows, rule, footer.
    EXPECT_EQ(log.lines[0], "PPM Channels Output (us):");
    EXPECT_EQ(log.lines[4], "0   joy0:axis:0                    1756");
    EXPECT_EQ(log.lines[5], "1   none                           1500");
    EXPECT_EQ(log.lines[10], "6   !joy1:hat:0:1                  1500");
    EXPECT_EQ(log.lines[13], "Joystick(s) detected.");
}

TEST(Table, IdleShowsDashes)
{
    PpmConfig cfg;
    FakeLog log;
    print_table(log, cfg, nullptr, 0);
    ASSERT_EQ(log.lines.size(), 14u);
    EXPECT_EQ(log.lines[4], "0   none                              -");
    EXPECT_EQ(log.lines[13], "No joystick detected, so no PPM output is sent.");
}
