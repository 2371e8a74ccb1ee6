/**
 * MIT License
 *
 * @brief Mapping text ("[!]joyD:axis:A", "joyD:button:B", "joyD:hat:H:S", "none").
 *
 * @file test_spec_parser.cpp
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#include <string>
#include <gtest/gtest.h>
#include <SpecParser.hpp>

using namespace ppm;

TEST(SpecParser, ParsesEverySourceKind)
{
    ChannelSpec s;
    ASSERT_TRUE(parse_channel_spec("joy0:axis:1", s));
    EXPECT_EQ(s, ChannelSpec::axis(0, 1));

    ASSERT_TRUE(parse_channel_spec("!joy1:axis:5", s));
    EXPECT_EQ(s, ChannelSpec::axis(1, 5, true));

    ASSERT_TRUE(parse_channel_spec("joy2:button:12", s));
    EXPECT_EQ(s, ChannelSpec::button(2, 12));

    ASSERT_TRUE(parse_channel_spec("joy0:hat:0:1", s));
    EXPECT_EQ(s, ChannelSpec::hat(0, 0, HatAxis::Vertical));

    ASSERT_TRUE(parse_channel_spec("!joy3:hat:0:0", s));
    EXPECT_EQ(s, ChannelSpec::hat(3, 0, HatAxis::Horizontal, true));
}

TEST(SpecParser, NoneAndEmptyAreUnmapped)
{
    ChannelSpec s = ChannelSpec::axis(1, 1);
    ASSERT_TRUE(parse_channel_spec("none", s));
    EXPECT_FALSE(s.mapped());

    s = ChannelSpec::axis(1, 1);
    ASSERT_TRUE(parse_channel_spec("", s));
    EXPECT_FALSE(s.mapped());

    s = ChannelSpec::axis(1, 1);
    ASSERT_TRUE(parse_channel_spec(nullptr, s));
    EXPECT_FALSE(s.mapped());
}

TEST(SpecParser, RejectsMalformedTextAndLeavesOutputAlone)
{
    const ChannelSpec before = ChannelSpec::button(1, 3);
    for (const char *bad : {"joy0", "joy0:", "joy:axis:1", "joyX:axis:1", "joy0:axis", "joy0:axis:",
                            "joy0:axis:1x", "joy0:slider:1", "joy0:hat:0", "joy0:hat:0:2", "joy9:axis:0",
                            "joy0:axis:256", "!none", " joy0:axis:0", "joy0:button:-1"})
    {
        ChannelSpec s = before;
        EXPECT_FALSE(parse_channel_spec(bad, s)) << bad;
        EXPECT_EQ(s, before) << bad;
    }
}

TEST(SpecParser, FormatsBackToTheSameText)
{
    char buf[32];
    for (const char *text : {"joy0:axis:1", "!joy1:axis:5", "joy2:button:12", "joy0:hat:0:1", "!joy3:hat:2:0", "none"})
    {
        ChannelSpec s;
        ASSERT_TRUE(parse_channel_spec(text, s)) << text;
        const int n = format_channel_spec(s, buf, sizeof(buf));
        EXPECT_EQ(n, static_cast<int>(std::string(text).size()));
        EXPECT_STREQ(buf, text);
    }
}

TEST(SpecParser, FormatTruncatesSafely)
{
    char buf[6];
    const int n = format_channel_spec(ChannelSpec::button(1, 200), buf, sizeof(buf));
    EXPECT_EQ(n, 15); ///< "joy1:button:200".
    EXPECT_STREQ(buf, "joy1:");
}
