#include <chrono>
#include <climits>

#include <gtest/gtest.h>

#include "utils.h"

using namespace std::chrono_literals;

TEST(PollTimeout, ClampsToIntRange) {
    EXPECT_EQ(poll_timeout_ms(1500ms), 1500);
    EXPECT_EQ(poll_timeout_ms(0ms), 0);
    EXPECT_EQ(poll_timeout_ms(-20ms), 0);
    EXPECT_EQ(poll_timeout_ms(std::chrono::milliseconds(static_cast<int64_t>(INT_MAX) + 1000)), INT_MAX);
    EXPECT_EQ(poll_timeout_ms(std::chrono::hours(24 * 365)), INT_MAX);
}

TEST(IpAddressParse, AcceptsBothFamilies) {
    ASSERT_TRUE(IpAddress::parse("192.0.2.7").has_value());
    ASSERT_TRUE(IpAddress::parse("2001:db8::7").has_value());
    EXPECT_FALSE(IpAddress::parse("example.test").has_value());
    EXPECT_EQ(IpAddress::parse("2001:db8::7")->to_string(), "2001:db8::7");
}
