#include <gtest/gtest.h>
#include "conf/value_format.hpp"

using namespace rmqconf;

TEST(QuotingTest, NeedsQuoting) {
    EXPECT_TRUE(needs_quoting("my cluster"));
    EXPECT_TRUE(needs_quoting("a#b"));
    EXPECT_TRUE(needs_quoting("it's"));
    EXPECT_FALSE(needs_quoting("5672"));
    EXPECT_FALSE(needs_quoting("/var/lib/rabbitmq"));
    EXPECT_FALSE(needs_quoting(""));
}

TEST(QuotingTest, FormatValue) {
    EXPECT_EQ(format_value("my cluster"), "'my cluster'");
    EXPECT_EQ(format_value("a#b"), "'a#b'");
    EXPECT_EQ(format_value("guest"), "guest");
    EXPECT_EQ(format_value(""), "");
}

TEST(CoercionTest, ParseInt) {
    EXPECT_EQ(parse_int("42"), 42);
    EXPECT_EQ(parse_int("-7"), -7);
    EXPECT_EQ(parse_int("+5"), 5);
    EXPECT_EQ(parse_int("0"), 0);
    EXPECT_EQ(parse_int("9223372036854775807"), INT64_MAX);

    EXPECT_FALSE(parse_int("").has_value());
    EXPECT_FALSE(parse_int("+").has_value());
    EXPECT_FALSE(parse_int("+-1").has_value());
    EXPECT_FALSE(parse_int("12abc").has_value());
    EXPECT_FALSE(parse_int("1.5").has_value());
    EXPECT_FALSE(parse_int(" 1").has_value());
    EXPECT_FALSE(parse_int("99999999999999999999").has_value());
}

TEST(CoercionTest, ParseFloat) {
    ASSERT_TRUE(parse_float("3.14").has_value());
    EXPECT_DOUBLE_EQ(*parse_float("3.14"), 3.14);
    EXPECT_DOUBLE_EQ(*parse_float("42"), 42.0);
    EXPECT_DOUBLE_EQ(*parse_float("-0.5"), -0.5);
    EXPECT_DOUBLE_EQ(*parse_float("+2.5"), 2.5);
    EXPECT_DOUBLE_EQ(*parse_float("1e3"), 1000.0);

    EXPECT_FALSE(parse_float("").has_value());
    EXPECT_FALSE(parse_float("abc").has_value());
    EXPECT_FALSE(parse_float("1.5x").has_value());
}

TEST(CoercionTest, ParseBool) {
    for (auto v : {"true", "on", "yes", "1"}) {
        EXPECT_EQ(parse_bool(v), true) << v;
    }
    for (auto v : {"false", "off", "no", "0"}) {
        EXPECT_EQ(parse_bool(v), false) << v;
    }
    for (auto v : {"TRUE", "True", "Yes", "OFF", "2", "", "y", "n"}) {
        EXPECT_FALSE(parse_bool(v).has_value()) << v;
    }
}
