#include <gtest/gtest.h>
#include "conf/line_parser.hpp"

using namespace rmqconf;

namespace {

Setting expect_setting(std::string_view text) {
    auto line = parse_line(text, 1);
    EXPECT_TRUE(line.has_value()) << text;
    if (!line || !std::holds_alternative<Setting>(*line)) {
        ADD_FAILURE() << "not a setting: " << text;
        return {};
    }
    return std::get<Setting>(*line);
}

}  // namespace

TEST(LineParserTest, EmptyAndWhitespaceOnly) {
    for (std::string_view text : {"", "   ", "\t", " \t \r"}) {
        auto line = parse_line(text, 1);
        ASSERT_TRUE(line.has_value());
        EXPECT_TRUE(std::holds_alternative<Empty>(*line));
    }
}

TEST(LineParserTest, CommentKeepsOriginalText) {
    auto line = parse_line("   # indented comment  ", 4);
    ASSERT_TRUE(line.has_value());
    ASSERT_TRUE(std::holds_alternative<Comment>(*line));
    EXPECT_EQ(std::get<Comment>(*line).text, "   # indented comment  ");
}

TEST(LineParserTest, SimpleSetting) {
    auto s = expect_setting("heartbeat = 60");
    EXPECT_EQ(s.key, "heartbeat");
    EXPECT_EQ(s.value, "60");
}

TEST(LineParserTest, WhitespaceAroundEquals) {
    auto s = expect_setting("  listeners.tcp.default=5672   ");
    EXPECT_EQ(s.key, "listeners.tcp.default");
    EXPECT_EQ(s.value, "5672");

    s = expect_setting("log.console.level\t=\tinfo");
    EXPECT_EQ(s.key, "log.console.level");
    EXPECT_EQ(s.value, "info");
}

TEST(LineParserTest, InlineCommentIsDropped) {
    auto s = expect_setting("heartbeat = 60   # seconds");
    EXPECT_EQ(s.value, "60");

    s = expect_setting("heartbeat = 60#no space");
    EXPECT_EQ(s.value, "60");
}

TEST(LineParserTest, EmptyValue) {
    auto s = expect_setting("cluster_name =");
    EXPECT_EQ(s.key, "cluster_name");
    EXPECT_EQ(s.value, "");
}

TEST(LineParserTest, QuotedValueIsLiteral) {
    auto s = expect_setting("cluster_name = 'my # cluster'");
    EXPECT_EQ(s.value, "my # cluster");

    s = expect_setting("cluster_name = 'a b'  # trailing comment");
    EXPECT_EQ(s.value, "a b");

    s = expect_setting("cluster_name = ''");
    EXPECT_EQ(s.value, "");
}

TEST(LineParserTest, UnterminatedQuoteKeepsLeadingQuote) {
    auto s = expect_setting("cluster_name = 'open ended");
    EXPECT_EQ(s.value, "'open ended");
}

TEST(LineParserTest, QuoteInsideValueOfQuotedForm) {
    // Written by format_value for it's
    auto s = expect_setting("cluster_name = 'it's'");
    EXPECT_EQ(s.value, "it's");
}

TEST(LineParserTest, UnquotedValueMayContainQuoteInside) {
    auto s = expect_setting("default_pass = pa'ss");
    EXPECT_EQ(s.value, "pa'ss");
}

TEST(LineParserTest, NumericSegmentsAreValid) {
    auto s = expect_setting("auth_backends.1 = internal");
    EXPECT_EQ(s.key, "auth_backends.1");
    EXPECT_EQ(s.value, "internal");
}

TEST(LineParserTest, InvalidKeyFormatReportsLineAndKey) {
    auto line = parse_line("listeners..tcp = 5672", 7);
    ASSERT_FALSE(line.has_value());
    EXPECT_EQ(line.error().code, ConfErrorCode::PARSE_ERROR);
    EXPECT_EQ(line.error().line, 7u);
    EXPECT_NE(line.error().message.find("listeners..tcp"), std::string::npos);

    line = parse_line(".leading = 1", 2);
    ASSERT_FALSE(line.has_value());
    EXPECT_EQ(line.error().line, 2u);

    line = parse_line("1abc = 1", 3);
    ASSERT_FALSE(line.has_value());
}

TEST(LineParserTest, InvalidLineQuotesText) {
    auto line = parse_line("this is not a setting", 12);
    ASSERT_FALSE(line.has_value());
    EXPECT_EQ(line.error().code, ConfErrorCode::PARSE_ERROR);
    EXPECT_EQ(line.error().line, 12u);
    EXPECT_NE(line.error().message.find("this is not a setting"), std::string::npos);
}

TEST(LineParserTest, HyphenRejectedByTokenizer) {
    auto line = parse_line("some-key = 1", 1);
    EXPECT_FALSE(line.has_value());
}

TEST(LineParserTest, NonAsciiKeyIsRejected) {
    EXPECT_FALSE(parse_line("caf\xC3\xA9 = 1", 1).has_value());
    EXPECT_FALSE(parse_line("log.\xE9.level = info", 1).has_value());
}

TEST(LineParserTest, MissingEquals) {
    EXPECT_FALSE(parse_line("heartbeat 60", 1).has_value());
    EXPECT_FALSE(parse_line("= 60", 1).has_value());
}
