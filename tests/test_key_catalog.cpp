#include <gtest/gtest.h>
#include "conf/key_catalog.hpp"
#include "conf/pattern.hpp"

#include <algorithm>

using namespace rmqconf;

TEST(KeyFormatTest, ValidKeys) {
    EXPECT_TRUE(is_valid_key_format("heartbeat"));
    EXPECT_TRUE(is_valid_key_format("listeners.tcp.default"));
    EXPECT_TRUE(is_valid_key_format("auth_backends.1"));
    EXPECT_TRUE(is_valid_key_format("_private.key"));
    EXPECT_TRUE(is_valid_key_format("cluster_formation.k8s.host"));
    EXPECT_TRUE(is_valid_key_format("management.http-log-dir"));
    EXPECT_TRUE(is_valid_key_format("123"));
}

TEST(KeyFormatTest, InvalidKeys) {
    EXPECT_FALSE(is_valid_key_format(""));
    EXPECT_FALSE(is_valid_key_format(".heartbeat"));
    EXPECT_FALSE(is_valid_key_format("heartbeat."));
    EXPECT_FALSE(is_valid_key_format("listeners..tcp"));
    EXPECT_FALSE(is_valid_key_format("1abc"));
    EXPECT_FALSE(is_valid_key_format("-abc"));
    EXPECT_FALSE(is_valid_key_format("a b"));
    EXPECT_FALSE(is_valid_key_format("listeners.tcp.*"));
}

TEST(KeyFormatTest, NonAsciiBytesAreInvalid) {
    EXPECT_FALSE(is_valid_key_format("caf\xC3\xA9"));
    EXPECT_FALSE(is_valid_key_format("\xC3\xA9t\xC3\xA9"));
    EXPECT_FALSE(is_valid_key_format("log.\xE9.level"));
    EXPECT_FALSE(is_valid_key_format("\xB2"));
}

TEST(KeyFormatTest, AsciiClasses) {
    EXPECT_TRUE(is_ascii_alpha('a'));
    EXPECT_TRUE(is_ascii_alpha('Z'));
    EXPECT_FALSE(is_ascii_alpha('_'));
    EXPECT_TRUE(is_ascii_digit('0'));
    EXPECT_FALSE(is_ascii_digit('a'));
    EXPECT_TRUE(is_ascii_alnum('9'));
    for (char c : {'\xE9', '\xC3', '\xB2', '\xAA'}) {
        EXPECT_FALSE(is_ascii_alnum(c));
    }
}

TEST(KeyCatalogTest, CatalogIsLargeAndWellFormed) {
    const auto& catalog = known_key_templates();
    EXPECT_GE(catalog.size(), 250u);

    for (const auto& t : catalog) {
        EXPECT_FALSE(t.pattern.empty());
        EXPECT_FALSE(t.group.empty()) << t.pattern;
        for (auto segment : split_key(t.pattern)) {
            EXPECT_FALSE(segment.empty()) << t.pattern;
        }
    }
}

TEST(KeyCatalogTest, CatalogIsBuiltOnce) {
    EXPECT_EQ(&known_key_templates(), &known_key_templates());
}

TEST(KeyCatalogTest, KnownKeys) {
    EXPECT_TRUE(is_known_key("listeners.tcp.default"));
    EXPECT_TRUE(is_known_key("listeners.ssl.default"));
    EXPECT_TRUE(is_known_key("heartbeat"));
    EXPECT_TRUE(is_known_key("cluster_name"));
    EXPECT_TRUE(is_known_key("log.console.level"));
    EXPECT_TRUE(is_known_key("ssl_options.verify"));
    EXPECT_TRUE(is_known_key("default_users.guest.password"));
}

TEST(KeyCatalogTest, UnknownKeys) {
    EXPECT_FALSE(is_known_key("totally.unknown.path"));
    EXPECT_FALSE(is_known_key("listeners.tcp.default.extra"));
    EXPECT_FALSE(is_known_key("heartbeat.extra"));
    EXPECT_FALSE(is_known_key(""));
}

TEST(KeyCatalogTest, NoSuggestionsForUnrelatedKey) {
    EXPECT_FALSE(is_known_key("totally.unknown.path"));
    EXPECT_TRUE(suggest_similar_keys("totally.unknown.path").empty());
}

TEST(KeyCatalogTest, SuggestionsShareFirstSegment) {
    auto suggestions = suggest_similar_keys("listeners.tcpp.default");
    ASSERT_FALSE(suggestions.empty());
    EXPECT_LE(suggestions.size(), MAX_SUGGESTIONS);
    for (auto s : suggestions) {
        EXPECT_EQ(split_key(s).front(), "listeners") << s;
    }
    // Catalog order
    EXPECT_EQ(suggestions.front(), "listeners.tcp");
}

TEST(KeyCatalogTest, SuggestionsAreCapped) {
    // ssl_options has far more than MAX_SUGGESTIONS entries
    auto suggestions = suggest_similar_keys("ssl_options.nonexistent");
    EXPECT_EQ(suggestions.size(), MAX_SUGGESTIONS);

    const auto& catalog = known_key_templates();
    auto first = std::find_if(catalog.begin(), catalog.end(), [](const KnownKeyTemplate& t) {
        return split_key(t.pattern).front() == "ssl_options";
    });
    ASSERT_NE(first, catalog.end());
    EXPECT_EQ(suggestions.front(), first->pattern);
}
