#include "topic_pattern.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>

using shadowsync::topic_pattern;
using shadowsync::matches;

TEST(topic_pattern, literal_matches_only_identical_topic) {
    topic_pattern p("devices.wh-1.shadow.reported");

    EXPECT_FALSE(p.has_wildcards());
    EXPECT_TRUE(p.matches("devices.wh-1.shadow.reported"));
    EXPECT_FALSE(p.matches("devices.wh-1.shadow.reported.x"));
    EXPECT_FALSE(p.matches("devices.wh-1.shadow"));
    EXPECT_FALSE(p.matches("devices.wh-2.shadow.reported"));
}

TEST(topic_pattern, literal_without_dots_is_exact) {
    EXPECT_TRUE(matches("devices", "devices"));
    EXPECT_FALSE(matches("devices", "devicesX"));
    EXPECT_FALSE(matches("devices", "device"));
}

TEST(topic_pattern, hash_alone_matches_everything) {
    for (const char* topic : {"", "devices", "devices.wh-1", "a.b.c.d.e.f"}) {
        EXPECT_TRUE(matches("#", topic)) << topic;
    }
}

TEST(topic_pattern, star_matches_exactly_one_segment) {
    EXPECT_TRUE(matches("devices.*.shadow.reported", "devices.wh-1.shadow.reported"));
    EXPECT_FALSE(matches("devices.*.shadow.reported", "devices.wh-1.extra.shadow.reported"));
    EXPECT_FALSE(matches("devices.*.shadow.reported", "devices.shadow.reported"));
    EXPECT_FALSE(matches("devices.*.shadow.reported", "devices..shadow.reported"));
}

TEST(topic_pattern, trailing_hash_matches_zero_or_more_segments) {
    EXPECT_TRUE(matches("devices.#", "devices"));
    EXPECT_TRUE(matches("devices.#", "devices.wh-1"));
    EXPECT_TRUE(matches("devices.#", "devices.wh-1.shadow"));
    EXPECT_FALSE(matches("devices.#", "devicesX"));
    EXPECT_FALSE(matches("devices.#", "other.wh-1"));
}

TEST(topic_pattern, star_and_hash_combined) {
    EXPECT_TRUE(matches("devices.*.#", "devices.wh-1"));
    EXPECT_TRUE(matches("devices.*.#", "devices.wh-1.shadow.update"));
    EXPECT_FALSE(matches("devices.*.#", "devices"));
    EXPECT_TRUE(matches("*.*.shadow.#", "devices.wh-1.shadow"));
}

TEST(topic_pattern, literal_dot_is_not_a_regex_wildcard) {
    // '.' between segments must only match a literal dot.
    EXPECT_FALSE(matches("devices.*.shadow", "devicesXwh-1.shadow"));
    EXPECT_FALSE(matches("devices.*.shadow", "devices.wh-1Xshadow"));
    EXPECT_FALSE(matches("a.b.*", "aXb.c"));
}

TEST(topic_pattern, regex_metacharacters_are_escaped) {
    EXPECT_TRUE(matches("dev+ices.*.sh(a)dow", "dev+ices.x.sh(a)dow"));
    EXPECT_FALSE(matches("dev+ices.*.sh(a)dow", "devvices.x.shadow"));
    EXPECT_TRUE(matches("site[1].*", "site[1].pump"));
    EXPECT_FALSE(matches("site[1].*", "site1.pump"));
}

TEST(topic_pattern, empty_pattern_matches_only_empty_topic) {
    EXPECT_TRUE(matches("", ""));
    EXPECT_FALSE(matches("", "devices"));
}

TEST(topic_pattern, rejects_misplaced_wildcards) {
    EXPECT_THROW(topic_pattern("devices.#.shadow"), shadowsync::invalid_pattern_error);
    EXPECT_THROW(topic_pattern("#.shadow"), shadowsync::invalid_pattern_error);
    EXPECT_THROW(topic_pattern("devices.wh*.shadow"), shadowsync::invalid_pattern_error);
    EXPECT_THROW(topic_pattern("devices.x#"), shadowsync::invalid_pattern_error);
    EXPECT_NO_THROW(topic_pattern("devices.*.*"));
}

TEST(topic_pattern, literal_prefix_stops_at_first_wildcard) {
    EXPECT_EQ(topic_pattern("devices.*.shadow.update").literal_prefix(), "devices");
    EXPECT_EQ(topic_pattern("a.b.#").literal_prefix(), "a.b");
    EXPECT_EQ(topic_pattern("#").literal_prefix(), "");
}

TEST(topic_pattern, split_keeps_empty_segments) {
    auto parts = topic_pattern::split("a..b");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");
}

TEST(pattern_cache, compiles_each_pattern_once) {
    auto& cache = shadowsync::pattern_cache::instance();

    auto a = cache.get("cache.test.*.x");
    auto size = cache.size();
    auto b = cache.get("cache.test.*.x");

    EXPECT_EQ(a.get(), b.get());
    EXPECT_EQ(cache.size(), size);
}

TEST(pattern_cache, patterns_share_compiled_matcher) {
    topic_pattern p1("shared.*.topic");
    topic_pattern p2("shared.*.topic");

    EXPECT_TRUE(p1.matches("shared.a.topic"));
    EXPECT_TRUE(p2.matches("shared.b.topic"));
    EXPECT_EQ(shadowsync::pattern_cache::instance().get("shared.*.topic").get(),
              shadowsync::pattern_cache::instance().get("shared.*.topic").get());
}

TEST(topic_pattern, very_long_topics_match_without_recursion) {
    std::string topic = "devices";
    for (int i = 0; i < 50000; ++i) topic += ".a";

    EXPECT_TRUE(matches("devices.#", topic));
    EXPECT_TRUE(matches("devices.*.#", topic));
    EXPECT_FALSE(matches("devices.*.shadow.update", topic));
    EXPECT_FALSE(matches("devices.#", topic + "."));
    EXPECT_FALSE(matches("devices.#", topic + "..a"));
}

TEST(topic_pattern, hash_segments_must_be_non_empty) {
    EXPECT_FALSE(matches("devices.#", "devices."));
    EXPECT_FALSE(matches("devices.#", "devices..x"));
    EXPECT_TRUE(matches("#", "a..b"));
}
