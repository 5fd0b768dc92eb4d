#include <gtest/gtest.h>
#include "../include/query_json.hpp"
#include "test_util.hpp"

using json = nlohmann::json;

TEST(QueryJsonTest, SearchHitShape) {
    SearchHit h;
    h.rank = 1;
    h.record = Record{"opening hours", "hours_info", {"We are open 9-5."}, RecordKind::Pattern};
    h.distance = 1.0f;
    h.score = 0.5f;

    json j = h;
    EXPECT_EQ(j["rank"].get<int>(), 1);
    EXPECT_FLOAT_EQ(j["score"].get<float>(), 0.5f);
    EXPECT_FLOAT_EQ(j["distance"].get<float>(), 1.0f);
    EXPECT_EQ(j["record"]["text"].get<std::string>(), "opening hours");
    EXPECT_EQ(j["record"]["tag"].get<std::string>(), "hours_info");
    EXPECT_EQ(j["record"]["responses"].size(), 1u);
    EXPECT_EQ(j["record"]["kind"].get<std::string>(), "pattern");
}

TEST(QueryJsonTest, MatchResultShape) {
    IndexHandle handle(test_codec());
    handle.publish(build_test_bundle(campus_records()));
    IntentMatcher matcher(handle);

    json hit = matcher.match("what are your opening hours");
    EXPECT_TRUE(hit["matched"].get<bool>());
    EXPECT_EQ(hit["best"]["record"]["tag"].get<std::string>(), "hours_info");

    json miss = matcher.match("completely unrelated words");
    EXPECT_FALSE(miss["matched"].get<bool>());
    EXPECT_FALSE(miss.contains("best"));
    EXPECT_FLOAT_EQ(miss["threshold"].get<float>(), 0.5f);
}

TEST(QueryJsonTest, StatsShape) {
    IndexHandle handle(test_codec());
    IntentMatcher matcher(handle);

    json unloaded = matcher.stats();
    EXPECT_FALSE(unloaded["loaded"].get<bool>());
    EXPECT_FALSE(unloaded.contains("total_vectors"));
    EXPECT_FALSE(unloaded.contains("dimension"));

    handle.publish(build_test_bundle(hours_location_records()));
    json loaded = matcher.stats();
    EXPECT_TRUE(loaded["loaded"].get<bool>());
    EXPECT_EQ(loaded["total_vectors"].get<std::size_t>(), 2u);
    EXPECT_EQ(loaded["dimension"].get<std::size_t>(), 384u);
    EXPECT_EQ(loaded["model_name"].get<std::string>(), "hashing-bow-384");
}
