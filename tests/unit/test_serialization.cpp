#include <gtest/gtest.h>
#include <coordguard/coordguard.hpp>

using namespace coordguard;

namespace {

CoordinationEvent sample_terminal() {
    CoordinationEvent e;
    e.id = "coord-42";
    e.type = CoordinationEventType::Error;
    e.timestamp = 1'700'000'123.456;
    e.item_count = 3;
    e.domains = {"backend", "database"};
    e.strategy = "batch_small";
    e.duration = 12.75;
    e.success = false;
    e.items = std::vector<std::string>{"migrate", "seed", "verify"};
    e.error_message = "lock timeout";
    return e;
}

Pattern sample_pattern() {
    Pattern p;
    p.key = PatternKey::make({"testing", "api"}, 2, "single_parallel");
    p.type = PatternType::Parallel;
    p.success_rate = 2.0 / 3.0;
    p.avg_duration = 1.1;
    p.usage_count = 3;
    p.last_used = 1'700'000'000.1;
    p.confidence = 0.6333333333333333;
    return p;
}

Insight sample_insight() {
    Insight i;
    i.id = "recent_degradation";
    i.category = InsightCategory::Monitoring;
    i.description = "Recent coordination success rate is 70.0%, below optimal";
    i.recommendation = "Review recent coordination failures";
    i.impact_score = 0.9;
    i.confidence = 0.7;
    i.created_at = 1'700'000'500.0;
    i.applies_to = {"all"};
    return i;
}

} // anonymous namespace

// ===========================================================================
// Events
// ===========================================================================

TEST(SerializationTest, EventRoundTripPreservesAllFields) {
    std::vector<CoordinationEvent> events = {sample_terminal()};
    auto restored = events_from_string(events_to_string(events));
    ASSERT_EQ(restored.size(), 1u);
    EXPECT_EQ(restored[0], events[0]);
}

TEST(SerializationTest, AbsentOptionalsAreWrittenAsNull) {
    CoordinationEvent start;
    start.id = "c1";
    start.type = CoordinationEventType::Start;
    start.timestamp = 1.0;
    start.item_count = 1;
    start.strategy = "direct";

    auto json = to_json(start);
    EXPECT_TRUE(json.isMember("duration"));
    EXPECT_TRUE(json["duration"].isNull());
    EXPECT_TRUE(json["success"].isNull());
    EXPECT_TRUE(json["items"].isNull());
    EXPECT_EQ(json["type"].asString(), "start");

    auto back = event_from_json(json);
    EXPECT_EQ(back, start);
    EXPECT_FALSE(back.duration.has_value());
}

TEST(SerializationTest, MissingOptionalKeysAreAccepted) {
    Json::Value v(Json::objectValue);
    v["id"] = "c1";
    v["type"] = "complete";
    v["timestamp"] = 5.0;
    v["item_count"] = 0;
    v["domains"] = Json::Value(Json::arrayValue);
    v["strategy"] = "unknown";

    auto e = event_from_json(v);
    EXPECT_EQ(e.type, CoordinationEventType::Complete);
    EXPECT_FALSE(e.success.has_value());
    EXPECT_FALSE(e.error_message.has_value());
}

// ===========================================================================
// Patterns and insights
// ===========================================================================

TEST(SerializationTest, PatternsKeyedByCanonicalId) {
    PatternMap patterns;
    auto p = sample_pattern();
    patterns.emplace(p.key, p);

    auto text = patterns_to_string(patterns);
    EXPECT_NE(text.find("\"api+testing_2_single_parallel\""), std::string::npos);

    auto restored = patterns_from_string(text);
    ASSERT_EQ(restored.size(), 1u);
    EXPECT_EQ(restored.at(p.key), p);
}

TEST(SerializationTest, InsightRoundTrip) {
    std::vector<Insight> insights = {sample_insight()};
    auto restored = insights_from_string(insights_to_string(insights));
    ASSERT_EQ(restored.size(), 1u);
    EXPECT_EQ(restored[0], insights[0]);
}

TEST(SerializationTest, EmptyDocuments) {
    EXPECT_TRUE(events_from_string("[]").empty());
    EXPECT_TRUE(patterns_from_string("{}").empty());
    EXPECT_TRUE(insights_from_string("[]").empty());
}

// ===========================================================================
// Malformed input
// ===========================================================================

TEST(SerializationTest, MalformedJsonThrows) {
    EXPECT_THROW(events_from_string("[{\"id\": "), SerializationException);
    EXPECT_THROW(patterns_from_string("not json"), SerializationException);
}

TEST(SerializationTest, WrongRootTypeThrows) {
    EXPECT_THROW(events_from_string("{}"), SerializationException);
    EXPECT_THROW(patterns_from_string("[]"), SerializationException);
    EXPECT_THROW(insights_from_string("{}"), SerializationException);
}

TEST(SerializationTest, MissingOrMistypedFieldThrows) {
    auto v = to_json(sample_terminal());
    v.removeMember("timestamp");
    EXPECT_THROW(event_from_json(v), SerializationException);

    auto w = to_json(sample_terminal());
    w["type"] = "exploded";
    EXPECT_THROW(event_from_json(w), SerializationException);

    auto p = to_json(sample_pattern());
    p["usage_count"] = "three";
    EXPECT_THROW(pattern_from_json(p), SerializationException);
}
