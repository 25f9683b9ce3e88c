#include <gtest/gtest.h>
#include <coordguard/coordguard.hpp>

using namespace coordguard;

// ===========================================================================
// Fixture: drives the learner through an EventLog
// ===========================================================================

class PatternLearnerTest : public ::testing::Test {
protected:
    EventLog log;
    PatternLearner learner;
    Timestamp now = 1'700'000'000.0;
    int next_id = 0;

    LearnResult run(std::vector<std::string> domains, int count, const std::string& strategy,
                    Seconds duration, bool success) {
        std::string id = "c" + std::to_string(next_id++);
        log.record_start(id, count, std::move(domains), strategy, std::nullopt, now);
        now += duration;
        auto record = log.record_terminal(id, CoordinationEventType::Complete, success,
                                          std::nullopt, now);
        return learner.learn(*record.start, record.event);
    }
};

// ===========================================================================
// Weighted updates
// ===========================================================================

TEST_F(PatternLearnerTest, FirstCompletionCreatesPattern) {
    auto result = run({"testing"}, 2, "single_parallel", 1.0, true);

    EXPECT_TRUE(result.created);
    EXPECT_EQ(result.pattern.usage_count, 1);
    EXPECT_DOUBLE_EQ(result.pattern.success_rate, 1.0);
    EXPECT_DOUBLE_EQ(result.pattern.avg_duration, 1.0);
    EXPECT_DOUBLE_EQ(result.pattern.confidence, 0.3);
    EXPECT_DOUBLE_EQ(result.pattern.last_used, now);
    EXPECT_EQ(result.pattern.type, PatternType::Parallel);
}

TEST_F(PatternLearnerTest, RunningAveragesAndConfidence) {
    run({"testing"}, 2, "single_parallel", 1.0, true);
    auto second = run({"testing"}, 2, "single_parallel", 2.0, true);
    EXPECT_FALSE(second.created);
    EXPECT_NEAR(second.pattern.confidence, 0.7, 1e-12);

    auto third = run({"testing"}, 2, "single_parallel", 3.0, true);
    EXPECT_EQ(third.pattern.usage_count, 3);
    EXPECT_NEAR(third.pattern.avg_duration, 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(third.pattern.success_rate, 1.0);
    EXPECT_NEAR(third.pattern.confidence, 0.8, 1e-12);
    EXPECT_EQ(learner.size(), 1u);
}

TEST_F(PatternLearnerTest, FailureLowersSuccessRate) {
    run({"db"}, 4, "batch_small", 2.0, true);
    auto result = run({"db"}, 4, "batch_small", 4.0, false);

    EXPECT_DOUBLE_EQ(result.pattern.success_rate, 0.5);
    EXPECT_DOUBLE_EQ(result.pattern.avg_duration, 3.0);
    EXPECT_NEAR(result.pattern.confidence, 0.45, 1e-12);
}

TEST_F(PatternLearnerTest, ConfidenceCappedAndMonotonicOnSuccess) {
    double previous = 0.0;
    for (int i = 0; i < 15; ++i) {
        auto result = run({"api"}, 1, "direct", 1.0, true);
        EXPECT_GE(result.pattern.confidence, previous);
        EXPECT_LE(result.pattern.confidence, 0.95);
        previous = result.pattern.confidence;
    }
    EXPECT_DOUBLE_EQ(previous, 0.95);
}

// ===========================================================================
// Keys
// ===========================================================================

TEST_F(PatternLearnerTest, DomainOrderDoesNotSplitPatterns) {
    run({"b", "a"}, 2, "x", 1.0, true);
    run({"a", "b", "a"}, 2, "x", 1.0, true);

    EXPECT_EQ(learner.size(), 1u);
    auto key = PatternKey::make({"b", "a"}, 2, "x");
    EXPECT_EQ(key.to_string(), "a+b_2_x");

    auto found = learner.find(key);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->usage_count, 2);
}

TEST_F(PatternLearnerTest, DifferentCountOrStrategyIsDifferentPattern) {
    run({"a"}, 2, "x", 1.0, true);
    run({"a"}, 3, "x", 1.0, true);
    run({"a"}, 2, "y", 1.0, true);
    EXPECT_EQ(learner.size(), 3u);
    EXPECT_FALSE(learner.find(PatternKey::make({"a"}, 4, "x")).has_value());
}

TEST_F(PatternLearnerTest, EmptyDomainsKey) {
    EXPECT_EQ(PatternKey::make({}, 1, "direct").to_string(), "_1_direct");
}

TEST_F(PatternLearnerTest, RestoreReplacesStore) {
    run({"a"}, 1, "direct", 1.0, true);

    PatternLearner other;
    other.restore(learner.patterns());
    EXPECT_EQ(other.size(), 1u);
    EXPECT_EQ(other.find(PatternKey::make({"a"}, 1, "direct"))->usage_count, 1);
}

// ===========================================================================
// Classification
// ===========================================================================

TEST(PatternClassifyTest, ByStrategyNameThenCount) {
    EXPECT_EQ(PatternLearner::classify("batch_small", 4), PatternType::Batch);
    EXPECT_EQ(PatternLearner::classify("Batch_Large", 6), PatternType::Batch);
    EXPECT_EQ(PatternLearner::classify("single_parallel", 2), PatternType::Parallel);
    EXPECT_EQ(PatternLearner::classify("direct", 1), PatternType::Sequential);
    EXPECT_EQ(PatternLearner::classify("strategic", 8), PatternType::Hybrid);
}
