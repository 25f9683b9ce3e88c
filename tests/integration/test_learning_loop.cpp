#include <gtest/gtest.h>
#include <coordguard/coordguard.hpp>

#include <algorithm>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

using namespace coordguard;

namespace fs = std::filesystem;

namespace {

// ===========================================================================
// TestMonitor: captures events for assertion
// ===========================================================================

class TestMonitor : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }
    void on_snapshot(const EngineSnapshot&) override {}
    bool has_event_type(EventType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& e : events_) {
            if (e.type == type) return true;
        }
        return false;
    }
private:
    std::mutex mutex_;
    std::vector<MonitorEvent> events_;
};

bool contains_id(const std::vector<Insight>& insights, const std::string& id) {
    return std::any_of(insights.begin(), insights.end(),
                       [&id](const Insight& i) { return i.id == id; });
}

} // anonymous namespace

// ===========================================================================
// Fixture: JSON-backed engine on a manual clock
// ===========================================================================

class LearningLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / (std::string("coordguard_loop_") + info->name());
        fs::remove_all(dir);

        clock = std::make_shared<ManualClock>();
        engine = make_engine();
        monitor = std::make_shared<TestMonitor>();
        engine->set_monitor(monitor);
    }

    void TearDown() override {
        engine.reset();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::unique_ptr<CoordinationEngine> make_engine(EngineConfig config = EngineConfig{}) {
        return std::make_unique<CoordinationEngine>(
            config, std::make_shared<JsonFileStateStore>(dir), clock);
    }

    Status run(CoordinationEngine& e, const std::string& id, std::vector<std::string> domains,
               int count, const std::string& strategy, Seconds duration, bool success) {
        EXPECT_TRUE(e.report_start(id, count, std::move(domains), strategy).ok());
        clock->advance(duration);
        return e.report_complete(id, success);
    }

    fs::path dir;
    std::shared_ptr<ManualClock> clock;
    std::unique_ptr<CoordinationEngine> engine;
    std::shared_ptr<TestMonitor> monitor;
};

// ===========================================================================
// Learning and recommendation
// ===========================================================================

TEST_F(LearningLoopTest, RepeatedSuccessBuildsConfidentRecommendation) {
    EXPECT_TRUE(run(*engine, "r1", {"testing"}, 2, "single_parallel", 1.0, true).ok());
    EXPECT_TRUE(run(*engine, "r2", {"testing"}, 2, "single_parallel", 2.0, true).ok());
    EXPECT_TRUE(run(*engine, "r3", {"testing"}, 2, "single_parallel", 3.0, true).ok());

    auto pattern = engine->find_pattern(PatternKey::make({"testing"}, 2, "single_parallel"));
    ASSERT_TRUE(pattern.has_value());
    EXPECT_EQ(pattern->usage_count, 3);
    EXPECT_NEAR(pattern->avg_duration, 2.0, 1e-12);
    EXPECT_NEAR(pattern->confidence, 0.8, 1e-12);

    auto rec = engine->recommend({"testing"}, 2);
    ASSERT_TRUE(rec.recommended_strategy.has_value());
    EXPECT_EQ(*rec.recommended_strategy, "single_parallel");
    EXPECT_DOUBLE_EQ(rec.success_probability, 1.0);
    EXPECT_NEAR(rec.estimated_duration.value(), 2.0, 1e-12);
    EXPECT_TRUE(monitor->has_event_type(EventType::PatternCreated));
    EXPECT_TRUE(monitor->has_event_type(EventType::PatternUpdated));
}

TEST_F(LearningLoopTest, TimeoutIsLearnedAsFailure) {
    engine->report_start("t1", 3, {"backend"}, "batch_small");
    clock->advance(30.0);
    EXPECT_TRUE(engine->report_timeout("t1").ok());

    auto events = engine->events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].type, CoordinationEventType::Timeout);
    EXPECT_FALSE(events[1].success.value());
    EXPECT_EQ(events[1].error_message.value(), "Coordination timed out");

    auto pattern = engine->find_pattern(PatternKey::make({"backend"}, 3, "batch_small"));
    ASSERT_TRUE(pattern.has_value());
    EXPECT_DOUBLE_EQ(pattern->success_rate, 0.0);
    EXPECT_DOUBLE_EQ(pattern->avg_duration, 30.0);
    EXPECT_EQ(pattern->type, PatternType::Batch);
}

TEST_F(LearningLoopTest, OrphanIsRecordedButNotLearned) {
    auto status = engine->report_complete("ghost", true);
    EXPECT_EQ(status.kind, ErrorKind::OrphanCompletion);
    EXPECT_TRUE(engine->patterns().empty());

    auto events = engine->events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].strategy, "unknown");
    EXPECT_TRUE(monitor->has_event_type(EventType::OrphanCompletion));

    auto analytics = engine->get_analytics();
    EXPECT_EQ(analytics.summary.completed_coordinations, 1u);
    EXPECT_TRUE(analytics.strategy_stats.empty());
}

TEST_F(LearningLoopTest, CompletedStrategyFeedsPerformanceHistory) {
    run(*engine, "p1", {"api"}, 4, "parallel", 3.0, true);
    run(*engine, "p2", {"api"}, 2, "single_parallel", 1.0, true);

    auto summary = engine->performance_summary();
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->total_coordinations, 1u);
    EXPECT_EQ(summary->strategy_distribution.at("parallel"), 1u);
    EXPECT_DOUBLE_EQ(summary->average_duration, 3.0);
}

// ===========================================================================
// Persistence across engines
// ===========================================================================

TEST_F(LearningLoopTest, StateSurvivesRestart) {
    run(*engine, "r1", {"testing", "api"}, 2, "single_parallel", 1.5, true);
    engine->report_start("open", 1, {"api"}, "direct");
    engine->generate_insights();

    auto events_before = engine->events();
    auto patterns_before = engine->patterns();
    auto insights_before = engine->insights();
    engine.reset();

    clock->advance(4.0);
    auto restarted = make_engine();
    EXPECT_EQ(restarted->events(), events_before);
    EXPECT_EQ(restarted->patterns(), patterns_before);
    EXPECT_EQ(restarted->insights(), insights_before);
    EXPECT_EQ(restarted->snapshot().open_coordinations, 1u);

    // The open start from before the restart is still matched
    EXPECT_TRUE(restarted->report_complete("open", true).ok());
    auto pattern = restarted->find_pattern(PatternKey::make({"api"}, 1, "direct"));
    ASSERT_TRUE(pattern.has_value());
    EXPECT_DOUBLE_EQ(pattern->avg_duration, 4.0);

    EXPECT_TRUE(fs::exists(dir / "events.json"));
    EXPECT_TRUE(fs::exists(dir / "patterns.json"));
    EXPECT_TRUE(fs::exists(dir / "insights.json"));
}

TEST_F(LearningLoopTest, ConfiguredDataDirBacksDefaultStore) {
    EngineConfig config;
    config.persistence.enabled = true;
    config.persistence.data_dir = (dir / "from-config").string();

    {
        CoordinationEngine configured(config, nullptr, clock);
        run(configured, "c1", {"testing"}, 2, "single_parallel", 1.0, true);
    }
    EXPECT_TRUE(fs::exists(dir / "from-config" / "events.json"));
    EXPECT_TRUE(fs::exists(dir / "from-config" / "patterns.json"));

    CoordinationEngine reopened(config, nullptr, clock);
    EXPECT_EQ(reopened.events().size(), 2u);
    EXPECT_EQ(reopened.patterns().size(), 1u);
}

TEST_F(LearningLoopTest, DisabledPersistenceStaysInMemory) {
    EngineConfig config;
    config.persistence.data_dir = (dir / "unused").string();

    CoordinationEngine in_memory(config, nullptr, clock);
    run(in_memory, "c1", {"testing"}, 2, "single_parallel", 1.0, true);
    EXPECT_FALSE(fs::exists(dir / "unused"));
}

// ===========================================================================
// Insights
// ===========================================================================

TEST_F(LearningLoopTest, InsightsAreIdempotentAndExpire) {
    for (int i = 0; i < 3; ++i) {
        run(*engine, "f" + std::to_string(i), {"database"}, 4, "batch_small", 2.0, false);
    }

    auto fresh = engine->generate_insights();
    EXPECT_TRUE(contains_id(fresh, "low_success_database_4_batch_small"));
    EXPECT_TRUE(contains_id(fresh, "recent_degradation"));
    const auto first_count = engine->insights().size();
    EXPECT_EQ(first_count, 2u);

    engine->generate_insights();
    EXPECT_EQ(engine->insights().size(), first_count);

    std::set<std::string> ids;
    for (const auto& insight : engine->insights()) ids.insert(insight.id);
    EXPECT_EQ(ids.size(), first_count);

    // A day later the pattern is no longer recent; the degradation insight ages out
    clock->advance(86400.0);
    auto later = engine->generate_insights();
    EXPECT_EQ(later.size(), 1u);

    auto stored = engine->insights();
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].id, "low_success_database_4_batch_small");
    EXPECT_DOUBLE_EQ(stored[0].created_at, clock->now());
    EXPECT_TRUE(monitor->has_event_type(EventType::InsightsPruned));
    EXPECT_TRUE(monitor->has_event_type(EventType::InsightGenerated));
}

TEST_F(LearningLoopTest, NoInsightsWithoutHistory) {
    EXPECT_TRUE(engine->generate_insights().empty());
    EXPECT_TRUE(engine->insights().empty());
}

// ===========================================================================
// Analytics cache
// ===========================================================================

TEST_F(LearningLoopTest, AnalyticsCachedUntilTtl) {
    EngineConfig config;
    config.analytics.recent_window = 100.0;
    config.analytics.cache_ttl = 300.0;
    engine = make_engine(config);

    run(*engine, "a1", {"testing"}, 2, "single_parallel", 1.0, true);

    auto first = engine->get_analytics();
    EXPECT_EQ(first.summary.recent_events, 2u);

    // Events fall out of the recent window, but the cached value is served
    clock->advance(200.0);
    EXPECT_EQ(engine->get_analytics().summary.recent_events, 2u);

    clock->advance(100.0);
    EXPECT_EQ(engine->get_analytics().summary.recent_events, 0u);
}

TEST_F(LearningLoopTest, ReportInvalidatesAnalyticsCache) {
    run(*engine, "a1", {"testing"}, 2, "single_parallel", 1.0, true);
    EXPECT_EQ(engine->get_analytics().summary.total_events, 2u);

    engine->report_start("a2", 2, {"testing"}, "single_parallel");
    EXPECT_EQ(engine->get_analytics().summary.total_events, 3u);
}
