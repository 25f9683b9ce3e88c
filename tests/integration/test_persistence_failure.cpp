#include <gtest/gtest.h>
#include <coordguard/coordguard.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace coordguard;

namespace {

// ===========================================================================
// FailingStateStore: in-memory store whose saves and loads can be broken
// ===========================================================================

class FailingStateStore : public MemoryStateStore {
public:
    std::atomic<bool> fail_saves{false};
    std::atomic<bool> fail_loads{false};

    std::vector<CoordinationEvent> load_events() override {
        if (fail_loads) throw PersistenceException("events.json", "permission denied");
        return MemoryStateStore::load_events();
    }
    PatternMap load_patterns() override {
        if (fail_loads) throw PersistenceException("patterns.json", "permission denied");
        return MemoryStateStore::load_patterns();
    }
    std::vector<Insight> load_insights() override {
        if (fail_loads) throw PersistenceException("insights.json", "permission denied");
        return MemoryStateStore::load_insights();
    }

    void save_events(const std::vector<CoordinationEvent>& events) override {
        if (fail_saves) throw PersistenceException("events.json", "disk full");
        MemoryStateStore::save_events(events);
    }
    void save_patterns(const PatternMap& patterns) override {
        if (fail_saves) throw PersistenceException("patterns.json", "disk full");
        MemoryStateStore::save_patterns(patterns);
    }
    void save_insights(const std::vector<Insight>& insights) override {
        if (fail_saves) throw PersistenceException("insights.json", "disk full");
        MemoryStateStore::save_insights(insights);
    }
};

class TestMonitor : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }
    void on_snapshot(const EngineSnapshot&) override {}
    int count(EventType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (auto& e : events_) {
            if (e.type == type) n++;
        }
        return n;
    }
private:
    std::mutex mutex_;
    std::vector<MonitorEvent> events_;
};

} // anonymous namespace

// ===========================================================================
// Fixture
// ===========================================================================

class PersistenceFailureTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<FailingStateStore>();
        clock = std::make_shared<ManualClock>();
        engine = std::make_unique<CoordinationEngine>(EngineConfig{}, store, clock);

        monitor = std::make_shared<TestMonitor>();
        metrics = std::make_shared<MetricsMonitor>();
        metrics->set_persistence_failure_alert([this](const std::string& msg) {
            std::lock_guard<std::mutex> lock(alert_mutex);
            alerts.push_back(msg);
        });
        auto composite = std::make_shared<CompositeMonitor>();
        composite->add_monitor(monitor);
        composite->add_monitor(metrics);
        engine->set_monitor(composite);
    }

    std::shared_ptr<FailingStateStore> store;
    std::shared_ptr<ManualClock> clock;
    std::unique_ptr<CoordinationEngine> engine;
    std::shared_ptr<TestMonitor> monitor;
    std::shared_ptr<MetricsMonitor> metrics;

    std::mutex alert_mutex;
    std::vector<std::string> alerts;
};

// ===========================================================================
// Test 1: Failed saves keep the in-memory update
// ===========================================================================

TEST_F(PersistenceFailureTest, FailedSaveKeepsInMemoryState) {
    store->fail_saves = true;

    auto started = engine->report_start("c1", 2, {"testing"}, "parallel");
    EXPECT_EQ(started.kind, ErrorKind::PersistenceFailure);
    EXPECT_NE(started.message.find("disk full"), std::string::npos);

    clock->advance(1.0);
    auto completed = engine->report_complete("c1", true);
    EXPECT_EQ(completed.kind, ErrorKind::PersistenceFailure);

    EXPECT_EQ(engine->events().size(), 2u);
    EXPECT_TRUE(engine->find_pattern(PatternKey::make({"testing"}, 2, "parallel")).has_value());
    EXPECT_TRUE(store->MemoryStateStore::load_events().empty());

    EXPECT_EQ(engine->last_persistence_status().kind, ErrorKind::PersistenceFailure);
    // start: events; complete: events + patterns
    EXPECT_EQ(monitor->count(EventType::PersistenceFailure), 3);
    EXPECT_EQ(metrics->get_metrics().persistence_failures, 3u);
    {
        std::lock_guard<std::mutex> lock(alert_mutex);
        ASSERT_EQ(alerts.size(), 3u);
        EXPECT_NE(alerts[0].find("events.json"), std::string::npos);
    }
}

TEST_F(PersistenceFailureTest, PersistenceFailureTakesPrecedenceOverOrphan) {
    store->fail_saves = true;
    auto status = engine->report_complete("ghost", true);
    EXPECT_EQ(status.kind, ErrorKind::PersistenceFailure);
    EXPECT_EQ(monitor->count(EventType::OrphanCompletion), 1);

    store->fail_saves = false;
    EXPECT_EQ(engine->report_complete("ghost-2", true).kind, ErrorKind::OrphanCompletion);
}

// ===========================================================================
// Test 2: Recovery writes the full state
// ===========================================================================

TEST_F(PersistenceFailureTest, NextSuccessfulSaveCatchesUp) {
    store->fail_saves = true;
    engine->report_start("c1", 2, {"testing"}, "parallel");
    engine->report_complete("c1", true);

    store->fail_saves = false;
    EXPECT_TRUE(engine->report_start("c2", 2, {"testing"}, "parallel").ok());
    EXPECT_TRUE(engine->last_persistence_status().ok());

    EXPECT_EQ(store->MemoryStateStore::load_events().size(), 3u);

    EXPECT_TRUE(engine->report_complete("c2", true).ok());
    auto saved = store->MemoryStateStore::load_patterns();
    ASSERT_EQ(saved.size(), 1u);
    EXPECT_EQ(saved.begin()->second.usage_count, 2);
}

TEST_F(PersistenceFailureTest, InsightSaveFailureIsReported) {
    for (int i = 0; i < 3; ++i) {
        std::string id = "f" + std::to_string(i);
        engine->report_start(id, 4, {"db"}, "batch_small");
        engine->report_complete(id, false);
    }

    store->fail_saves = true;
    auto fresh = engine->generate_insights();
    EXPECT_FALSE(fresh.empty());
    EXPECT_EQ(engine->insights().size(), fresh.size());
    EXPECT_EQ(engine->last_persistence_status().kind, ErrorKind::PersistenceFailure);
    EXPECT_TRUE(store->MemoryStateStore::load_insights().empty());
}

// ===========================================================================
// Test 3: Unreadable store
// ===========================================================================

TEST_F(PersistenceFailureTest, ReloadFailureLeavesEngineEmpty) {
    engine->report_start("c1", 2, {"testing"}, "parallel");
    engine->report_complete("c1", true);
    ASSERT_EQ(engine->events().size(), 2u);

    store->fail_loads = true;
    auto status = engine->reload();
    EXPECT_EQ(status.kind, ErrorKind::PersistenceFailure);
    EXPECT_TRUE(engine->events().empty());
    EXPECT_TRUE(engine->patterns().empty());
    EXPECT_EQ(monitor->count(EventType::StateLoadFailed), 1);

    store->fail_loads = false;
    EXPECT_TRUE(engine->reload().ok());
    EXPECT_EQ(engine->events().size(), 2u);
    EXPECT_EQ(engine->patterns().size(), 1u);
}

TEST_F(PersistenceFailureTest, ConstructionSurvivesUnreadableStore) {
    auto broken = std::make_shared<FailingStateStore>();
    broken->fail_loads = true;

    std::unique_ptr<CoordinationEngine> fresh;
    ASSERT_NO_THROW(fresh = std::make_unique<CoordinationEngine>(EngineConfig{}, broken, clock));
    EXPECT_TRUE(fresh->events().empty());
    EXPECT_TRUE(fresh->can_admit(3).admitted);
}
