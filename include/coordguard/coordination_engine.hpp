#pragma once

#include "coordguard/types.hpp"
#include "coordguard/config.hpp"
#include "coordguard/admission_controller.hpp"
#include "coordguard/analytics.hpp"
#include "coordguard/batch_planner.hpp"
#include "coordguard/clock.hpp"
#include "coordguard/event_log.hpp"
#include "coordguard/insight_generator.hpp"
#include "coordguard/monitor.hpp"
#include "coordguard/pattern_learner.hpp"
#include "coordguard/recommender.hpp"
#include "coordguard/storage.hpp"
#include "coordguard/strategy_selector.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace coordguard {

// Outcome of a one-shot admission + selection + planning call
struct CoordinationResult {
    AdmissionDecision admission;
    Strategy selected_strategy{Strategy::Direct};
    std::optional<CoordinationPlan> plan;   // absent for InvalidCount / Busy
    Recommendation recommendation;
};

// Owns one instance of every module plus the state store, clock and monitor.
//
// Decisions (admission, selection, planning) are computed without touching
// the learning state. Lifecycle reports append to the event log, update the
// pattern store and rewrite the affected collections through the StateStore.
// A persistence failure never undoes the in-memory update; it is returned as
// a PersistenceFailure status instead.
class CoordinationEngine {
public:
    // Null store -> JsonFileStateStore(persistence.data_dir) when persistence is
    // enabled, otherwise MemoryStateStore. Null clock -> SystemClock.
    // Throws InvalidConfigException if the configuration is inconsistent.
    explicit CoordinationEngine(EngineConfig config = EngineConfig{},
                                std::shared_ptr<StateStore> store = nullptr,
                                std::shared_ptr<Clock> clock = nullptr);
    ~CoordinationEngine();

    CoordinationEngine(const CoordinationEngine&) = delete;
    CoordinationEngine& operator=(const CoordinationEngine&) = delete;

    // --- Admission ---
    AdmissionDecision can_admit(int item_count) const;
    // Admission check and window opening under one lock
    AdmissionDecision try_begin_window(int item_count);
    void begin_window(int item_count = 0);
    void end_window();
    int open_windows() const;
    BatchingSuggestion suggest_batching(int item_count) const;
    std::optional<PerformanceSummary> performance_summary() const;

    // --- Strategy & planning ---
    Strategy select_strategy(int item_count,
                             const std::vector<std::string>& domains,
                             bool violates_constraints = false) const;

    // Plans against the engine's current budget
    CoordinationPlan plan(const std::vector<WorkItem>& items,
                          Complexity complexity = Complexity::Medium) const;
    CoordinationPlan plan(const std::vector<WorkItem>& items,
                          const ResourceBudget& budget,
                          Complexity complexity = Complexity::Medium) const;

    // Admission -> selection -> planning. Does not open a window.
    CoordinationResult coordinate(const std::vector<WorkItem>& items,
                                  Complexity complexity = Complexity::Medium);

    // --- Lifecycle reporting ---
    Status report_start(const CoordinationId& id,
                        int item_count,
                        std::vector<std::string> domains,
                        std::string strategy,
                        std::optional<std::vector<std::string>> items = std::nullopt);
    Status report_complete(const CoordinationId& id,
                           bool success,
                           std::optional<std::string> error_message = std::nullopt);
    Status report_timeout(const CoordinationId& id);

    // --- Learning queries ---
    Analytics get_analytics();
    // Returns the insights produced by this call
    std::vector<Insight> generate_insights();
    Recommendation recommend(const std::vector<std::string>& domains, int item_count) const;

    // --- State access ---
    std::vector<CoordinationEvent> events() const;
    PatternMap patterns() const;
    std::optional<Pattern> find_pattern(const PatternKey& key) const;
    std::vector<Insight> insights() const;
    EngineSnapshot snapshot() const;
    // Sends snapshot() to the monitor; also done whenever a window opens or closes
    void publish_snapshot() const;

    // Re-read all collections from the store, replacing in-memory state
    Status reload();

    // --- Configuration ---
    void set_monitor(std::shared_ptr<Monitor> monitor);
    const EngineConfig& config() const noexcept;
    Status last_persistence_status() const;

private:
    EngineConfig config_;
    std::shared_ptr<StateStore> store_;
    std::shared_ptr<Clock> clock_;

    AdmissionController admission_;
    StrategySelector selector_;
    BatchPlanner planner_;
    InsightGenerator insight_generator_;
    Recommender recommender_;

    // Learning state, guarded by state_mutex_
    mutable std::mutex state_mutex_;
    EventLog event_log_;
    PatternLearner learner_;
    std::vector<Insight> insights_;
    AnalyticsCache analytics_cache_;
    Status persistence_status_;
    std::shared_ptr<Monitor> monitor_;

    using PendingEvents = std::vector<MonitorEvent>;

    Status report_terminal(const CoordinationId& id,
                           CoordinationEventType type,
                           bool success,
                           std::optional<std::string> error_message);

    // Require state_mutex_ held
    Status load_state_locked(PendingEvents& pending);
    Analytics analytics_locked(Timestamp now);
    template <typename SaveFn>
    Status persist_locked(const char* what, SaveFn save, PendingEvents& pending);

    MonitorEvent make_event(EventType type, std::string message) const;
    void emit(const PendingEvents& pending) const;
    std::shared_ptr<Monitor> current_monitor() const;
};

} // namespace coordguard
