// 02_learning_loop.cpp
//
// CoordGuard learning loop: report outcomes, then ask for advice.
//
// Scenario:
//   - A simulated executor runs several coordinations and reports their
//     start and completion to the engine (one of them fails, one times out).
//   - Patterns are learned per (domains, item count, strategy).
//   - Analytics, insights and a recommendation are printed at the end.
//   - State is stored as JSON under a temporary directory.

#include <coordguard/coordguard.hpp>

#include <filesystem>
#include <iostream>
#include <string>

using namespace coordguard;

int main() {
    std::cout << "=== CoordGuard: Learning Loop Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Engine with JSON persistence and a manually driven clock.
    // ----------------------------------------------------------------
    auto dir = std::filesystem::temp_directory_path() / "coordguard_example";
    std::filesystem::remove_all(dir);

    auto store = std::make_shared<JsonFileStateStore>(dir);
    auto clock = std::make_shared<ManualClock>();
    auto metrics = std::make_shared<MetricsMonitor>();

    CoordinationEngine engine(EngineConfig{}, store, clock);
    engine.set_monitor(metrics);

    // ----------------------------------------------------------------
    // 2. Simulate executor reports.
    // ----------------------------------------------------------------
    struct Run {
        const char* id;
        std::vector<std::string> domains;
        int items;
        const char* strategy;
        Seconds duration;
        int outcome;  // 0 = success, 1 = error, 2 = timeout
    };

    const std::vector<Run> runs = {
        {"run-1", {"testing"},            2, "single_parallel", 1.0, 0},
        {"run-2", {"testing"},            2, "single_parallel", 2.0, 0},
        {"run-3", {"testing"},            2, "single_parallel", 3.0, 0},
        {"run-4", {"database", "backend"}, 4, "batch_small",    6.0, 1},
        {"run-5", {"backend", "database"}, 4, "batch_small",    9.0, 2},
    };

    for (const auto& run : runs) {
        Status status = engine.report_start(run.id, run.items, run.domains, run.strategy);
        if (!status.ok()) {
            std::cout << "start failed: " << status.message << "\n";
        }

        clock->advance(run.duration);

        if (run.outcome == 0) {
            status = engine.report_complete(run.id, true);
        } else if (run.outcome == 1) {
            status = engine.report_complete(run.id, false, std::string("migration conflict"));
        } else {
            status = engine.report_timeout(run.id);
        }
        if (!status.ok()) {
            std::cout << "report failed: " << to_string(status.kind) << " " << status.message << "\n";
        }
    }

    // A completion nobody started is recorded but not learned
    auto orphan = engine.report_complete("ghost", true);
    std::cout << "Unknown completion: " << to_string(orphan.kind) << "\n\n";

    // ----------------------------------------------------------------
    // 3. Learned patterns.
    // ----------------------------------------------------------------
    std::cout << "Patterns:\n";
    for (const auto& [key, pattern] : engine.patterns()) {
        std::cout << "  " << key.to_string()
                  << " type=" << to_string(pattern.type)
                  << " usage=" << pattern.usage_count
                  << " success=" << pattern.success_rate
                  << " avg=" << pattern.avg_duration << "s"
                  << " confidence=" << pattern.confidence << "\n";
    }

    // ----------------------------------------------------------------
    // 4. Analytics and insights.
    // ----------------------------------------------------------------
    auto analytics = engine.get_analytics();
    std::cout << "\nAnalytics: " << analytics.summary.total_events << " events, "
              << analytics.summary.completed_coordinations << " completed, success rate "
              << analytics.summary.success_rate << "\n";
    for (const auto& [strategy, stats] : analytics.strategy_stats) {
        std::cout << "  " << strategy << ": used " << stats.usage_count
                  << "x, success " << stats.success_rate
                  << ", avg " << stats.avg_duration << "s\n";
    }

    std::cout << "\nInsights:\n";
    for (const auto& insight : engine.generate_insights()) {
        std::cout << "  [" << to_string(insight.category) << "] " << insight.description
                  << "\n      -> " << insight.recommendation << "\n";
    }

    // ----------------------------------------------------------------
    // 5. Recommendation for a new request.
    // ----------------------------------------------------------------
    auto rec = engine.recommend({"testing"}, 2);
    if (rec.recommended_strategy) {
        std::cout << "\nRecommended for testing x2: " << *rec.recommended_strategy
                  << " (success " << rec.success_probability
                  << ", confidence " << rec.confidence << ")\n";
    }

    auto m = metrics->get_metrics();
    std::cout << "\nMetrics: started=" << m.started << " completed=" << m.completed
              << " failed=" << m.failed << " orphans=" << m.orphan_completions << "\n";
    std::cout << "State written to " << dir.string() << "\n";

    std::cout << "\n=== Example complete ===\n";
    return 0;
}
