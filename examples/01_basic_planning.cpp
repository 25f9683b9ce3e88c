// 01_basic_planning.cpp
//
// Minimal CoordGuard example: admit, select a strategy and plan a batch.
//
// Scenario:
//   - Five work items across two domains, one item depending on another.
//   - The engine checks the request against its budget, picks a strategy
//     from the request shape and packs the items into ordered batches.
//   - A second request made while the first window is open is refused.

#include <coordguard/coordguard.hpp>

#include <iostream>
#include <string>

using namespace coordguard;

namespace {

WorkItem make_item(std::string kind, Priority priority, std::string domain,
                   Seconds duration, std::vector<std::string> deps = {}) {
    WorkItem item;
    item.kind = std::move(kind);
    item.priority = priority;
    item.domain = std::move(domain);
    item.estimated_duration = duration;
    item.dependencies = std::move(deps);
    return item;
}

void print_plan(const CoordinationPlan& plan) {
    std::cout << "  strategy=" << to_string(plan.strategy)
              << " batches=" << plan.batches.size()
              << " est_time=" << plan.estimated_total_time << "s"
              << (plan.degraded ? " (degraded)" : "") << "\n";
    for (std::size_t i = 0; i < plan.batches.size(); ++i) {
        std::cout << "    batch " << i + 1 << ":";
        for (const auto& item : plan.batches[i]) {
            std::cout << " " << item.kind << "[" << to_string(item.priority) << "]";
        }
        std::cout << "\n";
    }
}

} // anonymous namespace

int main() {
    std::cout << "=== CoordGuard: Basic Planning Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Create an engine with default budget and in-memory state.
    // ----------------------------------------------------------------
    CoordinationEngine engine;
    engine.set_monitor(std::make_shared<LogMonitor>(LogMonitor::Verbosity::Verbose));

    // ----------------------------------------------------------------
    // 2. Describe the work.
    // ----------------------------------------------------------------
    std::vector<WorkItem> items = {
        make_item("schema-review", Priority::High,     "database", 2.0),
        make_item("migration",     Priority::High,     "database", 3.0, {"schema-review"}),
        make_item("unit-tests",    Priority::Medium,   "testing",  1.5),
        make_item("lint",          Priority::Low,      "testing",  0.5),
        make_item("hotfix",        Priority::Critical, "backend",  1.0),
    };

    // ----------------------------------------------------------------
    // 3. Admission, strategy and plan in one call.
    // ----------------------------------------------------------------
    auto result = engine.coordinate(items);
    std::cout << "Admission: " << (result.admission.admitted ? "admitted" : "rejected")
              << " (" << result.admission.reason << ", cost "
              << result.admission.estimated_cost << ")\n";
    std::cout << "Selected strategy: " << to_string(result.selected_strategy) << "\n";
    if (result.plan) {
        print_plan(*result.plan);
    }

    auto advice = engine.suggest_batching(static_cast<int>(items.size()));
    std::cout << "Batching advice: " << advice.description << "\n\n";

    // ----------------------------------------------------------------
    // 4. While a window is open, further requests are refused as Busy.
    // ----------------------------------------------------------------
    engine.begin_window(static_cast<int>(items.size()));
    auto busy = engine.can_admit(2);
    std::cout << "Second request while busy: " << to_string(busy.error)
              << " - " << busy.reason << "\n";
    engine.end_window();

    auto again = engine.can_admit(2);
    std::cout << "After closing the window: "
              << (again.admitted ? "admitted" : to_string(again.error)) << "\n\n";

    // ----------------------------------------------------------------
    // 5. Requests beyond the concurrency limit are degraded.
    // ----------------------------------------------------------------
    std::vector<WorkItem> large;
    for (int i = 0; i < 15; ++i) {
        large.push_back(make_item("task-" + std::to_string(i), Priority::Medium, "bulk", 1.0));
    }
    auto over = engine.coordinate(large);
    std::cout << "15 items: " << to_string(over.admission.error)
              << ", strategy " << to_string(over.selected_strategy) << "\n";
    if (over.plan) {
        print_plan(*over.plan);
    }

    std::cout << "\n=== Example complete ===\n";
    return 0;
}
