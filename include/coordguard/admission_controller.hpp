#pragma once

#include "coordguard/types.hpp"
#include "coordguard/config.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace coordguard {

// Batching advice for a request of a given size
struct BatchingSuggestion {
    enum class Kind { Direct, SmallBatch, LargeBatch, Sequential };

    Kind kind{Kind::Direct};
    std::string description;
    int batches{1};
    int items_per_batch{0};
    Seconds estimated_duration{0.0};
};

struct PerformanceRecord {
    int item_count{0};
    int estimated_cost{0};
    Seconds duration{0.0};
    Strategy strategy{Strategy::Direct};
};

struct PerformanceSummary {
    std::size_t total_coordinations{0};
    std::size_t recent_coordinations{0};
    Seconds average_duration{0.0};
    double average_items{0.0};
    double average_cost{0.0};
    std::map<std::string, std::size_t> strategy_distribution;
    int max_items_coordinated{0};
    long long total_estimated_cost{0};
};

// Gate that validates a coordination request against hard limits.
// Holds the open-window counter, the only shared state on the decision path.
class AdmissionController {
public:
    AdmissionController(ResourceBudget budget, AdmissionConfig config = AdmissionConfig{});

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    // No side effects; call begin_window() once the caller commits
    AdmissionDecision can_admit(int item_count) const;

    // Checks and opens in one step, so concurrent callers cannot both be
    // admitted. The window is opened only when the decision is admitted.
    AdmissionDecision try_begin_window(int item_count);

    // Opens unconditionally; pair with can_admit() when the caller already
    // serializes admission
    void begin_window(int item_count = 0);
    void end_window();
    int open_windows() const;

    int estimate_cost(int item_count) const noexcept;
    Seconds estimate_duration(int item_count) const noexcept;
    BatchingSuggestion suggest_batching(int item_count) const;

    void record_performance(int item_count, Seconds actual_duration, Strategy strategy,
                            std::optional<int> cost_used = std::nullopt);
    std::optional<PerformanceSummary> performance_summary() const;

    ResourceBudget budget() const;
    const AdmissionConfig& config() const noexcept;

private:
    AdmissionConfig config_;

    mutable std::mutex mutex_;
    ResourceBudget budget_;
    int open_windows_{0};
    std::vector<double> window_usage_;  // share of each open window, LIFO
    std::deque<PerformanceRecord> history_;

    AdmissionDecision check_locked(int item_count) const;
    void open_window_locked(int item_count);
    double usage_share(int item_count) const noexcept;
};

inline const char* to_string(BatchingSuggestion::Kind k) {
    switch (k) {
        case BatchingSuggestion::Kind::Direct:     return "direct";
        case BatchingSuggestion::Kind::SmallBatch: return "batch_small";
        case BatchingSuggestion::Kind::LargeBatch: return "batch_large";
        case BatchingSuggestion::Kind::Sequential: return "sequential";
    }
    return "unknown";
}

} // namespace coordguard
