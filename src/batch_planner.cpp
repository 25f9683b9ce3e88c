#include "coordguard/batch_planner.hpp"

#include <algorithm>
#include <unordered_set>

namespace coordguard {

BatchPlanner::BatchPlanner(PlannerConfig config)
    : config_(std::move(config)) {}

const PlannerConfig& BatchPlanner::config() const noexcept {
    return config_;
}

// ========== Planning ==========

CoordinationPlan BatchPlanner::plan(const std::vector<WorkItem>& items,
                                    const ResourceBudget& budget,
                                    Complexity complexity) const
{
    CoordinationPlan result;

    if (items.empty()) {
        result.batches.emplace_back();
        result.strategy = Strategy::Direct;
        return result;
    }

    const int batch_size = effective_batch_size(budget, complexity);

    std::vector<WorkItem> current;
    std::unordered_set<std::string> current_kinds;
    std::unordered_set<std::string> current_deps;  // kinds the current batch waits on

    for (auto& item : order(items)) {
        bool full = static_cast<int>(current.size()) >= batch_size;
        bool conflict = current_deps.count(item.kind) > 0 ||
            std::any_of(item.dependencies.begin(), item.dependencies.end(),
                [&current_kinds](const std::string& dep) {
                    return current_kinds.count(dep) > 0;
                });

        if (!current.empty() && (full || conflict)) {
            result.batches.push_back(std::move(current));
            current.clear();
            current_kinds.clear();
            current_deps.clear();
        }

        current_kinds.insert(item.kind);
        current_deps.insert(item.dependencies.begin(), item.dependencies.end());
        current.push_back(std::move(item));
    }
    if (!current.empty()) {
        result.batches.push_back(std::move(current));
    }

    result.strategy = assign_strategy(result.batches);
    result.estimated_total_time = estimate_total_time(result.batches);
    result.degraded = result.strategy == Strategy::Degraded ||
        (budget.max_response_time > 0.0 &&
         result.estimated_total_time > budget.max_response_time);
    return result;
}

std::vector<WorkItem> BatchPlanner::order(const std::vector<WorkItem>& items) const {
    auto result = items;
    std::stable_sort(result.begin(), result.end(),
        [](const WorkItem& a, const WorkItem& b) {
            int a_rank = priority_rank(a.priority);
            int b_rank = priority_rank(b.priority);
            if (a_rank != b_rank) return a_rank < b_rank;
            if (a.dependencies.size() != b.dependencies.size()) {
                return a.dependencies.size() < b.dependencies.size();
            }
            return a.estimated_duration < b.estimated_duration;
        });
    return result;
}

int BatchPlanner::effective_batch_size(const ResourceBudget& budget, Complexity complexity) const {
    int adjusted = budget.max_batch_size + complexity_adjustment(complexity);
    adjusted = std::clamp(adjusted, config_.min_batch_size, config_.max_batch_size);
    // Never exceed what the budget itself allows
    adjusted = std::min(adjusted, budget.max_batch_size);
    return std::max(1, adjusted);
}

Strategy BatchPlanner::assign_strategy(const std::vector<std::vector<WorkItem>>& batches) const {
    std::size_t total = 0;
    for (const auto& batch : batches) total += batch.size();

    if (batches.size() == 1 &&
        static_cast<int>(total) <= config_.single_batch_parallel_max) {
        return Strategy::Parallel;
    }
    if (static_cast<int>(total) <= config_.strategic_total_max) {
        return Strategy::Strategic;
    }
    return Strategy::Degraded;
}

// ========== Time estimation ==========

Seconds BatchPlanner::estimate_batch_time(const std::vector<WorkItem>& batch) const {
    Seconds longest = 0.0;
    for (const auto& item : batch) {
        longest = std::max(longest, item.estimated_duration);
    }
    return longest + static_cast<double>(batch.size()) * config_.coordination_overhead;
}

Seconds BatchPlanner::estimate_total_time(const std::vector<std::vector<WorkItem>>& batches) const {
    if (batches.empty()) {
        return 0.0;
    }
    Seconds total = 0.0;
    for (const auto& batch : batches) {
        total += estimate_batch_time(batch);
    }
    return total + static_cast<double>(batches.size() - 1) * config_.inter_batch_overhead;
}

// ========== Sizing ==========

BatchSizing BatchPlanner::optimize_batch_size(int total_items, Complexity complexity) const {
    int size = config_.optimal_batch_size + complexity_adjustment(complexity);
    size = std::clamp(size, config_.min_batch_size, config_.max_batch_size);

    if (total_items <= size) {
        return BatchSizing{std::max(0, total_items), 1};
    }
    return BatchSizing{size, (total_items + size - 1) / size};
}

int BatchPlanner::complexity_adjustment(Complexity complexity) const noexcept {
    return complexity == Complexity::High ? config_.high_complexity_adjustment : 0;
}

} // namespace coordguard
