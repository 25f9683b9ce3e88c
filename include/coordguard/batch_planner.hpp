#pragma once

#include "coordguard/types.hpp"
#include "coordguard/config.hpp"

#include <vector>

namespace coordguard {

// Research sizing: how many items per batch and how many batches
struct BatchSizing {
    int batch_size{0};
    int num_batches{0};
};

// Turns an unordered list of work items into an ordered batch plan.
//
// Items are ordered by (priority, dependency count, duration), then packed
// greedily. A new batch starts when the current one is full, when the next
// item depends on a kind already in the current batch, or when an item already
// in the batch depends on the next item's kind.
class BatchPlanner {
public:
    explicit BatchPlanner(PlannerConfig config = PlannerConfig{});

    CoordinationPlan plan(const std::vector<WorkItem>& items,
                          const ResourceBudget& budget,
                          Complexity complexity = Complexity::Medium) const;

    std::vector<WorkItem> order(const std::vector<WorkItem>& items) const;
    int effective_batch_size(const ResourceBudget& budget, Complexity complexity) const;
    Strategy assign_strategy(const std::vector<std::vector<WorkItem>>& batches) const;
    Seconds estimate_batch_time(const std::vector<WorkItem>& batch) const;
    Seconds estimate_total_time(const std::vector<std::vector<WorkItem>>& batches) const;

    // A request that fits in one batch (including an empty one) is a single batch
    BatchSizing optimize_batch_size(int total_items, Complexity complexity) const;

    const PlannerConfig& config() const noexcept;

private:
    PlannerConfig config_;

    int complexity_adjustment(Complexity complexity) const noexcept;
};

} // namespace coordguard
