#include <gtest/gtest.h>
#include <coordguard/coordguard.hpp>

#include <algorithm>
#include <set>

using namespace coordguard;

namespace {

WorkItem item(std::string kind, Priority p = Priority::Medium, Seconds duration = 1.0,
              std::vector<std::string> deps = {}) {
    WorkItem w;
    w.kind = std::move(kind);
    w.priority = p;
    w.estimated_duration = duration;
    w.dependencies = std::move(deps);
    return w;
}

std::vector<WorkItem> independent_items(int n) {
    std::vector<WorkItem> items;
    for (int i = 0; i < n; ++i) {
        items.push_back(item("task-" + std::to_string(i)));
    }
    return items;
}

} // anonymous namespace

// ===========================================================================
// Fixture
// ===========================================================================

class BatchPlannerTest : public ::testing::Test {
protected:
    BatchPlanner planner;
    ResourceBudget budget;
};

// ===========================================================================
// Edge cases
// ===========================================================================

TEST_F(BatchPlannerTest, EmptyInputYieldsSingleEmptyBatch) {
    auto plan = planner.plan({}, budget);
    ASSERT_EQ(plan.batches.size(), 1u);
    EXPECT_TRUE(plan.batches[0].empty());
    EXPECT_DOUBLE_EQ(plan.estimated_total_time, 0.0);
    EXPECT_EQ(plan.strategy, Strategy::Direct);
    EXPECT_FALSE(plan.degraded);
}

TEST_F(BatchPlannerTest, DependentPairSplitsIntoTwoBatches) {
    budget.max_batch_size = 6;
    std::vector<WorkItem> items = {
        item("A", Priority::High),
        item("B", Priority::High, 1.0, {"A"}),
    };

    auto plan = planner.plan(items, budget);
    ASSERT_EQ(plan.batches.size(), 2u);
    EXPECT_EQ(plan.batches[0][0].kind, "A");
    EXPECT_EQ(plan.batches[1][0].kind, "B");
}

TEST_F(BatchPlannerTest, DependencyChainTerminatesWithOneItemPerBatch) {
    std::vector<WorkItem> items = {
        item("a"),
        item("b", Priority::Medium, 1.0, {"a"}),
        item("c", Priority::Medium, 1.0, {"b"}),
        item("d", Priority::Medium, 1.0, {"c"}),
    };

    auto plan = planner.plan(items, budget);
    ASSERT_EQ(plan.batches.size(), 4u);
    for (const auto& batch : plan.batches) {
        EXPECT_EQ(batch.size(), 1u);
    }
    EXPECT_EQ(plan.strategy, Strategy::Strategic);
}

// ===========================================================================
// Ordering
// ===========================================================================

TEST_F(BatchPlannerTest, OrdersByPriorityThenDependenciesThenDuration) {
    std::vector<WorkItem> items = {
        item("low", Priority::Low),
        item("crit-slow", Priority::Critical, 5.0),
        item("crit-dep", Priority::Critical, 0.1, {"x"}),
        item("crit-fast", Priority::Critical, 1.0),
        item("medium", Priority::Medium),
    };

    auto ordered = planner.order(items);
    std::vector<std::string> kinds;
    for (const auto& w : ordered) kinds.push_back(w.kind);

    EXPECT_EQ(kinds, (std::vector<std::string>{
        "crit-fast", "crit-slow", "crit-dep", "medium", "low"}));
}

TEST_F(BatchPlannerTest, OrderingIsStable) {
    auto items = independent_items(5);
    auto ordered = planner.order(items);
    for (std::size_t i = 0; i < items.size(); ++i) {
        EXPECT_EQ(ordered[i].kind, items[i].kind);
    }
}

// ===========================================================================
// Batch size
// ===========================================================================

TEST_F(BatchPlannerTest, EffectiveBatchSizeClampedToResearchRange) {
    budget.max_batch_size = 6;
    EXPECT_EQ(planner.effective_batch_size(budget, Complexity::Medium), 5);
    EXPECT_EQ(planner.effective_batch_size(budget, Complexity::High), 5);

    budget.max_batch_size = 5;
    EXPECT_EQ(planner.effective_batch_size(budget, Complexity::High), 4);

    budget.max_batch_size = 3;
    EXPECT_EQ(planner.effective_batch_size(budget, Complexity::High), 2);
}

TEST_F(BatchPlannerTest, EffectiveBatchSizeNeverExceedsBudget) {
    budget.max_batch_size = 1;
    EXPECT_EQ(planner.effective_batch_size(budget, Complexity::Low), 1);

    auto plan = planner.plan(independent_items(3), budget);
    EXPECT_EQ(plan.batches.size(), 3u);
}

TEST_F(BatchPlannerTest, NoBatchExceedsSizeAndNoIntraBatchDependency) {
    for (int n = 1; n <= 12; ++n) {
        std::vector<WorkItem> items;
        for (int i = 0; i < n; ++i) {
            std::vector<std::string> deps;
            if (i % 3 == 2) deps.push_back("k" + std::to_string(i - 1));
            items.push_back(item("k" + std::to_string(i), Priority::Medium, 1.0, deps));
        }

        for (auto complexity : {Complexity::Low, Complexity::Medium, Complexity::High}) {
            auto plan = planner.plan(items, budget, complexity);
            int limit = planner.effective_batch_size(budget, complexity);
            EXPECT_EQ(plan.item_count(), static_cast<std::size_t>(n));

            for (const auto& batch : plan.batches) {
                EXPECT_LE(static_cast<int>(batch.size()), limit);
                std::set<std::string> kinds;
                for (const auto& w : batch) kinds.insert(w.kind);
                for (const auto& w : batch) {
                    for (const auto& dep : w.dependencies) {
                        EXPECT_EQ(kinds.count(dep), 0u) << "n=" << n << " " << w.kind;
                    }
                }
            }
        }
    }
}

TEST_F(BatchPlannerTest, DependentItemOrderedBeforeItsDependency) {
    // B outranks A, so B is placed first and A must not join its batch
    std::vector<WorkItem> items = {
        item("A", Priority::Low),
        item("B", Priority::High, 1.0, {"A"}),
    };

    auto plan = planner.plan(items, budget);
    ASSERT_EQ(plan.batches.size(), 2u);
    EXPECT_EQ(plan.batches[0][0].kind, "B");
    EXPECT_EQ(plan.batches[1][0].kind, "A");
}

TEST_F(BatchPlannerTest, NoIntraBatchDependencyWhenDependentsOutrank) {
    for (int n = 2; n <= 12; ++n) {
        std::vector<WorkItem> items;
        for (int i = 0; i < n; ++i) {
            std::vector<std::string> deps;
            // Every third item depends on a later, lower-priority item
            if (i % 3 == 0 && i + 1 < n) deps.push_back("k" + std::to_string(i + 1));
            Priority p = deps.empty() ? Priority::Low : Priority::Critical;
            items.push_back(item("k" + std::to_string(i), p, 1.0, deps));
        }

        auto plan = planner.plan(items, budget);
        EXPECT_EQ(plan.item_count(), static_cast<std::size_t>(n));
        for (const auto& batch : plan.batches) {
            std::set<std::string> kinds;
            for (const auto& w : batch) kinds.insert(w.kind);
            for (const auto& w : batch) {
                for (const auto& dep : w.dependencies) {
                    EXPECT_EQ(kinds.count(dep), 0u) << "n=" << n << " " << w.kind;
                }
            }
        }
    }
}

// ===========================================================================
// Strategy and timing
// ===========================================================================

TEST_F(BatchPlannerTest, SingleSmallBatchIsParallel) {
    auto plan = planner.plan(independent_items(4), budget);
    ASSERT_EQ(plan.batches.size(), 1u);
    EXPECT_EQ(plan.strategy, Strategy::Parallel);
    EXPECT_NEAR(plan.estimated_total_time, 1.0 + 4 * 0.1, 1e-12);
}

TEST_F(BatchPlannerTest, SevenItemsAreStrategicWithInterBatchOverhead) {
    auto plan = planner.plan(independent_items(7), budget);
    ASSERT_EQ(plan.batches.size(), 2u);
    EXPECT_EQ(plan.batches[0].size(), 5u);
    EXPECT_EQ(plan.batches[1].size(), 2u);
    EXPECT_EQ(plan.strategy, Strategy::Strategic);
    // (1 + 0.5) + (1 + 0.2) + 0.5
    EXPECT_NEAR(plan.estimated_total_time, 3.2, 1e-12);
    EXPECT_FALSE(plan.degraded);
}

TEST_F(BatchPlannerTest, MoreThanTenItemsIsDegraded) {
    auto plan = planner.plan(independent_items(12), budget);
    EXPECT_EQ(plan.strategy, Strategy::Degraded);
    EXPECT_TRUE(plan.degraded);
}

TEST_F(BatchPlannerTest, ExceedingResponseTimeMarksPlanDegraded) {
    budget.max_response_time = 1.0;
    auto plan = planner.plan({item("slow", Priority::High, 5.0)}, budget);
    EXPECT_EQ(plan.strategy, Strategy::Parallel);
    EXPECT_TRUE(plan.degraded);

    budget.max_response_time = 0.0;  // unlimited
    EXPECT_FALSE(planner.plan({item("slow", Priority::High, 5.0)}, budget).degraded);
}

TEST_F(BatchPlannerTest, BatchTimeUsesLongestItem) {
    std::vector<WorkItem> batch = {item("a", Priority::Medium, 2.0), item("b", Priority::Medium, 7.0)};
    EXPECT_NEAR(planner.estimate_batch_time(batch), 7.2, 1e-12);
}

// ===========================================================================
// Research sizing
// ===========================================================================

TEST_F(BatchPlannerTest, OptimizeBatchSizeAroundOptimum) {
    auto medium = planner.optimize_batch_size(10, Complexity::Medium);
    EXPECT_EQ(medium.batch_size, 4);
    EXPECT_EQ(medium.num_batches, 3);

    auto high = planner.optimize_batch_size(10, Complexity::High);
    EXPECT_EQ(high.batch_size, 3);
    EXPECT_EQ(high.num_batches, 4);

    auto few = planner.optimize_batch_size(3, Complexity::Medium);
    EXPECT_EQ(few.batch_size, 3);
    EXPECT_EQ(few.num_batches, 1);

    auto none = planner.optimize_batch_size(0, Complexity::Medium);
    EXPECT_EQ(none.batch_size, 0);
    EXPECT_EQ(none.num_batches, 1);
}
