#include "coordguard/strategy_selector.hpp"

#include <algorithm>
#include <unordered_set>

namespace coordguard {

StrategySelector::StrategySelector(StrategyThresholds thresholds)
    : thresholds_(thresholds) {}

Strategy StrategySelector::select(int item_count,
                                  const std::vector<std::string>& domains,
                                  bool violates_constraints) const
{
    if (violates_constraints || item_count > thresholds_.strategic_max) {
        return Strategy::Degraded;
    }

    Strategy strategy = Strategy::Strategic;
    if (item_count <= thresholds_.direct_max) {
        strategy = Strategy::Direct;
    } else if (item_count <= thresholds_.parallel_max) {
        strategy = Strategy::Parallel;
    }

    // Domain breadth outweighs raw count
    if (distinct_domain_count(domains) >= thresholds_.domain_escalation) {
        strategy = std::max(strategy, Strategy::Strategic);
    }
    return strategy;
}

const StrategyThresholds& StrategySelector::thresholds() const noexcept {
    return thresholds_;
}

std::size_t StrategySelector::distinct_domain_count(const std::vector<std::string>& domains) {
    std::unordered_set<std::string> distinct(domains.begin(), domains.end());
    return distinct.size();
}

} // namespace coordguard
