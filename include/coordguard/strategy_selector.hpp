#pragma once

#include "coordguard/types.hpp"
#include "coordguard/config.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace coordguard {

// Maps request shape (item count, domain breadth) to a coordination strategy
class StrategySelector {
public:
    explicit StrategySelector(StrategyThresholds thresholds = StrategyThresholds{});

    Strategy select(int item_count,
                    const std::vector<std::string>& domains,
                    bool violates_constraints) const;

    const StrategyThresholds& thresholds() const noexcept;

    static std::size_t distinct_domain_count(const std::vector<std::string>& domains);

private:
    StrategyThresholds thresholds_;
};

} // namespace coordguard
