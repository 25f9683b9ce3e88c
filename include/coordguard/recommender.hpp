#pragma once

#include "coordguard/types.hpp"
#include "coordguard/config.hpp"
#include "coordguard/pattern_learner.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace coordguard {

struct StrategyAlternative {
    std::string strategy;
    double confidence{0.0};
    double success_rate{0.0};
    double similarity{0.0};
};

struct Recommendation {
    std::optional<std::string> recommended_strategy;
    double confidence{0.0};
    std::optional<Seconds> estimated_duration;
    double success_probability{0.0};
    std::size_t matching_patterns{0};
    std::vector<StrategyAlternative> alternatives;
};

// Advisory strategy lookup over learned patterns
class Recommender {
public:
    explicit Recommender(RecommendConfig config = RecommendConfig{});

    Recommendation recommend(const PatternMap& patterns,
                             const std::vector<std::string>& domains,
                             int item_count) const;

    const RecommendConfig& config() const noexcept;

private:
    RecommendConfig config_;
};

} // namespace coordguard
