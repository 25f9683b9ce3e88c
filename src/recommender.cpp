#include "coordguard/recommender.hpp"

#include <algorithm>
#include <cstdlib>
#include <set>

namespace coordguard {

namespace {

struct Match {
    const Pattern* pattern{nullptr};
    double similarity{0.0};
    double score{0.0};
};

} // anonymous namespace

Recommender::Recommender(RecommendConfig config)
    : config_(config) {}

const RecommendConfig& Recommender::config() const noexcept {
    return config_;
}

Recommendation Recommender::recommend(const PatternMap& patterns,
                                      const std::vector<std::string>& domains,
                                      int item_count) const
{
    std::set<std::string> requested(domains.begin(), domains.end());

    std::vector<Match> matches;
    for (const auto& [key, pattern] : patterns) {
        int delta = std::abs(key.item_count - item_count);
        if (delta > config_.max_count_delta) continue;

        std::size_t overlap = 0;
        for (const auto& domain : key.domains) {
            if (requested.count(domain)) overlap++;
        }
        if (overlap == 0) continue;

        Match m;
        m.pattern = &pattern;
        m.similarity = static_cast<double>(overlap) /
                       static_cast<double>(std::max(requested.size(), key.domains.size()));
        double count_score = 1.0 - static_cast<double>(delta) / config_.count_scale;
        m.score = m.similarity * pattern.confidence * count_score;
        matches.push_back(m);
    }

    std::sort(matches.begin(), matches.end(), [](const Match& a, const Match& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.pattern->key.to_string() < b.pattern->key.to_string();
    });

    Recommendation result;
    result.matching_patterns = matches.size();
    if (matches.empty()) {
        return result;
    }

    const Pattern& best = *matches.front().pattern;
    result.recommended_strategy = best.key.strategy;
    result.confidence = best.confidence;
    result.estimated_duration = best.avg_duration;
    result.success_probability = best.success_rate;

    for (std::size_t i = 1; i < matches.size() && result.alternatives.size() < config_.max_alternatives; ++i) {
        const Pattern& p = *matches[i].pattern;
        result.alternatives.push_back(StrategyAlternative{
            p.key.strategy, p.confidence, p.success_rate, matches[i].similarity});
    }
    return result;
}

} // namespace coordguard
