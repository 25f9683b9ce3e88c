#pragma once

#include "coordguard/types.hpp"
#include "coordguard/config.hpp"
#include "coordguard/event_log.hpp"
#include "coordguard/pattern_learner.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace coordguard {

struct AnalyticsSummary {
    std::size_t total_events{0};
    std::size_t completed_coordinations{0};
    std::size_t successful_coordinations{0};
    double success_rate{0.0};
    std::size_t recent_events{0};          // within AnalyticsConfig::recent_window
    std::size_t total_patterns_learned{0};
    std::optional<Timestamp> last_coordination;
    std::size_t insights_generated{0};
};

struct DomainStats {
    std::size_t usage_count{0};
    double success_rate{0.0};
};

struct StrategyStats {
    std::size_t usage_count{0};
    double success_rate{0.0};
    Seconds avg_duration{0.0};
};

struct Analytics {
    AnalyticsSummary summary;
    std::map<std::string, DomainStats> domain_stats;
    std::map<std::string, StrategyStats> strategy_stats;
    std::vector<Pattern> top_patterns;

    bool empty() const noexcept { return summary.total_events == 0; }
};

// Aggregate the event log and pattern store into an analytics snapshot.
// Domain and strategy statistics only count terminal events matched to a
// Start; orphan completions are counted in the summary alone.
Analytics build_analytics(const std::vector<CoordinationEvent>& events,
                          const PatternMap& patterns,
                          std::size_t insight_count,
                          Timestamp now,
                          const AnalyticsConfig& config);

// Time-to-live cache for the analytics read path
class AnalyticsCache {
public:
    explicit AnalyticsCache(Seconds ttl);

    std::optional<Analytics> get(Timestamp now) const;
    void put(Analytics analytics, Timestamp now);
    void invalidate() noexcept;

private:
    Seconds ttl_;
    std::optional<Analytics> cached_;
    Timestamp cached_at_{0.0};
};

} // namespace coordguard
