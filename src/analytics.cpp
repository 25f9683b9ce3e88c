#include "coordguard/analytics.hpp"

#include <algorithm>

namespace coordguard {

Analytics build_analytics(const std::vector<CoordinationEvent>& events,
                          const PatternMap& patterns,
                          std::size_t insight_count,
                          Timestamp now,
                          const AnalyticsConfig& config)
{
    Analytics result;
    auto& summary = result.summary;

    summary.total_events = events.size();
    summary.total_patterns_learned = patterns.size();
    summary.insights_generated = insight_count;

    std::map<std::string, std::size_t> domain_success;
    std::map<std::string, std::size_t> strategy_success;
    std::map<std::string, std::pair<Seconds, std::size_t>> strategy_duration;

    for (const auto& event : events) {
        if (event.timestamp > now - config.recent_window) {
            summary.recent_events++;
        }
        summary.last_coordination = std::max(summary.last_coordination.value_or(event.timestamp),
                                             event.timestamp);

        if (!event.is_terminal()) continue;

        bool ok = event.success.value_or(false);
        summary.completed_coordinations++;
        if (ok) summary.successful_coordinations++;

        // Orphans carry no domains/strategy worth aggregating
        if (!event.duration.has_value()) continue;

        for (const auto& domain : event.domains) {
            result.domain_stats[domain].usage_count++;
            if (ok) domain_success[domain]++;
        }

        result.strategy_stats[event.strategy].usage_count++;
        if (ok) strategy_success[event.strategy]++;
        auto& [sum, count] = strategy_duration[event.strategy];
        sum += event.duration.value();
        count++;
    }

    if (summary.completed_coordinations > 0) {
        summary.success_rate = static_cast<double>(summary.successful_coordinations) /
                               static_cast<double>(summary.completed_coordinations);
    }

    for (auto& [domain, stats] : result.domain_stats) {
        stats.success_rate = static_cast<double>(domain_success[domain]) /
                             static_cast<double>(stats.usage_count);
    }
    for (auto& [strategy, stats] : result.strategy_stats) {
        stats.success_rate = static_cast<double>(strategy_success[strategy]) /
                             static_cast<double>(stats.usage_count);
        const auto& [sum, count] = strategy_duration[strategy];
        stats.avg_duration = count > 0 ? sum / static_cast<double>(count) : 0.0;
    }

    result.top_patterns.reserve(patterns.size());
    for (const auto& [key, pattern] : patterns) {
        result.top_patterns.push_back(pattern);
    }
    std::sort(result.top_patterns.begin(), result.top_patterns.end(),
        [](const Pattern& a, const Pattern& b) {
            if (a.confidence != b.confidence) return a.confidence > b.confidence;
            if (a.usage_count != b.usage_count) return a.usage_count > b.usage_count;
            return a.key.to_string() < b.key.to_string();
        });
    if (result.top_patterns.size() > config.top_patterns) {
        result.top_patterns.resize(config.top_patterns);
    }

    return result;
}

// ========== AnalyticsCache ==========

AnalyticsCache::AnalyticsCache(Seconds ttl) : ttl_(ttl) {}

std::optional<Analytics> AnalyticsCache::get(Timestamp now) const {
    if (!cached_.has_value() || now - cached_at_ >= ttl_) {
        return std::nullopt;
    }
    return cached_;
}

void AnalyticsCache::put(Analytics analytics, Timestamp now) {
    cached_ = std::move(analytics);
    cached_at_ = now;
}

void AnalyticsCache::invalidate() noexcept {
    cached_.reset();
    cached_at_ = 0.0;
}

} // namespace coordguard
