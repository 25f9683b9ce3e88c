#pragma once

#include "coordguard/types.hpp"
#include "coordguard/config.hpp"
#include "coordguard/analytics.hpp"
#include "coordguard/pattern_learner.hpp"

#include <optional>
#include <string>
#include <vector>

namespace coordguard {

enum class InsightCategory {
    Reliability,
    Optimization,
    Monitoring
};

// Human-readable observation about pattern performance; expires after
// InsightConfig::expiry seconds
struct Insight {
    std::string id;
    InsightCategory category{InsightCategory::Monitoring};
    std::string description;
    std::string recommendation;
    double impact_score{0.0};
    double confidence{0.0};
    Timestamp created_at{0.0};
    std::vector<std::string> applies_to;
};

bool operator==(const Insight& a, const Insight& b);
inline bool operator!=(const Insight& a, const Insight& b) { return !(a == b); }

class InsightGenerator {
public:
    explicit InsightGenerator(InsightConfig config = InsightConfig{});

    // Pure scan of the pattern store and strategy statistics
    std::vector<Insight> generate(const PatternMap& patterns,
                                  const Analytics& analytics,
                                  Timestamp now) const;

    // Upsert fresh insights by id, then drop expired ones.
    // Returns the number of insights pruned.
    std::size_t merge(std::vector<Insight>& existing,
                      const std::vector<Insight>& fresh,
                      Timestamp now) const;

    const InsightConfig& config() const noexcept;

private:
    InsightConfig config_;

    void reliability(const PatternMap& patterns, Timestamp now, std::vector<Insight>& out) const;
    void high_performer(const PatternMap& patterns, Timestamp now, std::vector<Insight>& out) const;
    void degradation(const PatternMap& patterns, Timestamp now, std::vector<Insight>& out) const;
    void underutilized(const Analytics& analytics, Timestamp now, std::vector<Insight>& out) const;
};

inline const char* to_string(InsightCategory c) {
    switch (c) {
        case InsightCategory::Reliability:  return "reliability";
        case InsightCategory::Optimization: return "optimization";
        case InsightCategory::Monitoring:   return "monitoring";
    }
    return "unknown";
}

std::optional<InsightCategory> parse_insight_category(const std::string& name);

} // namespace coordguard
