#include "coordguard/insight_generator.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace coordguard {

namespace {

std::string join_domains(const std::vector<std::string>& domains) {
    return fmt::format("{}", fmt::join(domains, "+"));
}

} // anonymous namespace

bool operator==(const Insight& a, const Insight& b) {
    return a.id == b.id &&
           a.category == b.category &&
           a.description == b.description &&
           a.recommendation == b.recommendation &&
           a.impact_score == b.impact_score &&
           a.confidence == b.confidence &&
           a.created_at == b.created_at &&
           a.applies_to == b.applies_to;
}

std::optional<InsightCategory> parse_insight_category(const std::string& name) {
    if (name == "reliability")  return InsightCategory::Reliability;
    if (name == "optimization") return InsightCategory::Optimization;
    if (name == "monitoring")   return InsightCategory::Monitoring;
    return std::nullopt;
}

InsightGenerator::InsightGenerator(InsightConfig config)
    : config_(config) {}

const InsightConfig& InsightGenerator::config() const noexcept {
    return config_;
}

std::vector<Insight> InsightGenerator::generate(const PatternMap& patterns,
                                                const Analytics& analytics,
                                                Timestamp now) const
{
    std::vector<Insight> out;
    if (analytics.empty()) {
        return out;
    }

    reliability(patterns, now, out);
    high_performer(patterns, now, out);
    degradation(patterns, now, out);
    underutilized(analytics, now, out);
    return out;
}

std::size_t InsightGenerator::merge(std::vector<Insight>& existing,
                                    const std::vector<Insight>& fresh,
                                    Timestamp now) const
{
    for (const auto& insight : fresh) {
        auto it = std::find_if(existing.begin(), existing.end(),
            [&insight](const Insight& i) { return i.id == insight.id; });
        if (it != existing.end()) {
            *it = insight;
        } else {
            existing.push_back(insight);
        }
    }

    auto before = existing.size();
    existing.erase(std::remove_if(existing.begin(), existing.end(),
        [this, now](const Insight& i) { return i.created_at <= now - config_.expiry; }),
        existing.end());
    return before - existing.size();
}

// ========== Individual rules ==========

void InsightGenerator::reliability(const PatternMap& patterns, Timestamp now,
                                   std::vector<Insight>& out) const
{
    std::vector<const Pattern*> weak;
    for (const auto& [key, pattern] : patterns) {
        if (pattern.usage_count >= config_.reliability_min_usage &&
            pattern.success_rate < config_.reliability_threshold) {
            weak.push_back(&pattern);
        }
    }
    // Stable output order regardless of hash layout
    std::sort(weak.begin(), weak.end(), [](const Pattern* a, const Pattern* b) {
        return a->key.to_string() < b->key.to_string();
    });

    for (const Pattern* p : weak) {
        auto id = p->key.to_string();
        Insight insight;
        insight.id = "low_success_" + id;
        insight.category = InsightCategory::Reliability;
        insight.description = fmt::format("Pattern {} has low success rate ({:.1f}%)",
                                          id, p->success_rate * 100.0);
        insight.recommendation = fmt::format(
            "Consider alternative strategies for {} coordination with {} items",
            join_domains(p->key.domains), p->key.item_count);
        insight.impact_score = config_.reliability_impact;
        insight.confidence = p->confidence;
        insight.created_at = now;
        insight.applies_to = p->key.domains;
        out.push_back(std::move(insight));
    }
}

void InsightGenerator::high_performer(const PatternMap& patterns, Timestamp now,
                                      std::vector<Insight>& out) const
{
    const Pattern* best = nullptr;
    for (const auto& [key, pattern] : patterns) {
        if (pattern.success_rate <= config_.high_performer_threshold ||
            pattern.usage_count < config_.high_performer_min_usage) {
            continue;
        }
        if (best == nullptr) {
            best = &pattern;
            continue;
        }
        double score = pattern.success_rate * pattern.confidence;
        double best_score = best->success_rate * best->confidence;
        if (score > best_score ||
            (score == best_score && key.to_string() < best->key.to_string())) {
            best = &pattern;
        }
    }
    if (best == nullptr) {
        return;
    }

    auto id = best->key.to_string();
    Insight insight;
    insight.id = "high_performer_" + id;
    insight.category = InsightCategory::Optimization;
    insight.description = fmt::format("Pattern {} shows excellent performance ({:.1f}% success)",
                                      id, best->success_rate * 100.0);
    insight.recommendation = fmt::format("Prefer {} strategy for {} coordination",
                                         best->key.strategy, join_domains(best->key.domains));
    insight.impact_score = config_.high_performer_impact;
    insight.confidence = best->confidence;
    insight.created_at = now;
    insight.applies_to = best->key.domains;
    out.push_back(std::move(insight));
}

void InsightGenerator::degradation(const PatternMap& patterns, Timestamp now,
                                   std::vector<Insight>& out) const
{
    double sum = 0.0;
    std::size_t count = 0;
    for (const auto& [key, pattern] : patterns) {
        if (pattern.last_used > now - config_.recent_window) {
            sum += pattern.success_rate;
            count++;
        }
    }
    if (count == 0) {
        return;
    }

    double average = sum / static_cast<double>(count);
    if (average >= config_.degradation_threshold) {
        return;
    }

    Insight insight;
    insight.id = "recent_degradation";
    insight.category = InsightCategory::Monitoring;
    insight.description = fmt::format("Recent coordination success rate is {:.1f}%, below optimal",
                                      average * 100.0);
    insight.recommendation =
        "Review recent coordination failures and consider system resource constraints";
    insight.impact_score = config_.degradation_impact;
    insight.confidence = config_.degradation_confidence;
    insight.created_at = now;
    insight.applies_to = {"all"};
    out.push_back(std::move(insight));
}

void InsightGenerator::underutilized(const Analytics& analytics, Timestamp now,
                                     std::vector<Insight>& out) const
{
    std::size_t total = 0;
    for (const auto& [strategy, stats] : analytics.strategy_stats) {
        total += stats.usage_count;
    }
    if (static_cast<int>(total) <= config_.underutilized_min_total) {
        return;
    }

    for (const auto& [strategy, stats] : analytics.strategy_stats) {
        double share = static_cast<double>(stats.usage_count) / static_cast<double>(total);
        if (stats.success_rate <= config_.underutilized_success ||
            share >= config_.underutilized_share) {
            continue;
        }

        Insight insight;
        insight.id = "underutilized_" + strategy;
        insight.category = InsightCategory::Optimization;
        insight.description = fmt::format(
            "Strategy '{}' has high success rate ({:.1f}%) but low usage",
            strategy, stats.success_rate * 100.0);
        insight.recommendation = fmt::format(
            "Consider using '{}' strategy more frequently for applicable scenarios", strategy);
        insight.impact_score = config_.underutilized_impact;
        insight.confidence = config_.underutilized_confidence;
        insight.created_at = now;
        insight.applies_to = {"strategy_selection"};
        out.push_back(std::move(insight));
    }
}

} // namespace coordguard
