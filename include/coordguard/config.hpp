#pragma once

#include "coordguard/types.hpp"

#include <cstddef>
#include <string>

namespace coordguard {

// Cost model and thresholds used by the admission controller
struct AdmissionConfig {
    int base_cost = 200;                // context overhead
    int per_item_cost = 500;
    int per_item_overhead = 50;         // coordination overhead per item
    int overhead_cap = 500;
    int cost_warning_threshold = 8000;

    // Batching advice
    int optimal_batch_size = 4;
    int small_batch_max = 4;
    int large_batch_max = 6;
    double sequential_overlap_factor = 0.8;

    // Performance history
    std::size_t history_capacity = 100;
    std::size_t summary_window = 20;
};

// Item-count thresholds for strategy selection
struct StrategyThresholds {
    int direct_max = 3;
    int parallel_max = 6;
    int strategic_max = 10;
    std::size_t domain_escalation = 4;  // distinct domains forcing Strategic
};

struct PlannerConfig {
    int min_batch_size = 2;
    int max_batch_size = 5;
    int high_complexity_adjustment = -1;
    int optimal_batch_size = 4;
    Seconds coordination_overhead = 0.1;   // per item
    Seconds inter_batch_overhead = 0.5;
    int single_batch_parallel_max = 6;
    int strategic_total_max = 10;
};

// Weighted pattern update constants
struct LearningConfig {
    double initial_confidence = 0.3;
    double confidence_cap = 0.95;
    double usage_weight = 0.1;
    double success_weight = 0.5;
};

struct InsightConfig {
    Seconds expiry = 86400.0;               // 24h
    Seconds recent_window = 3600.0;

    int    reliability_min_usage = 3;
    double reliability_threshold = 0.7;
    double reliability_impact = 0.8;

    double high_performer_threshold = 0.9;
    int    high_performer_min_usage = 2;
    double high_performer_impact = 0.6;

    double degradation_threshold = 0.8;
    double degradation_impact = 0.9;
    double degradation_confidence = 0.7;

    double underutilized_success = 0.85;
    double underutilized_share = 0.1;
    int    underutilized_min_total = 10;
    double underutilized_impact = 0.4;
    double underutilized_confidence = 0.6;
};

struct RecommendConfig {
    int max_count_delta = 2;
    double count_scale = 10.0;
    std::size_t max_alternatives = 2;
};

struct AnalyticsConfig {
    Seconds cache_ttl = 300.0;              // 5 minutes
    Seconds recent_window = 3600.0;
    std::size_t top_patterns = 10;
};

struct PersistenceConfig {
    // When set and no store is supplied, the engine keeps its state in data_dir
    bool enabled = false;
    // Directory for events.json / patterns.json / insights.json
    std::string data_dir = ".coordguard/coordination_data";
};

struct EngineConfig {
    ResourceBudget budget;
    AdmissionConfig admission;
    StrategyThresholds strategy;
    PlannerConfig planner;
    LearningConfig learning;
    InsightConfig insights;
    RecommendConfig recommend;
    AnalyticsConfig analytics;
    PersistenceConfig persistence;

    // spdlog level name ("trace", "debug", "info", "warn", "error", "off")
    std::string log_level = "info";
};

// Throws InvalidConfigException if values are inconsistent
void validate(const EngineConfig& config);

// Parse a JSON document; missing keys keep their defaults.
// Throws InvalidConfigException on malformed input or invalid values.
EngineConfig config_from_json(const std::string& text);
EngineConfig load_config(const std::string& path);

} // namespace coordguard
