#include "coordguard/config.hpp"
#include "coordguard/exceptions.hpp"

#include <json/json.h>

#include <fstream>
#include <memory>
#include <sstream>

namespace coordguard {

namespace {

void fail(const std::string& what) {
    throw InvalidConfigException("Invalid configuration: " + what);
}

void read(const Json::Value& obj, const char* key, int& out) {
    if (!obj.isMember(key)) return;
    if (!obj[key].isInt()) fail(std::string(key) + " must be an integer");
    out = obj[key].asInt();
}

void read(const Json::Value& obj, const char* key, std::size_t& out) {
    if (!obj.isMember(key)) return;
    if (!obj[key].isUInt64()) fail(std::string(key) + " must be a non-negative integer");
    out = static_cast<std::size_t>(obj[key].asUInt64());
}

void read(const Json::Value& obj, const char* key, double& out) {
    if (!obj.isMember(key)) return;
    if (!obj[key].isNumeric()) fail(std::string(key) + " must be a number");
    out = obj[key].asDouble();
}

void read(const Json::Value& obj, const char* key, bool& out) {
    if (!obj.isMember(key)) return;
    if (!obj[key].isBool()) fail(std::string(key) + " must be a boolean");
    out = obj[key].asBool();
}

void read(const Json::Value& obj, const char* key, std::string& out) {
    if (!obj.isMember(key)) return;
    if (!obj[key].isString()) fail(std::string(key) + " must be a string");
    out = obj[key].asString();
}

// Returns a null value when the section is absent
const Json::Value& section(const Json::Value& root, const char* name) {
    static const Json::Value empty(Json::objectValue);
    if (!root.isMember(name)) return empty;
    if (!root[name].isObject()) fail(std::string(name) + " must be an object");
    return root[name];
}

void check_ratio(double value, const char* name) {
    if (value < 0.0 || value > 1.0) {
        fail(std::string(name) + " must be within [0, 1]");
    }
}

void check_positive(double value, const char* name) {
    if (value <= 0.0) {
        fail(std::string(name) + " must be positive");
    }
}

} // anonymous namespace

void validate(const EngineConfig& config) {
    const auto& b = config.budget;
    check_positive(b.max_concurrent_items, "budget.max_concurrent_items");
    check_positive(b.max_batch_size, "budget.max_batch_size");
    if (b.max_response_time < 0.0) fail("budget.max_response_time must not be negative");
    check_ratio(b.max_resource_usage, "budget.max_resource_usage");
    check_ratio(b.current_resource_usage, "budget.current_resource_usage");

    const auto& a = config.admission;
    if (a.base_cost < 0 || a.per_item_cost < 0 || a.per_item_overhead < 0 || a.overhead_cap < 0) {
        fail("admission costs must not be negative");
    }
    check_positive(a.cost_warning_threshold, "admission.cost_warning_threshold");
    check_positive(a.optimal_batch_size, "admission.optimal_batch_size");
    if (a.small_batch_max > a.large_batch_max) {
        fail("admission.small_batch_max must not exceed large_batch_max");
    }
    if (a.history_capacity == 0) fail("admission.history_capacity must be positive");
    if (a.summary_window == 0) fail("admission.summary_window must be positive");

    const auto& s = config.strategy;
    if (!(0 < s.direct_max && s.direct_max < s.parallel_max && s.parallel_max < s.strategic_max)) {
        fail("strategy thresholds must be strictly increasing and positive");
    }
    if (s.domain_escalation == 0) fail("strategy.domain_escalation must be positive");

    const auto& p = config.planner;
    if (p.min_batch_size < 1 || p.min_batch_size > p.max_batch_size) {
        fail("planner batch size bounds are inconsistent");
    }
    check_positive(p.optimal_batch_size, "planner.optimal_batch_size");
    if (p.coordination_overhead < 0.0 || p.inter_batch_overhead < 0.0) {
        fail("planner overheads must not be negative");
    }

    const auto& l = config.learning;
    check_ratio(l.initial_confidence, "learning.initial_confidence");
    check_ratio(l.confidence_cap, "learning.confidence_cap");
    if (l.usage_weight < 0.0 || l.success_weight < 0.0) {
        fail("learning weights must not be negative");
    }

    const auto& i = config.insights;
    check_positive(i.expiry, "insights.expiry");
    check_positive(i.recent_window, "insights.recent_window");
    check_ratio(i.reliability_threshold, "insights.reliability_threshold");
    check_ratio(i.high_performer_threshold, "insights.high_performer_threshold");
    check_ratio(i.degradation_threshold, "insights.degradation_threshold");
    check_ratio(i.underutilized_success, "insights.underutilized_success");
    check_ratio(i.underutilized_share, "insights.underutilized_share");

    const auto& r = config.recommend;
    if (r.max_count_delta < 0) fail("recommend.max_count_delta must not be negative");
    check_positive(r.count_scale, "recommend.count_scale");

    const auto& an = config.analytics;
    if (an.cache_ttl < 0.0) fail("analytics.cache_ttl must not be negative");
    check_positive(an.recent_window, "analytics.recent_window");

    if (config.persistence.data_dir.empty()) fail("persistence.data_dir must not be empty");
}

EngineConfig config_from_json(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    bool ok = false;
    try {
        ok = reader->parse(text.data(), text.data() + text.size(), &root, &errors);
    } catch (const Json::Exception& e) {
        fail(std::string("malformed JSON: ") + e.what());
    }
    if (!ok) {
        fail("malformed JSON: " + errors);
    }
    if (!root.isObject()) fail("root must be an object");

    EngineConfig config;

    const auto& b = section(root, "budget");
    read(b, "max_concurrent_items", config.budget.max_concurrent_items);
    read(b, "max_batch_size", config.budget.max_batch_size);
    read(b, "max_response_time", config.budget.max_response_time);
    read(b, "max_resource_usage", config.budget.max_resource_usage);
    read(b, "current_resource_usage", config.budget.current_resource_usage);

    const auto& a = section(root, "admission");
    read(a, "base_cost", config.admission.base_cost);
    read(a, "per_item_cost", config.admission.per_item_cost);
    read(a, "per_item_overhead", config.admission.per_item_overhead);
    read(a, "overhead_cap", config.admission.overhead_cap);
    read(a, "cost_warning_threshold", config.admission.cost_warning_threshold);
    read(a, "optimal_batch_size", config.admission.optimal_batch_size);
    read(a, "small_batch_max", config.admission.small_batch_max);
    read(a, "large_batch_max", config.admission.large_batch_max);
    read(a, "sequential_overlap_factor", config.admission.sequential_overlap_factor);
    read(a, "history_capacity", config.admission.history_capacity);
    read(a, "summary_window", config.admission.summary_window);

    const auto& s = section(root, "strategy");
    read(s, "direct_max", config.strategy.direct_max);
    read(s, "parallel_max", config.strategy.parallel_max);
    read(s, "strategic_max", config.strategy.strategic_max);
    read(s, "domain_escalation", config.strategy.domain_escalation);

    const auto& p = section(root, "planner");
    read(p, "min_batch_size", config.planner.min_batch_size);
    read(p, "max_batch_size", config.planner.max_batch_size);
    read(p, "high_complexity_adjustment", config.planner.high_complexity_adjustment);
    read(p, "optimal_batch_size", config.planner.optimal_batch_size);
    read(p, "coordination_overhead", config.planner.coordination_overhead);
    read(p, "inter_batch_overhead", config.planner.inter_batch_overhead);
    read(p, "single_batch_parallel_max", config.planner.single_batch_parallel_max);
    read(p, "strategic_total_max", config.planner.strategic_total_max);

    const auto& l = section(root, "learning");
    read(l, "initial_confidence", config.learning.initial_confidence);
    read(l, "confidence_cap", config.learning.confidence_cap);
    read(l, "usage_weight", config.learning.usage_weight);
    read(l, "success_weight", config.learning.success_weight);

    const auto& i = section(root, "insights");
    read(i, "expiry", config.insights.expiry);
    read(i, "recent_window", config.insights.recent_window);
    read(i, "reliability_min_usage", config.insights.reliability_min_usage);
    read(i, "reliability_threshold", config.insights.reliability_threshold);
    read(i, "reliability_impact", config.insights.reliability_impact);
    read(i, "high_performer_threshold", config.insights.high_performer_threshold);
    read(i, "high_performer_min_usage", config.insights.high_performer_min_usage);
    read(i, "high_performer_impact", config.insights.high_performer_impact);
    read(i, "degradation_threshold", config.insights.degradation_threshold);
    read(i, "degradation_impact", config.insights.degradation_impact);
    read(i, "degradation_confidence", config.insights.degradation_confidence);
    read(i, "underutilized_success", config.insights.underutilized_success);
    read(i, "underutilized_share", config.insights.underutilized_share);
    read(i, "underutilized_min_total", config.insights.underutilized_min_total);
    read(i, "underutilized_impact", config.insights.underutilized_impact);
    read(i, "underutilized_confidence", config.insights.underutilized_confidence);

    const auto& r = section(root, "recommend");
    read(r, "max_count_delta", config.recommend.max_count_delta);
    read(r, "count_scale", config.recommend.count_scale);
    read(r, "max_alternatives", config.recommend.max_alternatives);

    const auto& an = section(root, "analytics");
    read(an, "cache_ttl", config.analytics.cache_ttl);
    read(an, "recent_window", config.analytics.recent_window);
    read(an, "top_patterns", config.analytics.top_patterns);

    const auto& ps = section(root, "persistence");
    read(ps, "enabled", config.persistence.enabled);
    read(ps, "data_dir", config.persistence.data_dir);

    read(root, "log_level", config.log_level);

    validate(config);
    return config;
}

EngineConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw InvalidConfigException("Cannot open configuration file: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return config_from_json(buffer.str());
}

} // namespace coordguard
