#include "bind_forward.hpp"
#include <coordguard/coordguard.hpp>
#include <pybind11/stl.h>

using namespace coordguard;

// ---------------------------------------------------------------------------
// bind_core  --  configuration, admission, selection, planning
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // Configuration
    // ===================================================================
    py::class_<AdmissionConfig>(m, "AdmissionConfig")
        .def(py::init<>())
        .def_readwrite("base_cost",                 &AdmissionConfig::base_cost)
        .def_readwrite("per_item_cost",             &AdmissionConfig::per_item_cost)
        .def_readwrite("per_item_overhead",         &AdmissionConfig::per_item_overhead)
        .def_readwrite("overhead_cap",              &AdmissionConfig::overhead_cap)
        .def_readwrite("cost_warning_threshold",    &AdmissionConfig::cost_warning_threshold)
        .def_readwrite("optimal_batch_size",        &AdmissionConfig::optimal_batch_size)
        .def_readwrite("small_batch_max",           &AdmissionConfig::small_batch_max)
        .def_readwrite("large_batch_max",           &AdmissionConfig::large_batch_max)
        .def_readwrite("sequential_overlap_factor", &AdmissionConfig::sequential_overlap_factor)
        .def_readwrite("history_capacity",          &AdmissionConfig::history_capacity)
        .def_readwrite("summary_window",            &AdmissionConfig::summary_window);

    py::class_<StrategyThresholds>(m, "StrategyThresholds")
        .def(py::init<>())
        .def_readwrite("direct_max",        &StrategyThresholds::direct_max)
        .def_readwrite("parallel_max",      &StrategyThresholds::parallel_max)
        .def_readwrite("strategic_max",     &StrategyThresholds::strategic_max)
        .def_readwrite("domain_escalation", &StrategyThresholds::domain_escalation);

    py::class_<PlannerConfig>(m, "PlannerConfig")
        .def(py::init<>())
        .def_readwrite("min_batch_size",             &PlannerConfig::min_batch_size)
        .def_readwrite("max_batch_size",             &PlannerConfig::max_batch_size)
        .def_readwrite("high_complexity_adjustment", &PlannerConfig::high_complexity_adjustment)
        .def_readwrite("optimal_batch_size",         &PlannerConfig::optimal_batch_size)
        .def_readwrite("coordination_overhead",      &PlannerConfig::coordination_overhead)
        .def_readwrite("inter_batch_overhead",       &PlannerConfig::inter_batch_overhead)
        .def_readwrite("single_batch_parallel_max",  &PlannerConfig::single_batch_parallel_max)
        .def_readwrite("strategic_total_max",        &PlannerConfig::strategic_total_max);

    py::class_<LearningConfig>(m, "LearningConfig")
        .def(py::init<>())
        .def_readwrite("initial_confidence", &LearningConfig::initial_confidence)
        .def_readwrite("confidence_cap",     &LearningConfig::confidence_cap)
        .def_readwrite("usage_weight",       &LearningConfig::usage_weight)
        .def_readwrite("success_weight",     &LearningConfig::success_weight);

    py::class_<InsightConfig>(m, "InsightConfig")
        .def(py::init<>())
        .def_readwrite("expiry",                   &InsightConfig::expiry)
        .def_readwrite("recent_window",            &InsightConfig::recent_window)
        .def_readwrite("reliability_min_usage",    &InsightConfig::reliability_min_usage)
        .def_readwrite("reliability_threshold",    &InsightConfig::reliability_threshold)
        .def_readwrite("high_performer_threshold", &InsightConfig::high_performer_threshold)
        .def_readwrite("high_performer_min_usage", &InsightConfig::high_performer_min_usage)
        .def_readwrite("degradation_threshold",    &InsightConfig::degradation_threshold)
        .def_readwrite("underutilized_success",    &InsightConfig::underutilized_success)
        .def_readwrite("underutilized_share",      &InsightConfig::underutilized_share)
        .def_readwrite("underutilized_min_total",  &InsightConfig::underutilized_min_total);

    py::class_<RecommendConfig>(m, "RecommendConfig")
        .def(py::init<>())
        .def_readwrite("max_count_delta",  &RecommendConfig::max_count_delta)
        .def_readwrite("count_scale",      &RecommendConfig::count_scale)
        .def_readwrite("max_alternatives", &RecommendConfig::max_alternatives);

    py::class_<AnalyticsConfig>(m, "AnalyticsConfig")
        .def(py::init<>())
        .def_readwrite("cache_ttl",     &AnalyticsConfig::cache_ttl)
        .def_readwrite("recent_window", &AnalyticsConfig::recent_window)
        .def_readwrite("top_patterns",  &AnalyticsConfig::top_patterns);

    py::class_<PersistenceConfig>(m, "PersistenceConfig")
        .def(py::init<>())
        .def_readwrite("enabled",  &PersistenceConfig::enabled)
        .def_readwrite("data_dir", &PersistenceConfig::data_dir);

    // EngineConfig (top-level, embeds the sub-configs)
    py::class_<EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("budget",      &EngineConfig::budget)
        .def_readwrite("admission",   &EngineConfig::admission)
        .def_readwrite("strategy",    &EngineConfig::strategy)
        .def_readwrite("planner",     &EngineConfig::planner)
        .def_readwrite("learning",    &EngineConfig::learning)
        .def_readwrite("insights",    &EngineConfig::insights)
        .def_readwrite("recommend",   &EngineConfig::recommend)
        .def_readwrite("analytics",   &EngineConfig::analytics)
        .def_readwrite("persistence", &EngineConfig::persistence)
        .def_readwrite("log_level",   &EngineConfig::log_level);

    m.def("validate_config", &validate, py::arg("config"));
    m.def("config_from_json", &config_from_json, py::arg("text"));
    m.def("load_config", &load_config, py::arg("path"));

    // ===================================================================
    // AdmissionController
    // ===================================================================
    py::class_<BatchingSuggestion> suggestion(m, "BatchingSuggestion");
    py::enum_<BatchingSuggestion::Kind>(suggestion, "Kind")
        .value("Direct",     BatchingSuggestion::Kind::Direct)
        .value("SmallBatch", BatchingSuggestion::Kind::SmallBatch)
        .value("LargeBatch", BatchingSuggestion::Kind::LargeBatch)
        .value("Sequential", BatchingSuggestion::Kind::Sequential);
    suggestion
        .def(py::init<>())
        .def_readwrite("kind",               &BatchingSuggestion::kind)
        .def_readwrite("description",        &BatchingSuggestion::description)
        .def_readwrite("batches",            &BatchingSuggestion::batches)
        .def_readwrite("items_per_batch",    &BatchingSuggestion::items_per_batch)
        .def_readwrite("estimated_duration", &BatchingSuggestion::estimated_duration);

    py::class_<PerformanceSummary>(m, "PerformanceSummary")
        .def(py::init<>())
        .def_readwrite("total_coordinations",   &PerformanceSummary::total_coordinations)
        .def_readwrite("recent_coordinations",  &PerformanceSummary::recent_coordinations)
        .def_readwrite("average_duration",      &PerformanceSummary::average_duration)
        .def_readwrite("average_items",         &PerformanceSummary::average_items)
        .def_readwrite("average_cost",          &PerformanceSummary::average_cost)
        .def_readwrite("strategy_distribution", &PerformanceSummary::strategy_distribution)
        .def_readwrite("max_items_coordinated", &PerformanceSummary::max_items_coordinated)
        .def_readwrite("total_estimated_cost",  &PerformanceSummary::total_estimated_cost);

    py::class_<AdmissionController>(m, "AdmissionController")
        .def(py::init<ResourceBudget, AdmissionConfig>(),
             py::arg("budget") = ResourceBudget{},
             py::arg("config") = AdmissionConfig{})
        .def("can_admit",          &AdmissionController::can_admit, py::arg("item_count"))
        .def("try_begin_window",   &AdmissionController::try_begin_window, py::arg("item_count"))
        .def("begin_window",       &AdmissionController::begin_window, py::arg("item_count") = 0)
        .def("end_window",         &AdmissionController::end_window)
        .def("open_windows",       &AdmissionController::open_windows)
        .def("estimate_cost",      &AdmissionController::estimate_cost, py::arg("item_count"))
        .def("estimate_duration",  &AdmissionController::estimate_duration, py::arg("item_count"))
        .def("suggest_batching",   &AdmissionController::suggest_batching, py::arg("item_count"))
        .def("record_performance", &AdmissionController::record_performance,
             py::arg("item_count"), py::arg("actual_duration"),
             py::arg("strategy"), py::arg("cost_used") = std::nullopt)
        .def("performance_summary", &AdmissionController::performance_summary)
        .def("budget",             &AdmissionController::budget);

    // ===================================================================
    // StrategySelector
    // ===================================================================
    py::class_<StrategySelector>(m, "StrategySelector")
        .def(py::init<StrategyThresholds>(), py::arg("thresholds") = StrategyThresholds{})
        .def("select", &StrategySelector::select,
             py::arg("item_count"), py::arg("domains"),
             py::arg("violates_constraints") = false)
        .def_static("distinct_domain_count", &StrategySelector::distinct_domain_count);

    // ===================================================================
    // BatchPlanner
    // ===================================================================
    py::class_<BatchSizing>(m, "BatchSizing")
        .def(py::init<>())
        .def_readwrite("batch_size",  &BatchSizing::batch_size)
        .def_readwrite("num_batches", &BatchSizing::num_batches);

    py::class_<BatchPlanner>(m, "BatchPlanner")
        .def(py::init<PlannerConfig>(), py::arg("config") = PlannerConfig{})
        .def("plan", &BatchPlanner::plan,
             py::arg("items"), py::arg("budget"),
             py::arg("complexity") = Complexity::Medium)
        .def("order",                &BatchPlanner::order, py::arg("items"))
        .def("effective_batch_size", &BatchPlanner::effective_batch_size,
             py::arg("budget"), py::arg("complexity"))
        .def("optimize_batch_size",  &BatchPlanner::optimize_batch_size,
             py::arg("total_items"), py::arg("complexity") = Complexity::Medium);
}
