#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include <coordguard/coordguard.hpp>

using namespace coordguard;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_coordguard, m) {
    m.doc() = "CoordGuard: coordination strategy and pattern-learning engine";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_core(m);
    bind_engine(m);
    bind_monitors(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<Priority>(m, "Priority")
        .value("Critical", Priority::Critical)
        .value("High",     Priority::High)
        .value("Medium",   Priority::Medium)
        .value("Low",      Priority::Low)
        .export_values();

    py::enum_<Complexity>(m, "Complexity")
        .value("Low",    Complexity::Low)
        .value("Medium", Complexity::Medium)
        .value("High",   Complexity::High);

    py::enum_<Strategy>(m, "Strategy")
        .value("Direct",    Strategy::Direct)
        .value("Parallel",  Strategy::Parallel)
        .value("Strategic", Strategy::Strategic)
        .value("Degraded",  Strategy::Degraded)
        .export_values();

    py::enum_<ErrorKind>(m, "ErrorKind")
        .value("NoError",            ErrorKind::None)
        .value("InvalidCount",       ErrorKind::InvalidCount)
        .value("OverCapacity",       ErrorKind::OverCapacity)
        .value("Busy",               ErrorKind::Busy)
        .value("BudgetExceeded",     ErrorKind::BudgetExceeded)
        .value("OrphanCompletion",   ErrorKind::OrphanCompletion)
        .value("PersistenceFailure", ErrorKind::PersistenceFailure);

    py::enum_<CoordinationEventType>(m, "CoordinationEventType")
        .value("Start",    CoordinationEventType::Start)
        .value("Complete", CoordinationEventType::Complete)
        .value("Error",    CoordinationEventType::Error)
        .value("Timeout",  CoordinationEventType::Timeout);

    py::enum_<PatternType>(m, "PatternType")
        .value("Sequential", PatternType::Sequential)
        .value("Parallel",   PatternType::Parallel)
        .value("Batch",      PatternType::Batch)
        .value("Hybrid",     PatternType::Hybrid);

    py::enum_<InsightCategory>(m, "InsightCategory")
        .value("Reliability",  InsightCategory::Reliability)
        .value("Optimization", InsightCategory::Optimization)
        .value("Monitoring",   InsightCategory::Monitoring);

    py::enum_<EventType>(m, "EventType")
        .value("CoordinationAdmitted",  EventType::CoordinationAdmitted)
        .value("CoordinationRejected",  EventType::CoordinationRejected)
        .value("WindowOpened",          EventType::WindowOpened)
        .value("WindowClosed",          EventType::WindowClosed)
        .value("PlanCreated",           EventType::PlanCreated)
        .value("CoordinationStarted",   EventType::CoordinationStarted)
        .value("CoordinationCompleted", EventType::CoordinationCompleted)
        .value("CoordinationFailed",    EventType::CoordinationFailed)
        .value("OrphanCompletion",      EventType::OrphanCompletion)
        .value("PatternCreated",        EventType::PatternCreated)
        .value("PatternUpdated",        EventType::PatternUpdated)
        .value("InsightGenerated",      EventType::InsightGenerated)
        .value("InsightsPruned",        EventType::InsightsPruned)
        .value("StateLoadFailed",       EventType::StateLoadFailed)
        .value("PersistenceFailure",    EventType::PersistenceFailure);

    py::enum_<LogMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   LogMonitor::Verbosity::Quiet)
        .value("Normal",  LogMonitor::Verbosity::Normal)
        .value("Verbose", LogMonitor::Verbosity::Verbose)
        .value("Debug",   LogMonitor::Verbosity::Debug)
        .export_values();

    // ---- Request / plan structs -------------------------------------------

    py::class_<WorkItem>(m, "WorkItem")
        .def(py::init<>())
        .def(py::init([](std::string kind, Priority priority, std::string domain,
                         Seconds estimated_duration, std::vector<std::string> dependencies) {
                 WorkItem item;
                 item.kind = std::move(kind);
                 item.priority = priority;
                 item.domain = std::move(domain);
                 item.estimated_duration = estimated_duration;
                 item.dependencies = std::move(dependencies);
                 return item;
             }),
             py::arg("kind"), py::arg("priority") = Priority::Medium,
             py::arg("domain") = "", py::arg("estimated_duration") = 0.0,
             py::arg("dependencies") = std::vector<std::string>{})
        .def_readwrite("kind",               &WorkItem::kind)
        .def_readwrite("description",        &WorkItem::description)
        .def_readwrite("payload",            &WorkItem::payload)
        .def_readwrite("priority",           &WorkItem::priority)
        .def_readwrite("domain",             &WorkItem::domain)
        .def_readwrite("estimated_duration", &WorkItem::estimated_duration)
        .def_readwrite("dependencies",       &WorkItem::dependencies)
        .def("__repr__", [](const WorkItem& w) {
            return "<WorkItem kind='" + w.kind + "' priority=" + to_string(w.priority) + ">";
        });

    py::class_<ResourceBudget>(m, "ResourceBudget")
        .def(py::init<>())
        .def_readwrite("max_concurrent_items",   &ResourceBudget::max_concurrent_items)
        .def_readwrite("max_batch_size",         &ResourceBudget::max_batch_size)
        .def_readwrite("max_response_time",      &ResourceBudget::max_response_time)
        .def_readwrite("max_resource_usage",     &ResourceBudget::max_resource_usage)
        .def_readwrite("current_resource_usage", &ResourceBudget::current_resource_usage);

    py::class_<CoordinationPlan>(m, "CoordinationPlan")
        .def(py::init<>())
        .def_readwrite("batches",              &CoordinationPlan::batches)
        .def_readwrite("strategy",             &CoordinationPlan::strategy)
        .def_readwrite("estimated_total_time", &CoordinationPlan::estimated_total_time)
        .def_readwrite("degraded",             &CoordinationPlan::degraded)
        .def("item_count",                     &CoordinationPlan::item_count);

    py::class_<Status>(m, "Status")
        .def(py::init<>())
        .def_readwrite("kind",    &Status::kind)
        .def_readwrite("message", &Status::message)
        .def("ok",                &Status::ok)
        .def("__bool__",          &Status::ok);

    py::class_<AdmissionDecision>(m, "AdmissionDecision")
        .def(py::init<>())
        .def_readwrite("admitted",       &AdmissionDecision::admitted)
        .def_readwrite("error",          &AdmissionDecision::error)
        .def_readwrite("reason",         &AdmissionDecision::reason)
        .def_readwrite("estimated_cost", &AdmissionDecision::estimated_cost);

    // ---- Learning structs -------------------------------------------------

    py::class_<CoordinationEvent>(m, "CoordinationEvent")
        .def(py::init<>())
        .def_readwrite("id",            &CoordinationEvent::id)
        .def_readwrite("type",          &CoordinationEvent::type)
        .def_readwrite("timestamp",     &CoordinationEvent::timestamp)
        .def_readwrite("item_count",    &CoordinationEvent::item_count)
        .def_readwrite("domains",       &CoordinationEvent::domains)
        .def_readwrite("strategy",      &CoordinationEvent::strategy)
        .def_readwrite("duration",      &CoordinationEvent::duration)
        .def_readwrite("success",       &CoordinationEvent::success)
        .def_readwrite("items",         &CoordinationEvent::items)
        .def_readwrite("error_message", &CoordinationEvent::error_message)
        .def("is_terminal",             &CoordinationEvent::is_terminal);

    py::class_<PatternKey>(m, "PatternKey")
        .def(py::init(&PatternKey::make),
             py::arg("domains"), py::arg("item_count"), py::arg("strategy"))
        .def_readonly("domains",    &PatternKey::domains)
        .def_readonly("item_count", &PatternKey::item_count)
        .def_readonly("strategy",   &PatternKey::strategy)
        .def("__str__",             &PatternKey::to_string)
        .def("__eq__", [](const PatternKey& a, const PatternKey& b) { return a == b; })
        .def("__hash__", [](const PatternKey& k) { return PatternKeyHash{}(k); });

    py::class_<Pattern>(m, "Pattern")
        .def(py::init<>())
        .def_readwrite("key",          &Pattern::key)
        .def_readwrite("type",         &Pattern::type)
        .def_readwrite("success_rate", &Pattern::success_rate)
        .def_readwrite("avg_duration", &Pattern::avg_duration)
        .def_readwrite("usage_count",  &Pattern::usage_count)
        .def_readwrite("last_used",    &Pattern::last_used)
        .def_readwrite("confidence",   &Pattern::confidence)
        .def("__repr__", [](const Pattern& p) {
            return "<Pattern " + p.key.to_string() +
                   " usage=" + std::to_string(p.usage_count) + ">";
        });

    py::class_<Insight>(m, "Insight")
        .def(py::init<>())
        .def_readwrite("id",             &Insight::id)
        .def_readwrite("category",       &Insight::category)
        .def_readwrite("description",    &Insight::description)
        .def_readwrite("recommendation", &Insight::recommendation)
        .def_readwrite("impact_score",   &Insight::impact_score)
        .def_readwrite("confidence",     &Insight::confidence)
        .def_readwrite("created_at",     &Insight::created_at)
        .def_readwrite("applies_to",     &Insight::applies_to);

    py::class_<StrategyAlternative>(m, "StrategyAlternative")
        .def(py::init<>())
        .def_readwrite("strategy",     &StrategyAlternative::strategy)
        .def_readwrite("confidence",   &StrategyAlternative::confidence)
        .def_readwrite("success_rate", &StrategyAlternative::success_rate)
        .def_readwrite("similarity",   &StrategyAlternative::similarity);

    py::class_<Recommendation>(m, "Recommendation")
        .def(py::init<>())
        .def_readwrite("recommended_strategy", &Recommendation::recommended_strategy)
        .def_readwrite("confidence",           &Recommendation::confidence)
        .def_readwrite("estimated_duration",   &Recommendation::estimated_duration)
        .def_readwrite("success_probability",  &Recommendation::success_probability)
        .def_readwrite("matching_patterns",    &Recommendation::matching_patterns)
        .def_readwrite("alternatives",         &Recommendation::alternatives);

    py::class_<AnalyticsSummary>(m, "AnalyticsSummary")
        .def(py::init<>())
        .def_readwrite("total_events",             &AnalyticsSummary::total_events)
        .def_readwrite("completed_coordinations",  &AnalyticsSummary::completed_coordinations)
        .def_readwrite("successful_coordinations", &AnalyticsSummary::successful_coordinations)
        .def_readwrite("success_rate",             &AnalyticsSummary::success_rate)
        .def_readwrite("recent_events",            &AnalyticsSummary::recent_events)
        .def_readwrite("total_patterns_learned",   &AnalyticsSummary::total_patterns_learned)
        .def_readwrite("last_coordination",        &AnalyticsSummary::last_coordination)
        .def_readwrite("insights_generated",       &AnalyticsSummary::insights_generated);

    py::class_<DomainStats>(m, "DomainStats")
        .def(py::init<>())
        .def_readwrite("usage_count",  &DomainStats::usage_count)
        .def_readwrite("success_rate", &DomainStats::success_rate);

    py::class_<StrategyStats>(m, "StrategyStats")
        .def(py::init<>())
        .def_readwrite("usage_count",  &StrategyStats::usage_count)
        .def_readwrite("success_rate", &StrategyStats::success_rate)
        .def_readwrite("avg_duration", &StrategyStats::avg_duration);

    py::class_<Analytics>(m, "Analytics")
        .def(py::init<>())
        .def_readwrite("summary",        &Analytics::summary)
        .def_readwrite("domain_stats",   &Analytics::domain_stats)
        .def_readwrite("strategy_stats", &Analytics::strategy_stats)
        .def_readwrite("top_patterns",   &Analytics::top_patterns)
        .def("empty",                    &Analytics::empty);

    // ---- Monitoring structs -----------------------------------------------

    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",             &MonitorEvent::type)
        .def_readwrite("timestamp",        &MonitorEvent::timestamp)
        .def_readwrite("message",          &MonitorEvent::message)
        .def_readwrite("coordination_id",  &MonitorEvent::coordination_id)
        .def_readwrite("item_count",       &MonitorEvent::item_count)
        .def_readwrite("strategy",         &MonitorEvent::strategy)
        .def_readwrite("pattern_key",      &MonitorEvent::pattern_key)
        .def_readwrite("error_kind",       &MonitorEvent::error_kind)
        .def_readwrite("duration_seconds", &MonitorEvent::duration_seconds);

    py::class_<EngineSnapshot>(m, "EngineSnapshot")
        .def(py::init<>())
        .def_readwrite("timestamp",              &EngineSnapshot::timestamp)
        .def_readwrite("open_windows",           &EngineSnapshot::open_windows)
        .def_readwrite("current_resource_usage", &EngineSnapshot::current_resource_usage)
        .def_readwrite("max_resource_usage",     &EngineSnapshot::max_resource_usage)
        .def_readwrite("total_events",           &EngineSnapshot::total_events)
        .def_readwrite("open_coordinations",     &EngineSnapshot::open_coordinations)
        .def_readwrite("patterns",               &EngineSnapshot::patterns)
        .def_readwrite("insights",               &EngineSnapshot::insights);

    // MetricsMonitor::Metrics (bound as module-level "Metrics")
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("admitted",                 &MetricsMonitor::Metrics::admitted)
        .def_readwrite("rejected",                 &MetricsMonitor::Metrics::rejected)
        .def_readwrite("rejections_by_kind",       &MetricsMonitor::Metrics::rejections_by_kind)
        .def_readwrite("plans_created",            &MetricsMonitor::Metrics::plans_created)
        .def_readwrite("started",                  &MetricsMonitor::Metrics::started)
        .def_readwrite("completed",                &MetricsMonitor::Metrics::completed)
        .def_readwrite("failed",                   &MetricsMonitor::Metrics::failed)
        .def_readwrite("orphan_completions",       &MetricsMonitor::Metrics::orphan_completions)
        .def_readwrite("patterns_created",         &MetricsMonitor::Metrics::patterns_created)
        .def_readwrite("insights_generated",       &MetricsMonitor::Metrics::insights_generated)
        .def_readwrite("persistence_failures",     &MetricsMonitor::Metrics::persistence_failures)
        .def_readwrite("average_duration_seconds", &MetricsMonitor::Metrics::average_duration_seconds)
        .def_readwrite("resource_usage_percent",   &MetricsMonitor::Metrics::resource_usage_percent);
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_CoordGuardError =
        py::register_exception<CoordGuardException>(m, "CoordGuardError", PyExc_RuntimeError);

    // Derived from CoordGuardError
    static auto py_InvalidConfigError =
        py::register_exception<InvalidConfigException>(m, "InvalidConfigError", py_CoordGuardError.ptr());
    static auto py_SerializationError =
        py::register_exception<SerializationException>(m, "SerializationError", py_CoordGuardError.ptr());
    static auto py_PersistenceError =
        py::register_exception<PersistenceException>(m, "PersistenceError", py_CoordGuardError.ptr());
}
