#include "bind_forward.hpp"
#include <coordguard/coordguard.hpp>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

using namespace coordguard;

// ---------------------------------------------------------------------------
// bind_engine  --  clocks, state stores, CoordinationEngine
// ---------------------------------------------------------------------------
void bind_engine(py::module_& m) {

    // ===================================================================
    // Clocks
    // ===================================================================
    py::class_<Clock, std::shared_ptr<Clock>>(m, "Clock")
        .def("now", &Clock::now);

    py::class_<SystemClock, Clock, std::shared_ptr<SystemClock>>(m, "SystemClock")
        .def(py::init<>());

    py::class_<ManualClock, Clock, std::shared_ptr<ManualClock>>(m, "ManualClock")
        .def(py::init<Timestamp>(), py::arg("start") = 1'700'000'000.0)
        .def("set",     &ManualClock::set, py::arg("t"))
        .def("advance", &ManualClock::advance, py::arg("delta"));

    // ===================================================================
    // State stores
    // ===================================================================
    py::class_<StateStore, std::shared_ptr<StateStore>>(m, "StateStore");

    py::class_<MemoryStateStore, StateStore, std::shared_ptr<MemoryStateStore>>(m, "MemoryStateStore")
        .def(py::init<>());

    py::class_<JsonFileStateStore, StateStore, std::shared_ptr<JsonFileStateStore>>(m, "JsonFileStateStore")
        .def(py::init<std::filesystem::path>(), py::arg("directory"))
        .def("directory", &JsonFileStateStore::directory);

    // ===================================================================
    // CoordinationResult
    // ===================================================================
    py::class_<CoordinationResult>(m, "CoordinationResult")
        .def(py::init<>())
        .def_readwrite("admission",         &CoordinationResult::admission)
        .def_readwrite("selected_strategy", &CoordinationResult::selected_strategy)
        .def_readwrite("plan",              &CoordinationResult::plan)
        .def_readwrite("recommendation",    &CoordinationResult::recommendation);

    // ===================================================================
    // CoordinationEngine
    // ===================================================================
    py::class_<CoordinationEngine>(m, "CoordinationEngine")
        .def(py::init<EngineConfig, std::shared_ptr<StateStore>, std::shared_ptr<Clock>>(),
             py::arg("config") = EngineConfig{},
             py::arg("store") = nullptr,
             py::arg("clock") = nullptr)

        // Admission
        .def("can_admit",           &CoordinationEngine::can_admit, py::arg("item_count"))
        .def("try_begin_window",    &CoordinationEngine::try_begin_window, py::arg("item_count"))
        .def("begin_window",        &CoordinationEngine::begin_window, py::arg("item_count") = 0)
        .def("end_window",          &CoordinationEngine::end_window)
        .def("open_windows",        &CoordinationEngine::open_windows)
        .def("suggest_batching",    &CoordinationEngine::suggest_batching, py::arg("item_count"))
        .def("performance_summary", &CoordinationEngine::performance_summary)

        // Strategy & planning
        .def("select_strategy", &CoordinationEngine::select_strategy,
             py::arg("item_count"), py::arg("domains"),
             py::arg("violates_constraints") = false)
        .def("plan",
             py::overload_cast<const std::vector<WorkItem>&, Complexity>(
                 &CoordinationEngine::plan, py::const_),
             py::arg("items"), py::arg("complexity") = Complexity::Medium)
        .def("plan_with_budget",
             py::overload_cast<const std::vector<WorkItem>&, const ResourceBudget&, Complexity>(
                 &CoordinationEngine::plan, py::const_),
             py::arg("items"), py::arg("budget"), py::arg("complexity") = Complexity::Medium)
        .def("coordinate", &CoordinationEngine::coordinate,
             py::arg("items"), py::arg("complexity") = Complexity::Medium)

        // Reporting (may be called from executor threads)
        .def("report_start", &CoordinationEngine::report_start,
             py::arg("id"), py::arg("item_count"), py::arg("domains"),
             py::arg("strategy"), py::arg("items") = std::nullopt,
             py::call_guard<py::gil_scoped_release>())
        .def("report_complete", &CoordinationEngine::report_complete,
             py::arg("id"), py::arg("success"), py::arg("error_message") = std::nullopt,
             py::call_guard<py::gil_scoped_release>())
        .def("report_timeout", &CoordinationEngine::report_timeout,
             py::arg("id"),
             py::call_guard<py::gil_scoped_release>())

        // Learning queries
        .def("get_analytics",     &CoordinationEngine::get_analytics)
        .def("generate_insights", &CoordinationEngine::generate_insights)
        .def("recommend",         &CoordinationEngine::recommend,
             py::arg("domains"), py::arg("item_count"))

        // State access
        .def("events",       &CoordinationEngine::events)
        .def("patterns", [](const CoordinationEngine& self) {
            std::vector<Pattern> out;
            for (auto& [key, pattern] : self.patterns()) {
                out.push_back(pattern);
            }
            return out;
        })
        .def("find_pattern", &CoordinationEngine::find_pattern, py::arg("key"))
        .def("insights",     &CoordinationEngine::insights)
        .def("snapshot",     &CoordinationEngine::snapshot)
        .def("publish_snapshot", &CoordinationEngine::publish_snapshot)
        .def("reload",       &CoordinationEngine::reload)

        // Configuration
        .def("set_monitor",             &CoordinationEngine::set_monitor, py::arg("monitor"))
        .def("config",                  &CoordinationEngine::config,
             py::return_value_policy::reference_internal)
        .def("last_persistence_status", &CoordinationEngine::last_persistence_status);
}
