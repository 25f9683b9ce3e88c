#include "bind_forward.hpp"
#include <coordguard/coordguard.hpp>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

using namespace coordguard;

// Trampoline class to allow Python subclassing of Monitor
class PyMonitor : public Monitor {
public:
    using Monitor::Monitor;

    void on_event(const MonitorEvent& event) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, Monitor, on_event, event);
    }

    void on_snapshot(const EngineSnapshot& snapshot) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, Monitor, on_snapshot, snapshot);
    }
};

namespace {

MetricsMonitor::AlertCallback wrap_alert(py::function cb) {
    return [cb = py::object(cb)](const std::string& msg) {
        py::gil_scoped_acquire acquire;
        cb(msg);
    };
}

} // anonymous namespace

void bind_monitors(py::module_& m) {
    // --- Abstract Monitor with trampoline ---
    py::class_<Monitor, PyMonitor, std::shared_ptr<Monitor>>(m, "Monitor")
        .def(py::init<>())
        .def("on_event", &Monitor::on_event)
        .def("on_snapshot", &Monitor::on_snapshot);

    // --- LogMonitor ---
    py::class_<LogMonitor, Monitor, std::shared_ptr<LogMonitor>>(m, "LogMonitor")
        .def(py::init<LogMonitor::Verbosity>(),
             py::arg("verbosity") = LogMonitor::Verbosity::Normal);

    // LogMonitor::Verbosity is bound in bindings.cpp as "Verbosity"

    // --- MetricsMonitor ---
    py::class_<MetricsMonitor, Monitor, std::shared_ptr<MetricsMonitor>>(m, "MetricsMonitor")
        .def(py::init<>())
        .def("get_metrics", &MetricsMonitor::get_metrics)
        .def("reset_metrics", &MetricsMonitor::reset_metrics)
        .def("set_persistence_failure_alert",
            [](MetricsMonitor& self, py::function cb) {
                self.set_persistence_failure_alert(wrap_alert(std::move(cb)));
            },
            py::arg("callback"))
        .def("set_usage_alert_threshold",
            [](MetricsMonitor& self, double threshold, py::function cb) {
                self.set_usage_alert_threshold(threshold, wrap_alert(std::move(cb)));
            },
            py::arg("threshold"), py::arg("callback"));

    // --- CompositeMonitor ---
    py::class_<CompositeMonitor, Monitor, std::shared_ptr<CompositeMonitor>>(m, "CompositeMonitor")
        .def(py::init<>())
        .def("add_monitor", &CompositeMonitor::add_monitor);

    // --- Logging control ---
    m.def("set_log_level", &log::set_level, py::arg("level"));
}
