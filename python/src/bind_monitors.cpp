#include "bind_forward.hpp"
#include <agentcoord/agentcoord.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace agentcoord;

namespace {

// Alert callbacks fire on whichever thread emitted the event
MetricsMonitor::AlertCallback wrap_alert(py::function cb) {
    return [cb = py::object(cb)](const std::string& msg) {
        py::gil_scoped_acquire acquire;
        cb(msg);
    };
}

} // anonymous namespace

// Trampoline class to allow Python subclassing of Monitor
class PyMonitor : public Monitor {
public:
    using Monitor::Monitor;

    void on_event(const MonitorEvent& event) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, Monitor, on_event, event);
    }

    void on_snapshot(const CoordinationSnapshot& snapshot) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, Monitor, on_snapshot, snapshot);
    }
};

void bind_monitors(py::module_& m) {
    // --- Abstract Monitor with trampoline ---
    py::class_<Monitor, PyMonitor, std::shared_ptr<Monitor>>(m, "Monitor")
        .def(py::init<>())
        .def("on_event", &Monitor::on_event)
        .def("on_snapshot", &Monitor::on_snapshot);

    // --- ConsoleMonitor ---
    py::class_<ConsoleMonitor, Monitor, std::shared_ptr<ConsoleMonitor>>(m, "ConsoleMonitor")
        .def(py::init<ConsoleMonitor::Verbosity>(),
             py::arg("verbosity") = ConsoleMonitor::Verbosity::Normal);

    // --- MetricsMonitor ---
    py::class_<MetricsMonitor, Monitor, std::shared_ptr<MetricsMonitor>>(m, "MetricsMonitor")
        .def(py::init<>())
        .def("get_metrics", &MetricsMonitor::get_metrics)
        .def("reset_metrics", &MetricsMonitor::reset_metrics)
        .def("set_pending_tasks_alert_threshold",
            [](MetricsMonitor& self, std::size_t threshold, py::function cb) {
                self.set_pending_tasks_alert_threshold(threshold, wrap_alert(std::move(cb)));
            },
            py::arg("threshold"), py::arg("callback"))
        .def("set_audit_drop_alert_threshold",
            [](MetricsMonitor& self, std::uint64_t threshold, py::function cb) {
                self.set_audit_drop_alert_threshold(threshold, wrap_alert(std::move(cb)));
            },
            py::arg("threshold"), py::arg("callback"));

    // --- CompositeMonitor ---
    py::class_<CompositeMonitor, Monitor, std::shared_ptr<CompositeMonitor>>(m, "CompositeMonitor")
        .def(py::init<>())
        .def("add_monitor", &CompositeMonitor::add_monitor);

    m.def("event_name", [](EventType t) { return std::string(to_string(t)); });
}
