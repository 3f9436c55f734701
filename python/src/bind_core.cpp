#include "bind_forward.hpp"
#include <quotawatch/quotawatch.hpp>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace quotawatch;

namespace {

// pybind11 holders cannot be const; snapshots stay read-only on the Python
// side because every field is bound readonly.
std::shared_ptr<KpiSnapshot> to_python(SnapshotPtr snapshot) {
    return std::const_pointer_cast<KpiSnapshot>(std::move(snapshot));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Wrapper for std::future<SnapshotPtr>
// ---------------------------------------------------------------------------
struct FutureSnapshot {
    std::future<SnapshotPtr> fut;

    std::shared_ptr<KpiSnapshot> result() {
        SnapshotPtr snap;
        {
            py::gil_scoped_release release;
            snap = fut.get();
        }
        return to_python(std::move(snap));
    }

    bool ready() const {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
};

// ---------------------------------------------------------------------------
// bind_core  --  Engine, FutureSnapshot, reports
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // FutureSnapshot
    // ===================================================================
    py::class_<FutureSnapshot>(m, "FutureSnapshot")
        .def("result", &FutureSnapshot::result,
             "Block until the snapshot is published (releases the GIL while waiting).")
        .def("ready",  &FutureSnapshot::ready,
             "Return True if the snapshot is available without blocking.");

    // ===================================================================
    // Engine
    // ===================================================================
    py::class_<Engine>(m, "Engine")
        .def(py::init<std::shared_ptr<UsageSource>, std::shared_ptr<CalibrationStore>, Config>(),
             py::arg("source"), py::arg("store") = nullptr, py::arg("config") = Config{})

        // ------------- Dual Cadence -------------
        .def("peek", [](const Engine& self) { return to_python(self.peek()); })
        .def("refresh",
             [](Engine& self) {
                 SnapshotPtr snap;
                 {
                     py::gil_scoped_release release;
                     snap = self.refresh();
                 }
                 return to_python(std::move(snap));
             })
        .def("refresh_async",
             [](Engine& self) { return FutureSnapshot{self.refresh_async()}; })

        // ------------- Calibration -------------
        .def("calibrate", &Engine::calibrate, py::arg("calibration"),
             py::call_guard<py::gil_scoped_release>())
        .def("calibrate_from_usage", &Engine::calibrate_from_usage,
             py::arg("cap_name"), py::arg("observed_percent"),
             py::call_guard<py::gil_scoped_release>())
        .def("calibration", &Engine::calibration,
             py::call_guard<py::gil_scoped_release>())

        // ------------- Configuration / Lifecycle -------------
        .def("set_monitor", &Engine::set_monitor, py::arg("monitor"))
        .def("config", &Engine::config, py::return_value_policy::copy)
        .def("start",      &Engine::start)
        .def("stop",       &Engine::stop, py::call_guard<py::gil_scoped_release>())
        .def("is_running", &Engine::is_running);

    // ===================================================================
    // Reports
    // ===================================================================
    m.def("render_report", &render_report, py::arg("snapshot"));
    m.def("parse_report_fields", &parse_report_fields, py::arg("report"));
    m.def("to_json", &to_json, py::arg("snapshot"), py::arg("indent") = 2);
    m.def("write_report", &write_report, py::arg("directory"), py::arg("snapshot"));
}
