#include "bind_forward.hpp"
#include <quotawatch/quotawatch.hpp>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

using namespace quotawatch;

// Trampoline class to allow Python-side calibration stores
class PyCalibrationStore : public CalibrationStore {
public:
    using CalibrationStore::CalibrationStore;

    std::optional<Calibration> load() override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(std::optional<Calibration>, CalibrationStore, load, );
    }

    void save(const Calibration& calibration) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, CalibrationStore, save, calibration);
    }
};

void bind_calibration(py::module_& m) {

    // ===================================================================
    // Calibration record
    // ===================================================================
    py::class_<Cap>(m, "Cap")
        .def(py::init<>())
        .def(py::init([](std::string name, double weekly_limit, std::string model_prefix,
                         std::optional<int> reset_hour) {
                 return Cap{std::move(name), weekly_limit, std::move(model_prefix), reset_hour};
             }),
             py::arg("name"), py::arg("weekly_limit"),
             py::arg("model_prefix") = "", py::arg("reset_hour") = std::nullopt)
        .def_readwrite("name",         &Cap::name)
        .def_readwrite("weekly_limit", &Cap::weekly_limit)
        .def_readwrite("model_prefix", &Cap::model_prefix)
        .def_readwrite("reset_hour",   &Cap::reset_hour)
        .def("applies_to", &Cap::applies_to, py::arg("model"))
        .def("__repr__", [](const Cap& c) {
            return "<Cap name='" + c.name + "' limit=" + std::to_string(c.weekly_limit) + ">";
        });

    py::class_<Baseline>(m, "Baseline")
        .def(py::init<>())
        .def_readwrite("target_ratio",          &Baseline::target_ratio)
        .def_readwrite("floor_ratio",           &Baseline::floor_ratio)
        .def_readwrite("plan_monthly_cost",     &Baseline::plan_monthly_cost)
        .def_readwrite("weekly_spend_baseline", &Baseline::weekly_spend_baseline)
        .def_readwrite("daily_spend_baseline",  &Baseline::daily_spend_baseline)
        .def("plan_daily_cost", &Baseline::plan_daily_cost)
        .def("daily_spend",     &Baseline::daily_spend);

    py::class_<BillingAnchor>(m, "BillingAnchor")
        .def(py::init<>())
        .def_readwrite("date",       &BillingAnchor::date)
        .def_readwrite("reset_hour", &BillingAnchor::reset_hour)
        .def("day_of_week", &BillingAnchor::day_of_week);

    py::class_<Calibration>(m, "Calibration")
        .def(py::init<>())
        .def_readwrite("caps",          &Calibration::caps)
        .def_readwrite("baseline",      &Calibration::baseline)
        .def_readwrite("anchor",        &Calibration::anchor)
        .def_readwrite("calibrated_on", &Calibration::calibrated_on)
        .def_readwrite("note",          &Calibration::note)
        .def("find_cap", &Calibration::find_cap, py::arg("name"))
        .def_static("defaults", &Calibration::defaults);

    m.def("validate", &validate, py::arg("calibration"),
          "Raise InvalidCalibrationError describing the first violation.");

    // ===================================================================
    // Stores
    // ===================================================================
    py::class_<CalibrationStore, PyCalibrationStore, std::shared_ptr<CalibrationStore>>(m, "CalibrationStore")
        .def(py::init<>())
        .def("load", &CalibrationStore::load)
        .def("save", &CalibrationStore::save, py::arg("calibration"));

    py::class_<MemoryCalibrationStore, CalibrationStore,
               std::shared_ptr<MemoryCalibrationStore>>(m, "MemoryCalibrationStore")
        .def(py::init<>())
        .def(py::init<Calibration>(), py::arg("initial"))
        .def("save_count", &MemoryCalibrationStore::save_count);

    py::class_<JsonCalibrationStore, CalibrationStore,
               std::shared_ptr<JsonCalibrationStore>>(m, "JsonCalibrationStore")
        .def(py::init<std::filesystem::path>(), py::arg("path"))
        .def("path", &JsonCalibrationStore::path)
        .def_static("serialize",   &JsonCalibrationStore::serialize, py::arg("calibration"))
        .def_static("deserialize", &JsonCalibrationStore::deserialize, py::arg("text"));
}
