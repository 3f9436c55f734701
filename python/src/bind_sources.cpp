#include "bind_forward.hpp"
#include <quotawatch/quotawatch.hpp>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

using namespace quotawatch;
using namespace quotawatch::sources;

// Trampoline class to allow Python subclassing of UsageSource. `since` is
// handed over as local-time seconds, the form Python sees for every stamp.
class PyUsageSource : public UsageSource {
public:
    using UsageSource::UsageSource;

    std::vector<UsageRecord> fetch_usage(Timestamp since) override {
        py::gil_scoped_acquire acquire;
        py::function override = py::get_override(static_cast<const UsageSource*>(this), "fetch_usage");
        if (!override) {
            py::pybind11_fail("UsageSource.fetch_usage is not implemented");
        }
        return override(since.time_since_epoch().count()).cast<std::vector<UsageRecord>>();
    }

    std::string name() const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(std::string, UsageSource, name, );
    }
};

void bind_sources(py::module_& m) {

    // --- RateTable ---
    py::class_<ModelRates>(m, "ModelRates")
        .def(py::init([](double input, double output, double cache_write, double cache_read) {
                 return ModelRates{input, output, cache_write, cache_read};
             }),
             py::arg("input"), py::arg("output"),
             py::arg("cache_write"), py::arg("cache_read"))
        .def_readwrite("input",       &ModelRates::input)
        .def_readwrite("output",      &ModelRates::output)
        .def_readwrite("cache_write", &ModelRates::cache_write)
        .def_readwrite("cache_read",  &ModelRates::cache_read);

    py::class_<RateTable>(m, "RateTable")
        .def(py::init<ModelRates>(), py::arg("default_rates"))
        .def_static("builtin", &RateTable::builtin)
        .def("set_rates", &RateTable::set_rates, py::arg("model"), py::arg("rates"))
        .def("rates_for", &RateTable::rates_for, py::arg("model"),
             py::return_value_policy::copy)
        .def("cost_of",   &RateTable::cost_of, py::arg("model"), py::arg("tokens"))
        .def("size",      &RateTable::size);

    // --- Abstract UsageSource with trampoline ---
    py::class_<UsageSource, PyUsageSource, std::shared_ptr<UsageSource>>(m, "UsageSource")
        .def(py::init<>())
        .def("fetch_usage",
             [](UsageSource& self, std::int64_t since) {
                 py::gil_scoped_release release;
                 return self.fetch_usage(Timestamp(Duration(since)));
             },
             py::arg("since"))
        .def("name", &UsageSource::name);

    // --- Concrete sources ---
    py::class_<CcusageReportSource, UsageSource, std::shared_ptr<CcusageReportSource>>(m, "CcusageReportSource")
        .def(py::init<std::filesystem::path>(), py::arg("report_path"))
        .def("path", &CcusageReportSource::path);

    py::class_<TranscriptSource, UsageSource, std::shared_ptr<TranscriptSource>>(m, "TranscriptSource")
        .def(py::init<std::filesystem::path, RateTable>(),
             py::arg("root"), py::arg("rates") = RateTable::builtin())
        .def("root", &TranscriptSource::root);

    py::class_<SqliteHistorySource, UsageSource, std::shared_ptr<SqliteHistorySource>>(m, "SqliteHistorySource")
        .def(py::init<std::filesystem::path>(), py::arg("db_path"))
        .def("record", &SqliteHistorySource::record,
             py::arg("snapshot"), py::arg("plan_daily_cost"), py::arg("weekly_spend_baseline"));

    py::class_<CompositeSource, UsageSource, std::shared_ptr<CompositeSource>>(m, "CompositeSource")
        .def(py::init<>())
        .def("add_source", &CompositeSource::add_source, py::arg("source"))
        .def("size", &CompositeSource::size);
}
