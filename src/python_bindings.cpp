#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "Errors.hpp"
#include "metrics/Metric.hpp"
#include "sample/GroupedSample.h"
#include "summary/GroupSummary.hpp"
#include "wage/MincerWage.hpp"

namespace py = pybind11;
using namespace Equity;

// ============================================================================
// Helpers
// ============================================================================

template <typename M>
void bind_metric(py::module_& m, const char* py_name) {
    py::class_<M, MetricBase>(m, py_name)
        .def(py::init<GroupedSample, MetricBase::Options>(),
             py::arg("sample"), py::arg("options") = MetricBase::Options())
        .def_static("from_table", &metric_from_table<M>,
                    py::arg("table"), py::arg("group_columns"), py::arg("value_column"),
                    py::arg("sample_size") = py::none(), py::arg("seed") = py::none(),
                    py::arg("sample_options") = GroupedSample::Options(),
                    py::arg("options") = MetricBase::Options());
}

// ============================================================================
// Module
// ============================================================================

PYBIND11_MODULE(equity_core, m) {
    m.doc() = "Group-decomposable inequality metrics";

    // 1. Errors
    auto base_err = py::register_exception<EquityError>(m, "EquityError", PyExc_RuntimeError);
    py::register_exception<ConstructionError>(m, "ConstructionError", base_err.ptr());
    py::register_exception<ConfigurationError>(m, "ConfigurationError", base_err.ptr());
    py::register_exception<DomainError>(m, "DomainError", PyExc_ValueError);

    // 2. Data
    py::class_<Table>(m, "Table")
        .def(py::init<>())
        .def("add_key_column", &Table::add_key_column)
        .def("add_value_column", &Table::add_value_column)
        .def_property_readonly("rows", &Table::rows)
        .def("group_by", [](const Table& t, const std::vector<std::string>& keys, const std::string& value) {
            return t.group_by(keys, value);
        });

    py::class_<GroupedSample::Options>(m, "SampleOptions")
        .def(py::init<>())
        .def_readwrite("min_group_size", &GroupedSample::Options::min_group_size)
        .def_readwrite("verbose", &GroupedSample::Options::verbose);

    py::class_<GroupedSample>(m, "GroupedSample")
        .def(py::init<std::vector<std::string>, std::vector<Eigen::ArrayXd>, GroupedSample::Options>(),
             py::arg("groups"), py::arg("grouped_values"), py::arg("options") = GroupedSample::Options())
        .def_static("from_table", &GroupedSample::from_table,
                    py::arg("table"), py::arg("group_columns"), py::arg("value_column"),
                    py::arg("sample_size") = py::none(), py::arg("seed") = py::none(),
                    py::arg("options") = GroupedSample::Options())
        .def_property_readonly("groups", &GroupedSample::groups)
        .def_property_readonly("grouped_values", &GroupedSample::grouped_values)
        .def_property_readonly("flat", &GroupedSample::flat)
        .def_property_readonly("n", &GroupedSample::n)
        .def_property_readonly("group_count", &GroupedSample::group_count)
        .def_property_readonly("nan_count", &GroupedSample::nan_count)
        .def_property_readonly("diagnostics", &GroupedSample::diagnostics);

    // 3. Metrics
    py::class_<DecompositionResult>(m, "DecompositionResult")
        .def_readonly("index", &DecompositionResult::index)
        .def_readonly("within", &DecompositionResult::within)
        .def_readonly("between", &DecompositionResult::between)
        .def_readonly("overall", &DecompositionResult::overall)
        .def_readonly("ratio", &DecompositionResult::ratio)
        .def_readonly("residual", &DecompositionResult::residual)
        .def_readonly("notes", &DecompositionResult::notes);

    py::class_<MetricBase::Options>(m, "MetricOptions")
        .def(py::init<>())
        .def_readwrite("residual_tolerance", &MetricBase::Options::residual_tolerance)
        .def_readwrite("verbose", &MetricBase::Options::verbose);

    py::class_<MetricBase>(m, "MetricBase")
        .def("calculate", &MetricBase::calculate, py::return_value_policy::copy)
        .def_property_readonly("within", &MetricBase::within)
        .def_property_readonly("between", &MetricBase::between)
        .def_property_readonly("overall", &MetricBase::overall)
        .def_property_readonly("ratio", &MetricBase::ratio)
        .def_property_readonly("residual", &MetricBase::residual)
        .def_property_readonly("sample", &MetricBase::sample, py::return_value_policy::reference_internal);

    bind_metric<ThielT>(m, "ThielT");
    bind_metric<ThielL>(m, "ThielL");
    bind_metric<VarianceDecomposition>(m, "VarianceDecomposition");
    bind_metric<GiniDecomposition>(m, "GiniDecomposition");

    // 4. Single-array formulas
    m.def("theil_t_index", &theil_t_index);
    m.def("theil_l_index", &theil_l_index);
    m.def("population_variance", &population_variance);
    m.def("gini_index", &gini_index);

    // 5. Summaries and wages
    py::class_<GroupSummary>(m, "GroupSummary")
        .def_readonly("group", &GroupSummary::group)
        .def_readonly("n", &GroupSummary::n)
        .def_readonly("mean", &GroupSummary::mean)
        .def_readonly("median", &GroupSummary::median)
        .def_readonly("sd", &GroupSummary::sd)
        .def_readonly("min", &GroupSummary::min)
        .def_readonly("max", &GroupSummary::max)
        .def_readonly("suppressed", &GroupSummary::suppressed);
    m.def("summarize_groups", py::overload_cast<const GroupedSample&>(&summarize_groups));

    py::class_<MincerCoefficients>(m, "MincerCoefficients")
        .def(py::init<>())
        .def_readwrite("schooling_x_experience", &MincerCoefficients::schooling_x_experience)
        .def_readwrite("experience", &MincerCoefficients::experience)
        .def_readwrite("experience_squared", &MincerCoefficients::experience_squared);

    py::class_<MincerWagePredictor>(m, "MincerWagePredictor")
        .def(py::init<MincerCoefficients>())
        .def("counterfactual_wage", &MincerWagePredictor::counterfactual_wage)
        .def("counterfactual_wages", &MincerWagePredictor::counterfactual_wages)
        .def("premiums", &MincerWagePredictor::premiums);
    m.def("years_of_schooling", &years_of_schooling);
}
