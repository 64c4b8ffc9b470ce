/**
 * @file processing_bindings.cpp
 * @brief Python bindings for the per-row stages and the scenario pipeline
 */

#include "effluent/processing/compliance_pipeline.hpp"
#include "effluent/processing/deviation.hpp"
#include "effluent/processing/failure_classifier.hpp"
#include "effluent/processing/linearisation.hpp"
#include "effluent/processing/psi_calculator.hpp"
#include "effluent/processing/threshold_calculator.hpp"
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace effluent;

void bind_processing(py::module &m) {
  // ===== Row-wise stages =====
  m.def("threshold_for", &threshold_for, py::arg("influent"), py::arg("limit"),
        "Threshold for one row (NaN influent gives NaN)");
  m.def("deviation", &deviation, py::arg("threshold"), py::arg("effluent"),
        "threshold - effluent");
  m.def("reduction", &reduction, py::arg("influent"), py::arg("effluent"),
        "(influent - effluent) / influent; 0.0 for zero influent");
  m.def(
      "linearise",
      [](const std::vector<double> &values) { return linearise(values); },
      py::arg("values"), "Min-max scale to [0, 1]; constant input gives 0.0");

  // ===== Table stages =====
  m.def("apply_thresholds", &apply_thresholds, py::arg("df"), py::arg("limits"),
        py::return_value_policy::move);
  m.def("apply_linearisation", &apply_linearisation, py::arg("df"),
        py::return_value_policy::move);
  m.def("apply_deviations", &apply_deviations, py::arg("df"),
        py::return_value_policy::move);
  m.def("apply_reductions", &apply_reductions, py::arg("df"),
        py::return_value_policy::move);
  m.def("apply_psi", &apply_psi, py::arg("df"), py::arg("limits"),
        py::return_value_policy::move);
  m.def("apply_classification", &apply_classification, py::arg("df"),
        py::arg("limits"), py::return_value_policy::move);

  // ===== PSI =====
  py::class_<PsiTerms>(m, "PsiTerms")
      .def(py::init([](double lt, double ut, double pc) {
             return PsiTerms{lt, ut, pc};
           }),
           py::arg("lt"), py::arg("ut"), py::arg("pc"))
      .def_readwrite("lt", &PsiTerms::lt)
      .def_readwrite("ut", &PsiTerms::ut)
      .def_readwrite("pc", &PsiTerms::pc);

  py::class_<PsiComponents>(m, "PsiComponents")
      .def(py::init([](double p1, double p2, double p3) {
             return PsiComponents{p1, p2, p3};
           }),
           py::arg("psi_1"), py::arg("psi_2"), py::arg("psi_3"))
      .def_readonly("psi_1", &PsiComponents::psi_1)
      .def_readonly("psi_2", &PsiComponents::psi_2)
      .def_readonly("psi_3", &PsiComponents::psi_3)
      .def("__repr__", [](const PsiComponents &p) {
        return "<PsiComponents psi_1=" + std::to_string(p.psi_1) +
               " psi_2=" + std::to_string(p.psi_2) +
               " psi_3=" + std::to_string(p.psi_3) + ">";
      });

  m.def("make_psi_terms", &make_psi_terms, py::arg("lt_deviation"),
        py::arg("ut_deviation"), py::arg("reduction"), py::arg("required_pc"));
  m.def("compute_psi", &compute_psi, py::arg("terms"));
  m.def("metric_lut", &metric_lut, py::arg("bod"), py::arg("cod"));
  m.def("metric_max", &metric_max, py::arg("bod"), py::arg("cod"));
  m.def("metric_default", &metric_default, py::arg("bod"), py::arg("cod"));

  // ===== Classification =====
  py::class_<PollutantFlags>(m, "PollutantFlags")
      .def(py::init([](bool lt, bool ut, bool red) {
             return PollutantFlags{lt, ut, red};
           }),
           py::arg("lt"), py::arg("ut"), py::arg("reduction"))
      .def_readonly("lt", &PollutantFlags::lt)
      .def_readonly("ut", &PollutantFlags::ut)
      .def_readonly("reduction", &PollutantFlags::reduction);

  py::class_<PollutantState>(m, "PollutantState")
      .def(py::init([](const PsiComponents &psi, const PollutantFlags &flags) {
             return PollutantState{psi, flags};
           }),
           py::arg("psi"), py::arg("flags"))
      .def_readonly("psi", &PollutantState::psi)
      .def_readonly("flags", &PollutantState::flags);

  py::class_<PollutantFailure>(m, "PollutantFailure")
      .def_readonly("lut_exceedance", &PollutantFailure::lut_exceedance)
      .def_readonly("max_limit", &PollutantFailure::max_limit);

  py::enum_<MetricSelection>(m, "MetricSelection")
      .value("LUT", MetricSelection::LUT)
      .value("MAX", MetricSelection::MAX)
      .value("DEFAULT", MetricSelection::DEFAULT);

  py::class_<RowClassification>(m, "RowClassification")
      .def_readonly("fail_type", &RowClassification::fail_type)
      .def_readonly("fail_source", &RowClassification::fail_source)
      .def_readonly("selection", &RowClassification::selection)
      .def_readonly("metric", &RowClassification::metric)
      .def_readonly("bod", &RowClassification::bod)
      .def_readonly("cod", &RowClassification::cod);

  m.def("compute_flags", &compute_flags, py::arg("lt_deviation"),
        py::arg("ut_deviation"), py::arg("reduction"), py::arg("required_pc"));
  m.def("classify_row", &classify_row, py::arg("bod"), py::arg("cod"));

  // ===== Pipeline =====
  m.def("process_dataframe", &process_dataframe, py::arg("df"),
        py::arg("limits") = ComplianceLimits{}, py::return_value_policy::move,
        "Validate and derive every per-row column");

  py::class_<ScenarioResult>(m, "ScenarioResult")
      .def_readonly("name", &ScenarioResult::name)
      .def_readonly("data", &ScenarioResult::data)
      .def_readonly("compliance", &ScenarioResult::compliance)
      .def_readonly("nonstationarity", &ScenarioResult::nonstationarity)
      .def_readonly("nonstationarity_columns",
                    &ScenarioResult::nonstationarity_columns)
      .def_readonly("recovery", &ScenarioResult::recovery)
      .def_readonly("statistics", &ScenarioResult::statistics)
      .def_readonly("exceedance", &ScenarioResult::exceedance)
      .def_readonly("quality", &ScenarioResult::quality);

  py::class_<ScenarioOutcome>(m, "ScenarioOutcome")
      .def_readonly("name", &ScenarioOutcome::name)
      .def_readonly("error", &ScenarioOutcome::error)
      .def("ok", &ScenarioOutcome::ok)
      .def_property_readonly(
          "result",
          [](const ScenarioOutcome &o) -> const ScenarioResult * {
            return o.result.get();
          },
          py::return_value_policy::reference_internal);

  m.def("process_scenario", &process_scenario, py::arg("name"), py::arg("df"),
        py::arg("config") = AnalysisConfig{}, py::return_value_policy::move);

  m.def(
      "analyze_scenarios",
      [](const std::vector<std::pair<std::string, const DataFrame *>> &scenarios,
         const AnalysisConfig &config) {
        std::vector<ScenarioInput> inputs;
        inputs.reserve(scenarios.size());
        for (const auto &[name, df] : scenarios) {
          if (!df) {
            throw std::invalid_argument("Scenario '" + name + "' has no DataFrame");
          }
          inputs.push_back({name, df->clone()});
        }

        std::vector<ScenarioOutcome> outcomes;
        {
          py::gil_scoped_release release;
          outcomes = analyze_scenarios(inputs, config);
        }

        py::list result;
        for (auto &outcome : outcomes) {
          result.append(py::cast(std::move(outcome)));
        }
        return result;
      },
      py::arg("scenarios"), py::arg("config") = AnalysisConfig{},
      "Analyse [(name, DataFrame), ...] in parallel; one outcome per scenario");
}
