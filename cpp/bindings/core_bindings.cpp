/**
 * @file core_bindings.cpp
 * @brief Python bindings for configuration, labels, logging and exceptions
 *
 * Exposes:
 * - ComplianceLimits, SimulationConfig, AnalysisConfig, ScenarioSpec
 * - FailType / FailSource / OpenRunPolicy / LogLevel enums
 * - DataValidationError, ConfigError, ScenarioError
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "effluent/core/config.hpp"
#include "effluent/core/errors.hpp"
#include "effluent/core/logging.hpp"
#include "effluent/core/types.hpp"

namespace py = pybind11;

namespace effluent {

/**
 * @brief Initialize core bindings
 */
void init_core_bindings(py::module& m) {
    // ========================================================================
    // Exceptions
    // ========================================================================
    py::register_exception<DataValidationError>(m, "DataValidationError", PyExc_ValueError);
    py::register_exception<ConfigError>(m, "ConfigError", PyExc_ValueError);
    py::register_exception<ScenarioError>(m, "ScenarioError", PyExc_RuntimeError);

    // ========================================================================
    // Enums
    // ========================================================================
    py::enum_<FailType>(m, "FailType", "Per-row failure type")
        .value("COMPLIANT", FailType::COMPLIANT)
        .value("LUT_EXCEEDANCE", FailType::LUT_EXCEEDANCE)
        .value("MAX_LIMIT_FAILURE", FailType::MAX_LIMIT_FAILURE)
        .export_values();

    py::enum_<FailSource>(m, "FailSource", "Pollutant behind a failure")
        .value("NONE", FailSource::NONE)
        .value("BOD", FailSource::BOD)
        .value("COD", FailSource::COD)
        .value("BOTH", FailSource::BOTH);

    py::enum_<OpenRunPolicy>(m, "OpenRunPolicy",
        "Handling of a non-compliant run open at the end of the series")
        .value("DROP", OpenRunPolicy::DROP)
        .value("COUNT_AS_ONGOING", OpenRunPolicy::COUNT_AS_ONGOING);

    py::enum_<LogLevel>(m, "LogLevel")
        .value("DEBUG", LogLevel::DEBUG)
        .value("INFO", LogLevel::INFO)
        .value("WARN", LogLevel::WARN)
        .value("ERROR", LogLevel::ERROR);

    m.def("fail_type_to_string", &fail_type_to_string, py::arg("type"),
        "Display label of a fail type");
    m.def("fail_type_from_string",
        [](const std::string& label) { return fail_type_from_string(label); },
        py::arg("label"), "Parse a fail type label");
    m.def("fail_source_to_string", &fail_source_to_string, py::arg("source"));

    // ========================================================================
    // Logging
    // ========================================================================
    m.def("set_log_level", &set_log_level, py::arg("level"));
    m.def("get_log_level", &get_log_level);
    m.def("parse_log_level", &parse_log_level, py::arg("name"));

    // ========================================================================
    // Configuration
    // ========================================================================
    py::class_<ComplianceLimits>(m, "ComplianceLimits",
        "Regulatory limits (mg/L) and required reduction fractions")
        .def(py::init<>())
        .def_readwrite("bod_upper", &ComplianceLimits::bod_upper)
        .def_readwrite("bod_lower", &ComplianceLimits::bod_lower)
        .def_readwrite("cod_upper", &ComplianceLimits::cod_upper)
        .def_readwrite("cod_lower", &ComplianceLimits::cod_lower)
        .def_readwrite("bod_pc", &ComplianceLimits::bod_pc)
        .def_readwrite("cod_pc", &ComplianceLimits::cod_pc)
        .def("validate", &ComplianceLimits::validate)
        .def("to_dict", &ComplianceLimits::to_map)
        .def("__repr__", [](const ComplianceLimits& l) {
            return "<ComplianceLimits BOD " + std::to_string(l.bod_lower) + "/" +
                   std::to_string(l.bod_upper) + " COD " + std::to_string(l.cod_lower) +
                   "/" + std::to_string(l.cod_upper) + ">";
        });

    py::class_<SimulationConfig>(m, "SimulationConfig")
        .def(py::init<>())
        .def_readwrite("time_step_days", &SimulationConfig::time_step_days)
        .def_readwrite("hours_per_day", &SimulationConfig::hours_per_day)
        .def_readwrite("minutes_per_hour", &SimulationConfig::minutes_per_hour)
        .def("minutes_per_day", &SimulationConfig::minutes_per_day)
        .def("validate", &SimulationConfig::validate);

    py::class_<AnalysisConfig>(m, "AnalysisConfig")
        .def(py::init<>())
        .def_readwrite("limits", &AnalysisConfig::limits)
        .def_readwrite("simulation", &AnalysisConfig::simulation)
        .def_readwrite("nonstationarity_window", &AnalysisConfig::nonstationarity_window)
        .def_readwrite("nonstationarity_columns", &AnalysisConfig::nonstationarity_columns)
        .def_readwrite("open_run_policy", &AnalysisConfig::open_run_policy)
        .def_readwrite("recovery_histogram_bins", &AnalysisConfig::recovery_histogram_bins)
        .def_readwrite("statistics_columns", &AnalysisConfig::statistics_columns)
        .def_readwrite("exceedance_thresholds", &AnalysisConfig::exceedance_thresholds)
        .def("validate", &AnalysisConfig::validate);

    py::class_<ScenarioSpec>(m, "ScenarioSpec")
        .def_readonly("key", &ScenarioSpec::key)
        .def_readonly("folder", &ScenarioSpec::folder)
        .def_readonly("label", &ScenarioSpec::label)
        .def("__repr__", [](const ScenarioSpec& s) {
            return "<ScenarioSpec " + s.key + " folder='" + s.folder + "'>";
        });

    m.def("default_scenarios", &default_scenarios, py::return_value_policy::copy);
    m.def("default_statistics_columns", &default_statistics_columns);
    m.def("default_exceedance_thresholds", &default_exceedance_thresholds);
    m.def("default_nonstationarity_columns", &default_nonstationarity_columns);
}

} // namespace effluent
