#include "effluent/core/config.hpp"
#include "effluent/core/errors.hpp"
#include "effluent/core/types.hpp"
#include <cmath>
#include <string>

namespace effluent {

namespace {

void check_pollutant(const char* name, double lower, double upper, double pc) {
    if (!std::isfinite(lower) || !std::isfinite(upper) || lower <= 0.0) {
        throw ConfigError(std::string(name) + " limits must be finite and positive");
    }
    if (!(lower < upper)) {
        throw ConfigError(std::string(name) + " lower limit must be below upper limit");
    }
    if (!(pc > 0.0 && pc <= 1.0)) {
        throw ConfigError(std::string(name) + " reduction fraction must be in (0, 1]");
    }
}

} // namespace

void ComplianceLimits::validate() const {
    check_pollutant("BOD", bod_lower, bod_upper, bod_pc);
    check_pollutant("COD", cod_lower, cod_upper, cod_pc);
}

std::map<std::string, double> ComplianceLimits::to_map() const {
    return {
        {"bod_upper", bod_upper},
        {"bod_lower", bod_lower},
        {"cod_upper", cod_upper},
        {"cod_lower", cod_lower},
        {"bod_pc", bod_pc},
        {"cod_pc", cod_pc},
    };
}

void SimulationConfig::validate() const {
    if (!(time_step_days > 0.0) || !std::isfinite(time_step_days)) {
        throw ConfigError("Time step must be a positive number of days");
    }
    if (hours_per_day <= 0 || minutes_per_hour <= 0) {
        throw ConfigError("Time conversion factors must be positive");
    }
}

void AnalysisConfig::validate() const {
    limits.validate();
    simulation.validate();
    if (nonstationarity_window < 2) {
        throw ConfigError("Non-stationarity window must be at least 2");
    }
    if (recovery_histogram_bins == 0) {
        throw ConfigError("Recovery histogram needs at least one bin");
    }
}

const std::vector<ScenarioSpec>& default_scenarios() {
    static const std::vector<ScenarioSpec> scenarios = {
        {"baseline", "baseline", "Baseline"},
        {"130%", "1.3", "Shift 130%"},
        {"150%", "1.5", "Shift 150%"},
        {"190%", "1.9", "Shift 190%"},
    };
    return scenarios;
}

const ScenarioSpec* find_scenario(const std::string& key) {
    for (const auto& spec : default_scenarios()) {
        if (spec.key == key) {
            return &spec;
        }
    }
    return nullptr;
}

std::vector<std::string> default_statistics_columns() {
    return {columns::BOD_INFLUENT, columns::BOD_EFFLUENT,
            columns::COD_INFLUENT, columns::COD_EFFLUENT};
}

std::map<std::string, double> default_exceedance_thresholds() {
    return {
        {columns::BOD_INFLUENT, 300.0},
        {columns::BOD_EFFLUENT, 50.0},
        {columns::COD_INFLUENT, 500.0},
        {columns::COD_EFFLUENT, 250.0},
    };
}

std::vector<std::string> default_nonstationarity_columns() {
    return {columns::LINEARISED.begin(), columns::LINEARISED.end()};
}

} // namespace effluent
