#pragma once

/**
 * @file config.hpp
 * @brief Configuration values passed explicitly into every entry point
 *
 * None of these structs are held globally. Callers build one, validate it
 * and pass it by const reference; the engine never mutates it.
 */

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace effluent {

/// Regulatory limits in mg/L plus required reduction fractions
struct ComplianceLimits {
    double bod_upper = 50.0;    ///< BOD maximum limit (mg/L)
    double bod_lower = 25.0;    ///< BOD limit (mg/L)
    double cod_upper = 250.0;   ///< COD maximum limit (mg/L)
    double cod_lower = 125.0;   ///< COD limit (mg/L)
    double bod_pc = 0.7;        ///< Required BOD reduction fraction
    double cod_pc = 0.75;       ///< Required COD reduction fraction

    /// @throws ConfigError unless 0 < lower < upper and 0 < pc <= 1 for both pollutants
    void validate() const;

    /// Flat name -> value view (CLI and Python repr)
    std::map<std::string, double> to_map() const;
};

/// Simulation sampling parameters
struct SimulationConfig {
    double time_step_days = 0.08;   ///< Uniform time step between rows (days)
    int hours_per_day = 24;
    int minutes_per_hour = 60;

    /// Minutes in one day (time_step conversion factor)
    double minutes_per_day() const {
        return static_cast<double>(hours_per_day) * minutes_per_hour;
    }

    /// @throws ConfigError when the time step is not strictly positive
    void validate() const;
};

/// What to do with a non-compliant run still open at the end of the series
enum class OpenRunPolicy {
    DROP,              ///< Only closed runs produce recovery samples
    COUNT_AS_ONGOING   ///< The open run is emitted with its observed length
};

/// Full analysis configuration for one or more scenarios
struct AnalysisConfig {
    ComplianceLimits limits;
    SimulationConfig simulation;

    size_t nonstationarity_window = 30;
    std::vector<std::string> nonstationarity_columns;   ///< Empty = linearised columns

    OpenRunPolicy open_run_policy = OpenRunPolicy::DROP;
    size_t recovery_histogram_bins = 10;

    std::vector<std::string> statistics_columns;        ///< Empty = bod1, bod31, cod1, cod31
    std::map<std::string, double> exceedance_thresholds; ///< Empty = default_exceedance_thresholds()

    /// Validates limits and simulation config
    void validate() const;
};

/// Scenario registry entry
struct ScenarioSpec {
    std::string key;      ///< Identifier ("baseline", "130%", ...)
    std::string folder;   ///< Data folder name ("baseline", "1.3", ...)
    std::string label;    ///< Display label ("Baseline", "Shift 130%", ...)
};

/// Baseline and influent-shift scenarios (130%, 150%, 190%)
const std::vector<ScenarioSpec>& default_scenarios();

/// Look up a scenario by key; returns nullptr if unknown
const ScenarioSpec* find_scenario(const std::string& key);

/// Default columns for summary statistics
std::vector<std::string> default_statistics_columns();

/// Default exceedance thresholds (bod1 > 300, bod31 > 50, cod1 > 500, cod31 > 250)
std::map<std::string, double> default_exceedance_thresholds();

/// Default non-stationarity columns (the linearised columns)
std::vector<std::string> default_nonstationarity_columns();

} // namespace effluent
