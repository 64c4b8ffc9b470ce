#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace effluent {

/// Input table violates the engine's contract (missing or non-numeric column)
class DataValidationError : public std::runtime_error {
public:
    explicit DataValidationError(const std::string& message)
        : std::runtime_error(message)
    {}

    DataValidationError(const std::string& message, std::vector<std::string> columns)
        : std::runtime_error(message)
        , columns_(std::move(columns))
    {}

    /// Offending column names (may be empty)
    const std::vector<std::string>& columns() const { return columns_; }

private:
    std::vector<std::string> columns_;
};

/// Invalid configuration value (limits, time step)
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message)
    {}
};

/// Failure while processing one scenario; carries the scenario name
class ScenarioError : public std::runtime_error {
public:
    ScenarioError(std::string scenario, const std::string& message)
        : std::runtime_error("Scenario '" + scenario + "': " + message)
        , scenario_(std::move(scenario))
    {}

    const std::string& scenario() const { return scenario_; }

private:
    std::string scenario_;
};

} // namespace effluent
