/**
 * @file psi_report.cpp
 * @brief Compliance report for one or more scenario CSV files
 *
 * Usage:
 *   psi_report --scenario baseline=baseline.csv --scenario 130%=shift_130.csv
 *              [--time-step 0.08] [--window 30] [--count-open-runs]
 *              [--bins 10] [--log-level info]
 */

#include "effluent/core/config.hpp"
#include "effluent/core/errors.hpp"
#include "effluent/core/logging.hpp"
#include "effluent/core/version.hpp"
#include "effluent/data/csv_loader.hpp"
#include "effluent/processing/compliance_pipeline.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace effluent;

// Exit codes
enum ExitCode {
    SUCCESS = 0,
    INVALID_ARGS = 1,
    VALIDATION_FAILED = 2,
    SCENARIO_FAILED = 3,
    IO_ERROR = 4
};

namespace {

struct Options {
    std::vector<std::pair<std::string, std::string>> scenarios;   // name, path
    AnalysisConfig config;
    bool help = false;
};

void print_help() {
    std::cout << R"(
psi_report - effluent compliance and PSI metrics

Usage:
  psi_report --scenario NAME=FILE.csv [--scenario NAME=FILE.csv ...] [options]

Options:
  --scenario NAME=FILE   Scenario table (repeatable). NAME may be a registered
                         key (baseline, 130%, 150%, 190%) or any label.
  --time-step DAYS       Time step between rows (default 0.08)
  --window N             Non-stationarity rolling window (default 30)
  --count-open-runs      Count a non-compliant run still open at the end
  --bins N               Recovery histogram bins (default 10)
  --log-level LEVEL      debug | info | warn | error (default info)
  --help                 Show this help message

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Invalid configuration
  3 - At least one scenario failed
  4 - I/O error
)";
}

std::string format_optional(const std::optional<double>& value, int precision = 4) {
    if (!value) {
        return "undefined";
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << *value;
    return out.str();
}

std::string format_double(double value, int precision = 4) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}

size_t parse_size(const std::string& flag, const std::string& text) {
    size_t used = 0;
    const long long value = std::stoll(text, &used);
    if (used != text.size() || value < 0) {
        throw std::invalid_argument(flag + " expects a non-negative integer, got '" + text + "'");
    }
    return static_cast<size_t>(value);
}

double parse_double(const std::string& flag, const std::string& text) {
    size_t used = 0;
    const double value = std::stod(text, &used);
    if (used != text.size()) {
        throw std::invalid_argument(flag + " expects a number, got '" + text + "'");
    }
    return value;
}

Options parse_args(int argc, char** argv) {
    Options opts;

    auto next_value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument(flag + " requires a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--scenario") {
            const std::string value = next_value(i, arg);
            const auto eq = value.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == value.size()) {
                throw std::invalid_argument("--scenario expects NAME=FILE, got '" + value + "'");
            }
            opts.scenarios.emplace_back(value.substr(0, eq), value.substr(eq + 1));
        } else if (arg == "--time-step") {
            opts.config.simulation.time_step_days = parse_double(arg, next_value(i, arg));
        } else if (arg == "--window") {
            opts.config.nonstationarity_window = parse_size(arg, next_value(i, arg));
        } else if (arg == "--count-open-runs") {
            opts.config.open_run_policy = OpenRunPolicy::COUNT_AS_ONGOING;
        } else if (arg == "--bins") {
            opts.config.recovery_histogram_bins = parse_size(arg, next_value(i, arg));
        } else if (arg == "--log-level") {
            set_log_level(parse_log_level(next_value(i, arg)));
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    return opts;
}

std::string display_name(const std::string& name) {
    const ScenarioSpec* spec = find_scenario(name);
    return spec ? spec->label : name;
}

// ===== Report tables =====

void print_compliance(const std::vector<ScenarioOutcome>& outcomes) {
    std::cout << "\n=== Compliance ===\n";
    std::cout << std::left << std::setw(16) << "scenario"
              << std::right << std::setw(8) << "rows"
              << std::setw(11) << "compliant"
              << std::setw(8) << "lut"
              << std::setw(8) << "max"
              << std::setw(8) << "BOD"
              << std::setw(8) << "COD"
              << std::setw(9) << "BOD+COD"
              << std::setw(8) << "pass"
              << std::setw(10) << "c_BOD_2"
              << std::setw(10) << "c_BOD_3"
              << std::setw(12) << "pass rate" << "\n";

    for (const auto& outcome : outcomes) {
        if (!outcome.ok()) {
            continue;
        }
        const ComplianceSummary& c = outcome.result->compliance;
        std::cout << std::left << std::setw(16) << display_name(outcome.name)
                  << std::right << std::setw(8) << c.total_rows
                  << std::setw(11) << c.compliant
                  << std::setw(8) << c.lut_exceedance
                  << std::setw(8) << c.max_limit_failure
                  << std::setw(8) << c.source_bod
                  << std::setw(8) << c.source_cod
                  << std::setw(9) << c.source_both
                  << std::setw(8) << c.pass_source
                  << std::setw(10) << c.c_bod_2
                  << std::setw(10) << c.c_bod_3
                  << std::setw(12) << format_optional(c.compliant_fraction) << "\n";
    }
}

void print_nonstationarity(const NonStationarityTable& table) {
    std::cout << "\n=== Non-stationarity ===\n";
    std::cout << std::left << std::setw(16) << "scenario" << std::right;
    for (const auto& column : table.columns) {
        std::cout << std::setw(14) << column;
    }
    std::cout << "\n";

    for (const auto& row : table.rows) {
        std::cout << std::left << std::setw(16) << display_name(row.scenario) << std::right;
        for (const auto& score : row.scores) {
            std::cout << std::setw(14) << format_optional(score);
        }
        std::cout << "\n";
    }
}

void print_recovery(const std::vector<ScenarioOutcome>& outcomes) {
    std::cout << "\n=== Recovery time (minutes) ===\n";
    std::cout << std::left << std::setw(16) << "scenario"
              << std::right << std::setw(8) << "count"
              << std::setw(14) << "mean"
              << std::setw(14) << "std"
              << std::setw(14) << "min"
              << std::setw(14) << "max" << "\n";

    for (const auto& outcome : outcomes) {
        if (!outcome.ok()) {
            continue;
        }
        const RecoverySummary& r = outcome.result->recovery;
        std::cout << std::left << std::setw(16) << display_name(outcome.name)
                  << std::right << std::setw(8) << r.count
                  << std::setw(14) << format_optional(r.mean_minutes, 2)
                  << std::setw(14) << format_optional(r.std_minutes, 2)
                  << std::setw(14) << format_optional(r.min_minutes, 2)
                  << std::setw(14) << format_optional(r.max_minutes, 2) << "\n";

        if (r.count > 0) {
            std::cout << "  histogram from " << format_double(r.histogram.min, 2)
                      << " step " << format_double(r.histogram.bin_width, 2) << ":";
            for (size_t n : r.histogram.counts) {
                std::cout << " " << n;
            }
            std::cout << "\n";
        }
    }
}

void print_statistics(const std::vector<ScenarioOutcome>& outcomes) {
    std::cout << "\n=== Column statistics ===\n";
    for (const auto& outcome : outcomes) {
        if (!outcome.ok()) {
            continue;
        }
        std::cout << display_name(outcome.name) << "\n";
        for (const auto& named : outcome.result->statistics) {
            const ColumnStatistics& s = named.stats;
            std::cout << "  " << std::left << std::setw(8) << named.column << std::right
                      << " mean " << format_double(s.mean, 3)
                      << " std " << format_double(s.std_dev, 3)
                      << " min " << format_double(s.min, 3)
                      << " max " << format_double(s.max, 3)
                      << " median " << format_double(s.median, 3)
                      << " cv " << format_optional(named.cv, 3) << "\n";
        }
        for (const auto& [column, probability] : outcome.result->exceedance) {
            std::cout << "  P(" << column << " > threshold) = "
                      << format_double(probability, 4) << "\n";
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_help();
        return ExitCode::INVALID_ARGS;
    }

    if (opts.help) {
        print_help();
        return ExitCode::SUCCESS;
    }
    if (opts.scenarios.empty()) {
        std::cerr << "Error: at least one --scenario is required\n";
        print_help();
        return ExitCode::INVALID_ARGS;
    }

    try {
        opts.config.validate();
    } catch (const ConfigError& e) {
        log_error(std::string("[CONFIG] ") + e.what());
        return ExitCode::VALIDATION_FAILED;
    }

    log_info("[PSI] " + Version::get_build_info());

    std::vector<ScenarioInput> inputs;
    inputs.reserve(opts.scenarios.size());
    for (const auto& [name, path] : opts.scenarios) {
        try {
            inputs.push_back({name, CsvLoader::load(path, CsvOptions{})});
        } catch (const std::exception& e) {
            log_error("[CSV] " + name + ": " + e.what());
            return ExitCode::IO_ERROR;
        }
    }

    const std::vector<ScenarioOutcome> outcomes = analyze_scenarios(inputs, opts.config);

    print_compliance(outcomes);
    print_nonstationarity(collect_nonstationarity(outcomes));
    print_recovery(outcomes);
    print_statistics(outcomes);

    bool failed = false;
    for (const auto& outcome : outcomes) {
        if (!outcome.ok()) {
            std::cerr << "Scenario failed: " << outcome.error << "\n";
            failed = true;
        }
    }
    return failed ? ExitCode::SCENARIO_FAILED : ExitCode::SUCCESS;
}
