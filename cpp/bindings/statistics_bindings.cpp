/**
 * @file statistics_bindings.cpp
 * @brief Python bindings for column statistics and scenario-level scorers
 */

#include "effluent/statistics/compliance_summary.hpp"
#include "effluent/statistics/nonstationarity.hpp"
#include "effluent/statistics/recovery_analyzer.hpp"
#include "effluent/statistics/statistics_engine.hpp"
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace effluent;

namespace {

/// Contiguous float64 view of a NumPy array (1-D)
std::vector<double> to_vector(
    const py::array_t<double, py::array::c_style | py::array::forcecast> &data) {
  auto buf = data.request();
  if (buf.ndim != 1) {
    throw std::runtime_error("Expected a 1-dimensional array");
  }
  const double *ptr = static_cast<const double *>(buf.ptr);
  return std::vector<double>(ptr, ptr + buf.size);
}

} // namespace

void bind_statistics(py::module_ &m) {
  // ColumnStatistics structure
  py::class_<ColumnStatistics>(m, "ColumnStatistics")
      .def(py::init<>())
      .def_readonly("mean", &ColumnStatistics::mean, "Arithmetic mean")
      .def_readonly("std_dev", &ColumnStatistics::std_dev,
                    "Sample standard deviation")
      .def_readonly("variance", &ColumnStatistics::variance, "Sample variance")
      .def_readonly("min", &ColumnStatistics::min, "Minimum value")
      .def_readonly("max", &ColumnStatistics::max, "Maximum value")
      .def_readonly("median", &ColumnStatistics::median, "Median value")
      .def_readonly("sum", &ColumnStatistics::sum, "Sum of valid values")
      .def_readonly("count", &ColumnStatistics::count, "Number of rows")
      .def_readonly("valid_count", &ColumnStatistics::valid_count,
                    "Number of non-NaN values")
      .def("__repr__", [](const ColumnStatistics &s) {
        return "<ColumnStatistics mean=" + std::to_string(s.mean) +
               " std=" + std::to_string(s.std_dev) +
               " min=" + std::to_string(s.min) +
               " max=" + std::to_string(s.max) +
               " count=" + std::to_string(s.valid_count) + ">";
      });

  py::class_<RollingStatistics>(m, "RollingStatistics")
      .def_readonly("window", &RollingStatistics::window)
      .def_readonly("mean", &RollingStatistics::mean)
      .def_readonly("std_dev", &RollingStatistics::std_dev)
      .def_readonly("variance", &RollingStatistics::variance)
      .def_readonly("median", &RollingStatistics::median);

  py::class_<Histogram>(m, "Histogram")
      .def_readonly("min", &Histogram::min, "Lower edge of the first bin")
      .def_readonly("bin_width", &Histogram::bin_width)
      .def_readonly("counts", &Histogram::counts);

  py::class_<NamedStatistics>(m, "NamedStatistics")
      .def_readonly("column", &NamedStatistics::column)
      .def_readonly("stats", &NamedStatistics::stats)
      .def_readonly("cv", &NamedStatistics::cv,
                    "Coefficient of variation (None when undefined)");

  // StatisticsEngine class
  py::class_<StatisticsEngine>(m, "StatisticsEngine")
      .def_static(
          "calculate",
          [](const py::array_t<double, py::array::c_style |
                                           py::array::forcecast> &data) {
            return StatisticsEngine::calculate(to_vector(data));
          },
          py::arg("values"),
          R"pbdoc(
                Basic statistics of a float64 array; NaN values are skipped.

                Returns:
                    ColumnStatistics with mean, std_dev (ddof=1), min, max,
                    median, sum, count and valid_count.
            )pbdoc")
      .def_static(
          "calculate_rolling",
          [](const py::array_t<double, py::array::c_style |
                                           py::array::forcecast> &data,
             size_t window) {
            return StatisticsEngine::calculate_rolling(to_vector(data), window);
          },
          py::arg("values"), py::arg("window"))
      .def_static(
          "percentile",
          [](const py::array_t<double, py::array::c_style |
                                           py::array::forcecast> &data,
             double p) { return StatisticsEngine::percentile(to_vector(data), p); },
          py::arg("values"), py::arg("percentile"))
      .def_static(
          "histogram",
          [](const py::array_t<double, py::array::c_style |
                                           py::array::forcecast> &data,
             size_t bins) {
            return StatisticsEngine::histogram(to_vector(data), bins);
          },
          py::arg("values"), py::arg("bins") = 10)
      .def_static(
          "coefficient_of_variation",
          [](const py::array_t<double, py::array::c_style |
                                           py::array::forcecast> &data) {
            return StatisticsEngine::coefficient_of_variation(to_vector(data));
          },
          py::arg("values"))
      .def_static(
          "exceedance_probability",
          [](const py::array_t<double, py::array::c_style |
                                           py::array::forcecast> &data,
             double threshold) {
            return StatisticsEngine::exceedance_probability(to_vector(data),
                                                            threshold);
          },
          py::arg("values"), py::arg("threshold"));

  m.def("summarize_columns", &summarize_columns, py::arg("df"),
        py::arg("columns"));
  m.def("compute_exceedance", &compute_exceedance, py::arg("df"),
        py::arg("thresholds"));

  // ===== Compliance summary =====
  py::class_<ComplianceSummary>(m, "ComplianceSummary")
      .def_readonly("total_rows", &ComplianceSummary::total_rows)
      .def_readonly("compliant", &ComplianceSummary::compliant)
      .def_readonly("lut_exceedance", &ComplianceSummary::lut_exceedance)
      .def_readonly("max_limit_failure", &ComplianceSummary::max_limit_failure)
      .def_readonly("source_bod", &ComplianceSummary::source_bod)
      .def_readonly("source_cod", &ComplianceSummary::source_cod)
      .def_readonly("source_both", &ComplianceSummary::source_both)
      .def_readonly("pass_source", &ComplianceSummary::pass_source)
      .def_readonly("c_bod_2", &ComplianceSummary::c_bod_2)
      .def_readonly("c_bod_3", &ComplianceSummary::c_bod_3)
      .def_readonly("compliant_fraction", &ComplianceSummary::compliant_fraction)
      .def("non_compliant", &ComplianceSummary::non_compliant);

  m.def("summarize_compliance", &summarize_compliance, py::arg("df"));

  // ===== Non-stationarity =====
  py::class_<NonStationarityRow>(m, "NonStationarityRow")
      .def_readonly("scenario", &NonStationarityRow::scenario)
      .def_readonly("scores", &NonStationarityRow::scores);

  py::class_<NonStationarityTable>(m, "NonStationarityTable")
      .def_readonly("columns", &NonStationarityTable::columns)
      .def_readonly("rows", &NonStationarityTable::rows);

  m.def(
      "non_stationarity_score",
      [](const py::array_t<double, py::array::c_style | py::array::forcecast>
             &data,
         size_t window) { return non_stationarity_score(to_vector(data), window); },
      py::arg("values"), py::arg("window") = DEFAULT_NONSTATIONARITY_WINDOW,
      R"pbdoc(
            Mean |rolling variance - overall variance| / overall variance.

            Returns None when fewer than `window` valid values remain or the
            series has zero variance.
        )pbdoc");
  m.def("compute_nonstationarity_table", &compute_nonstationarity_table,
        py::arg("scenarios"), py::arg("columns") = std::vector<std::string>{},
        py::arg("window") = DEFAULT_NONSTATIONARITY_WINDOW);

  // ===== Recovery =====
  py::class_<RecoveryEpisode>(m, "RecoveryEpisode")
      .def_readonly("start_index", &RecoveryEpisode::start_index)
      .def_readonly("length", &RecoveryEpisode::length)
      .def_readonly("duration_days", &RecoveryEpisode::duration_days)
      .def_readonly("closed", &RecoveryEpisode::closed);

  py::class_<RecoverySummary>(m, "RecoverySummary")
      .def_readonly("count", &RecoverySummary::count)
      .def_readonly("mean_minutes", &RecoverySummary::mean_minutes)
      .def_readonly("std_minutes", &RecoverySummary::std_minutes)
      .def_readonly("min_minutes", &RecoverySummary::min_minutes)
      .def_readonly("max_minutes", &RecoverySummary::max_minutes)
      .def_readonly("samples_days", &RecoverySummary::samples_days)
      .def_readonly("samples_minutes", &RecoverySummary::samples_minutes)
      .def_readonly("histogram", &RecoverySummary::histogram);

  m.def(
      "scan_episodes",
      [](const std::vector<FailType> &types, double time_step) {
        return scan_episodes(types, time_step);
      },
      py::arg("fail_types"), py::arg("time_step"));
  m.def(
      "compute_recovery_times",
      [](const std::vector<FailType> &types, double time_step,
         OpenRunPolicy policy) {
        return compute_recovery_times(types, time_step, policy);
      },
      py::arg("fail_types"), py::arg("time_step"),
      py::arg("policy") = OpenRunPolicy::DROP);
  m.def(
      "compute_recovery_times_df",
      [](const DataFrame &df, double time_step, OpenRunPolicy policy) {
        return compute_recovery_times(df, time_step, policy);
      },
      py::arg("df"), py::arg("time_step"),
      py::arg("policy") = OpenRunPolicy::DROP);
  m.def(
      "mean_recovery_time",
      [](const std::vector<double> &samples) {
        return mean_recovery_time(samples);
      },
      py::arg("samples"));
  m.def(
      "summarize_recovery",
      [](const std::vector<double> &samples_days, size_t bins) {
        return summarize_recovery(samples_days, bins);
      },
      py::arg("samples_days"), py::arg("bins") = 10);
}
