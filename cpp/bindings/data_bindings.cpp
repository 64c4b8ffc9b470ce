#include "effluent/data/column.hpp"
#include "effluent/data/csv_loader.hpp"
#include "effluent/data/dataframe.hpp"
#include "effluent/data/validators.hpp"
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace effluent;

/// Helper: Convert C++ column to NumPy array (zero-copy)
py::array_t<double> get_column_as_numpy(const DataFrame &df,
                                        const std::string &name) {
  const double *data_ptr = df.get_column_ptr_f64(name);
  size_t size = df.row_count();

  // py::cast(df) keeps the DataFrame alive as long as the array exists
  return py::array_t<double>(size, data_ptr, py::cast(df));
}

/// Helper: Bool column as a NumPy bool array (copy)
py::array_t<bool> get_bool_column_as_numpy(const DataFrame &df,
                                           const std::string &name) {
  const auto values = df.get_bool(name);
  py::array_t<bool> out(values.size());
  auto view = out.mutable_unchecked<1>();
  for (size_t i = 0; i < values.size(); ++i) {
    view(static_cast<py::ssize_t>(i)) = values[i] != 0;
  }
  return out;
}

/// Helper: Build a DataFrame from {name: 1-D array}; columns keep dict order
DataFrame dataframe_from_arrays(const py::dict &arrays) {
  DataFrame df;
  for (const auto &item : arrays) {
    const std::string name = py::str(item.first);
    py::array_t<double, py::array::c_style | py::array::forcecast> array =
        py::array_t<double, py::array::c_style | py::array::forcecast>::ensure(
            item.second);
    if (!array) {
      throw std::runtime_error("Column '" + name +
                               "' is not convertible to float64");
    }
    if (array.ndim() != 1) {
      throw std::runtime_error("Column '" + name + "' must be 1-dimensional");
    }
    const double *data = array.data();
    df.add_f64(name, std::vector<double>(data, data + array.size()));
  }
  return df;
}

/// Initialize data-related Python bindings
void init_data_bindings(py::module &m) {

  // ===== ColumnType Enum =====
  py::enum_<ColumnType>(m, "ColumnType", "Column data types")
      .value("FLOAT64", ColumnType::FLOAT64, "64-bit floating point")
      .value("BOOL", ColumnType::BOOL, "Flag column")
      .value("STRING", ColumnType::STRING, "String type")
      .export_values();

  // ===== CsvOptions =====
  py::class_<CsvOptions>(m, "CsvOptions", "CSV loading options")
      .def(py::init<>(), "Default constructor")
      .def_readwrite("delimiter", &CsvOptions::delimiter,
                     "Field delimiter (default: ',')")
      .def_readwrite("has_header", &CsvOptions::has_header,
                     "First row is header (default: True)")
      .def_readwrite("skip_rows", &CsvOptions::skip_rows,
                     "Number of rows to skip (default: 0)")
      .def_readwrite("auto_detect_types", &CsvOptions::auto_detect_types,
                     "Auto-detect column types (default: True)")
      .def_readwrite("infer_schema_rows", &CsvOptions::infer_schema_rows,
                     "Rows to scan for type inference (default: 1000)")
      .def("__repr__", [](const CsvOptions &opts) {
        return "<CsvOptions delimiter='" + std::string(1, opts.delimiter) +
               "' has_header=" + (opts.has_header ? "True" : "False") + ">";
      });

  // ===== DataFrame =====
  py::class_<DataFrame>(m, "DataFrame", "Column-oriented data container")
      .def(py::init<>(), "Create empty DataFrame")

      // Factory methods
      .def_static("load_csv", &DataFrame::load_csv,
                  "Load DataFrame from CSV file", py::arg("path"),
                  py::arg("options") = CsvOptions{},
                  py::return_value_policy::move)
      .def_static("parse_csv", &CsvLoader::parse,
                  "Parse CSV text into a DataFrame", py::arg("content"),
                  py::arg("options") = CsvOptions{},
                  py::return_value_policy::move)
      .def_static("from_arrays", &dataframe_from_arrays,
                  "Build a DataFrame from a dict of 1-D float arrays",
                  py::arg("arrays"), py::return_value_policy::move)

      // Column access
      .def("get_column_f64", &get_column_as_numpy,
           "Get Float64 column as NumPy array (zero-copy)", py::arg("name"),
           py::keep_alive<0, 1>())
      .def("get_column_bool", &get_bool_column_as_numpy,
           "Get Bool column as NumPy array", py::arg("name"))
      .def(
          "get_column_str",
          [](const DataFrame &df, const std::string &name) {
            const auto values = df.get_string(name);
            return std::vector<std::string>(values.begin(), values.end());
          },
          "Get String column as a list", py::arg("name"))

      // Metadata
      .def("row_count", &DataFrame::row_count, "Get number of rows")
      .def("column_count", &DataFrame::column_count, "Get number of columns")
      .def("column_names", &DataFrame::column_names, "Get list of column names")
      .def("column_type", &DataFrame::column_type, "Get column type",
           py::arg("name"))
      .def("has_column", &DataFrame::has_column, "Check if column exists",
           py::arg("name"))

      // String representation
      .def("__repr__",
           [](const DataFrame &df) {
             return "<DataFrame rows=" + std::to_string(df.row_count()) +
                    " cols=" + std::to_string(df.column_count()) + ">";
           })
      .def("__len__", &DataFrame::row_count, "Number of rows (len(df))");

  // ===== Validation =====
  py::class_<DataQualityReport>(m, "DataQualityReport")
      .def_readonly("total_rows", &DataQualityReport::total_rows)
      .def_readonly("total_columns", &DataQualityReport::total_columns)
      .def_readonly("missing_columns", &DataQualityReport::missing_columns)
      .def_readonly("null_counts", &DataQualityReport::null_counts)
      .def_readonly("numeric_columns", &DataQualityReport::numeric_columns)
      .def_readonly("has_expected_columns",
                    &DataQualityReport::has_expected_columns);

  m.def("required_columns", &required_columns,
        "Observation columns every input table must carry");
  m.def("check_required_columns", &check_required_columns, py::arg("df"),
        py::arg("required"), "Required columns absent from the table");
  m.def("validate_dataframe", &validate_dataframe, py::arg("df"),
        py::arg("required"), py::arg("allow_empty") = true,
        "Raise DataValidationError for missing or non-numeric columns");
  m.def("data_quality_report", &data_quality_report, py::arg("df"));
}
