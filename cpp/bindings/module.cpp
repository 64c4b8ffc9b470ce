#include "effluent/core/version.hpp"
#include "effluent/processing/arrow_utils.hpp"
#include <pybind11/pybind11.h>

namespace py = pybind11;

// Forward declarations for binding functions
void init_data_bindings(py::module &m);
void bind_processing(py::module &m);
void bind_statistics(py::module &m);

namespace effluent {
void init_core_bindings(py::module &m);
}

/// Main Python module definition
PYBIND11_MODULE(effluent_psi_cpp, m) {
  m.doc() = "Effluent compliance and PSI non-linearity metrics engine";

  // Version information
  m.attr("__version__") = effluent::Version::get_version_string();
  m.def("get_version", &effluent::Version::get_version_string,
        "Get library version string");
  m.def("get_build_info", &effluent::Version::get_build_info,
        "Version plus the accelerators compiled in");
  m.def("is_arrow_available", &effluent::arrow_utils::is_arrow_available,
        "True when built with Arrow compute acceleration");

  // Config, labels, logging, exceptions
  effluent::init_core_bindings(m);

  // DataFrame, CsvOptions, validators
  init_data_bindings(m);

  // Per-row stages and the scenario pipeline
  bind_processing(m);

  // Scorers and summaries
  bind_statistics(m);
}
