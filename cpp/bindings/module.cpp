#include "hillmaker/core/types.hpp"
#include "hillmaker/core/version.hpp"
#include <pybind11/pybind11.h>

namespace py = pybind11;

// Forward declarations for binding functions
void init_data_bindings(py::module &m);
void init_hills_bindings(py::module &m);

/// Main Python module definition
PYBIND11_MODULE(hillmaker_cpp, m) {
  m.doc() = "hillmaker C++ engine - occupancy, arrival and departure "
            "statistics by time of day and day of week";

  // Version information
  m.attr("__version__") = hillmaker::Version::get_version_string();
  m.def("get_version", &hillmaker::Version::get_version_string,
        "Get library version string");

  // Error types
  py::register_exception<hillmaker::ValidationError>(m, "ValidationError",
                                                     PyExc_ValueError);
  py::register_exception<hillmaker::NumericInvariantError>(
      m, "NumericInvariantError", PyExc_ArithmeticError);
  py::register_exception<hillmaker::OperationCancelled>(
      m, "OperationCancelled", PyExc_RuntimeError);

  // Table input (DataFrame, CsvOptions)
  init_data_bindings(m);

  // Engine (ScenarioOptions, compute_hills, result tables)
  init_hills_bindings(m);
}
