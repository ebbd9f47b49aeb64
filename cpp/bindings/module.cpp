#include "pvperf/core/version.hpp"
#include <pybind11/pybind11.h>

namespace py = pybind11;

// Forward declarations for binding functions
void init_data_bindings(py::module &m);
void bind_processing(py::module &m);

/// Main Python module definition
PYBIND11_MODULE(pv_perf_cpp, m) {
  m.doc() = "PV plant performance core - performance ratio, issue "
            "classification and inverter efficiency";

  // Version information
  m.attr("__version__") = pvperf::Version::get_version_string();
  m.def("get_version", &pvperf::Version::get_version_string,
        "Get library version string");
  m.def("get_build_info", &pvperf::Version::get_build_info,
        "Version and compiled-in backends (Arrow compute)");

  // Tables, readers and loader
  init_data_bindings(m);

  // PR, issues, inverters, statistics, pipeline
  bind_processing(m);
}
