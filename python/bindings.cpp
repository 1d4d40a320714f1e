#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "lineshuf/errors.hpp"
#include "lineshuf/options.hpp"
#include "lineshuf/pipeline.hpp"

namespace py = pybind11;
using namespace lineshuf;

PYBIND11_MODULE(pylineshuf, m) {
  py::register_exception<ShuffleError>(m, "ShuffleError", PyExc_RuntimeError);

  py::class_<ShuffleOptions>(m, "ShuffleOptions")
      .def(py::init<>())
      .def_readwrite("chunk_records", &ShuffleOptions::chunk_records)
      .def_readwrite("chunk_bytes", &ShuffleOptions::chunk_bytes)
      .def_readwrite("output_path", &ShuffleOptions::output_path)
      .def_readwrite("temp_dir", &ShuffleOptions::temp_dir)
      .def_readwrite("seed", &ShuffleOptions::seed)
      .def_readwrite("num_threads", &ShuffleOptions::num_threads)
      .def_readwrite("max_memory_bytes", &ShuffleOptions::max_memory_bytes)
      .def_readwrite("verbose", &ShuffleOptions::verbose);

  py::class_<RunSummary>(m, "RunSummary")
      .def(py::init<>())
      .def_readonly("input_path", &RunSummary::input_path)
      .def_readonly("output_path", &RunSummary::output_path)
      .def_readonly("seed", &RunSummary::seed)
      .def_readonly("records", &RunSummary::records)
      .def_readonly("input_bytes", &RunSummary::input_bytes)
      .def_readonly("output_bytes", &RunSummary::output_bytes)
      .def_readonly("chunks", &RunSummary::chunks)
      .def_readonly("shuffle_workers", &RunSummary::shuffle_workers)
      .def_readonly("total_seconds", &RunSummary::total_seconds);

  m.def(
      "shuffle_file",
      [](const std::string& input, const ShuffleOptions& options) {
        py::gil_scoped_release release;
        return ShuffleFile(input, options);
      },
      py::arg("input"), py::arg("options"));
}
