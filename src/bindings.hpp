#pragma once

#include <pybind11/pybind11.h>

namespace py = pybind11;

namespace pyhamt {

// Register PersistentSet, PersistentDict and configure() on `m`
void registerBindings(py::module_& m);

}  // namespace pyhamt
