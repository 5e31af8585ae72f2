#include <pybind11/pybind11.h>
#include "bindings.hpp"

PYBIND11_MODULE(pyhamt, m) {
    pyhamt::registerBindings(m);
}
