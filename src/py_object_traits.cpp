#include "py_object_traits.hpp"

namespace pyhamt {
namespace pyutils {

uint64_t hashObject(const py::object& obj) {
    Py_hash_t h = PyObject_Hash(obj.ptr());
    if (h == -1) {
        throw py::error_already_set();
    }
    return static_cast<uint64_t>(h);
}

bool objectsEqual(const py::object& o1, const py::object& o2) {
    // Fast path: same object
    if (o1.is(o2)) return true;

    // Use Python's rich comparison
    int result = PyObject_RichCompareBool(o1.ptr(), o2.ptr(), Py_EQ);
    if (result == -1) {
        throw py::error_already_set();
    }
    return result == 1;
}

std::optional<bool> Container::fastContains(const py::object& element) const {
    int result = PySequence_Contains(obj_.ptr(), element.ptr());
    if (result == -1) {
        throw py::error_already_set();
    }
    return result == 1;
}

bool hasFastContains(const py::handle& obj) {
    return PyAnySet_Check(obj.ptr()) || PyDict_Check(obj.ptr());
}

}  // namespace pyutils
}  // namespace pyhamt
