#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <sstream>
#include <string>
#include "bindings.hpp"
#include "config.hpp"
#include "py_object_traits.hpp"

namespace pyhamt {

namespace {

// Iterator for set elements; keeps the set alive while iterating
class PySetIterator {
private:
    PySet set_;
    PySet::const_iterator iter_;

public:
    explicit PySetIterator(const PySet& set) : set_(set), iter_(set_.begin()) {}

    py::object next() {
        if (iter_ == set_.end()) {
            throw py::stop_iteration();
        }
        py::object elem = *iter_;
        ++iter_;
        return elem;
    }
};

// Iterator for dict keys; keeps the trie alive while iterating
class PyKeyIterator {
private:
    PyDictKeys keys_;
    PyDictKeys::const_iterator iter_;

public:
    explicit PyKeyIterator(const PyDictKeys& keys) : keys_(keys), iter_(keys_.begin()) {}

    py::object next() {
        if (iter_ == keys_.end()) {
            throw py::stop_iteration();
        }
        py::object key = *iter_;
        ++iter_;
        return key;
    }
};

PySet setFromIterable(const py::object& iterable) {
    if (iterable.is_none()) {
        return PySet();
    }
    if (py::isinstance<PySet>(iterable)) {
        return iterable.cast<const PySet&>();
    }
    if (!py::isinstance<py::iterable>(iterable)) {
        throw py::type_error("PersistentSet requires an iterable");
    }
    return PySet(pyutils::ObjectIterator(py::iter(iterable)), pyutils::ObjectIterator());
}

/**
 * Difference against any Python object:
 * - PersistentSet, PersistentDict or its keys(): node-by-node subtraction
 * - set, frozenset, dict: filtered through their constant-time `in`
 * - any other iterable: one removal per item
 */
PySet difference(const PySet& self, const py::object& other) {
    if (py::isinstance<PySet>(other)) {
        return self.subtracting(other.cast<const PySet&>());
    }
    if (py::isinstance<PyDictKeys>(other)) {
        return self.subtracting(other.cast<const PyDictKeys&>());
    }
    if (py::isinstance<PyDict>(other)) {
        return self.subtracting(other.cast<const PyDict&>().keys());
    }
    if (pyutils::hasFastContains(other)) {
        return self.subtracting(pyutils::Container(other));
    }
    if (!py::isinstance<py::iterable>(other)) {
        throw py::type_error("difference() requires a PersistentSet, a mapping or an iterable");
    }
    return self.subtracting(pyutils::Iterable(other));
}

std::string setRepr(const PySet& set) {
    std::ostringstream oss;
    oss << "PersistentSet({";
    bool first = true;
    for (const auto& elem : set) {
        if (!first) oss << ", ";
        first = false;
        oss << py::repr(elem).cast<std::string>();
    }
    oss << "})";
    return oss.str();
}

std::string dictRepr(const PyDict& dict) {
    std::ostringstream oss;
    oss << "PersistentDict({";
    bool first = true;
    for (const auto& entry : dict) {
        if (!first) oss << ", ";
        first = false;
        oss << py::repr(entry.key).cast<std::string>();
        oss << ": ";
        oss << py::repr(entry.value).cast<std::string>();
    }
    oss << "})";
    return oss.str();
}

PyDict dictFromMapping(const py::object& mapping) {
    PyDict result;
    if (mapping.is_none()) {
        return result;
    }
    if (py::isinstance<PyDict>(mapping)) {
        return mapping.cast<const PyDict&>();
    }
    if (!py::hasattr(mapping, "items")) {
        throw py::type_error("PersistentDict requires a dict, PersistentDict, or mapping");
    }
    for (auto item : mapping.attr("items")()) {
        py::tuple kv = item.cast<py::tuple>();
        result = result.assoc(kv[0], kv[1]);
    }
    return result;
}

}  // namespace

void registerBindings(py::module_& m) {
    m.doc() = "Persistent hash sets and maps (HAMT) with structural set algebra";

    m.def("configure",
          [](py::object validate, py::object debugLog) {
              if (!validate.is_none()) {
                  Config::setValidate(validate.cast<bool>());
              }
              if (!debugLog.is_none()) {
                  Config::setDebugLogPath(debugLog.cast<std::string>());
              }
          },
          py::arg("validate") = py::none(), py::arg("debug_log") = py::none(),
          "Change runtime settings.\n\n"
          "Args:\n"
          "    validate: Run the full trie invariant check after set algebra\n"
          "    debug_log: Path of the debug trace file ('' closes it)");

    m.def("is_validating", &Config::validate,
          "Return True when algebra results are checked against the trie invariants.");

    // Expose iterators as Python iterators
    py::class_<PySetIterator>(m, "SetIterator")
        .def("__iter__", [](PySetIterator& it) -> PySetIterator& { return it; })
        .def("__next__", &PySetIterator::next);

    py::class_<PyKeyIterator>(m, "KeyIterator")
        .def("__iter__", [](PyKeyIterator& it) -> PyKeyIterator& { return it; })
        .def("__next__", &PyKeyIterator::next);

    py::class_<PyDictKeys>(m, "KeysView")
        .def("__len__", &PyDictKeys::size,
             "Return number of keys.")
        .def("__contains__", &PyDictKeys::contains,
             py::arg("key"),
             "Check if key is present.")
        .def("__iter__", [](const PyDictKeys& keys) { return PyKeyIterator(keys); },
             "Iterate over keys.");

    // PersistentDict
    py::class_<PyDict>(m, "PersistentDict")
        .def(py::init([](py::object mapping) { return dictFromMapping(mapping); }),
             py::arg("mapping") = py::none(),
             "Create a PersistentDict, optionally from a mapping")

        // Core methods
        .def("assoc", &PyDict::assoc,
             py::arg("key"), py::arg("val"),
             "Associate key with value, returning new map.\n\n"
             "Args:\n"
             "    key: The key (must be hashable)\n"
             "    val: The value\n\n"
             "Returns:\n"
             "    A new PersistentDict with the association added")

        .def("dissoc", &PyDict::dissoc,
             py::arg("key"),
             "Remove key, returning new map.\n\n"
             "Args:\n"
             "    key: The key to remove\n\n"
             "Returns:\n"
             "    A new PersistentDict with the key removed")

        .def("get",
             [](const PyDict& self, const py::object& key, const py::object& defaultVal) -> py::object {
                 const py::object* value = self.find(key);
                 return value ? *value : defaultVal;
             },
             py::arg("key"), py::arg("default") = py::none(),
             "Get value for key, or default if not found.")

        // Python-friendly aliases
        .def("set", &PyDict::assoc,
             py::arg("key"), py::arg("val"),
             "Pythonic alias for assoc().")

        .def("delete", &PyDict::dissoc,
             py::arg("key"),
             "Pythonic alias for dissoc().")

        .def("keys", &PyDict::keys,
             "Return a view of the keys sharing this map's trie.\n\n"
             "The view can be subtracted from a PersistentSet node by node.")

        .def("items",
             [](const PyDict& self) {
                 py::list result;
                 for (const auto& entry : self) {
                     result.append(py::make_tuple(entry.key, entry.value));
                 }
                 return result;
             },
             "Return list of (key, value) tuples.")

        // Python protocols
        .def("__getitem__",
             [](const PyDict& self, const py::object& key) -> py::object {
                 const py::object* value = self.find(key);
                 if (value == nullptr) {
                     throw py::key_error(py::repr(key).cast<std::string>());
                 }
                 return *value;
             },
             py::arg("key"),
             "Get item using bracket notation. Raises KeyError if not found.")

        .def("__contains__", &PyDict::contains,
             py::arg("key"),
             "Check if key is present.")

        .def("__len__", &PyDict::size,
             "Return number of entries in the map.")

        .def("__iter__", [](const PyDict& self) { return PyKeyIterator(self.keys()); },
             "Iterate over keys.")

        .def("__eq__",
             [](const PyDict& self, py::object other) -> bool {
                 if (!py::isinstance<PyDict>(other)) {
                     return false;
                 }
                 return self == other.cast<const PyDict&>();
             },
             py::arg("other"),
             "Check equality with another map.")

        .def("__repr__", &dictRepr,
             "String representation of the map.");

    // PersistentSet
    py::class_<PySet>(m, "PersistentSet")
        .def(py::init([](py::object iterable) { return setFromIterable(iterable); }),
             py::arg("iterable") = py::none(),
             "Create a PersistentSet, optionally from an iterable")

        // Core methods
        .def("conj", &PySet::insert,
             py::arg("elem"),
             "Add element to set, returning new set.\n\n"
             "Args:\n"
             "    elem: The element to add (must be hashable)\n\n"
             "Returns:\n"
             "    A new PersistentSet with the element added")

        .def("disj", &PySet::erase,
             py::arg("elem"),
             "Remove element from set, returning new set.\n\n"
             "Args:\n"
             "    elem: The element to remove\n\n"
             "Returns:\n"
             "    A new PersistentSet with the element removed")

        .def("contains", &PySet::contains,
             py::arg("elem"),
             "Check if element is in set.")

        // Set operations
        .def("union",
             [](const PySet& self, const py::object& other) {
                 return self.union_(setFromIterable(other));
             },
             py::arg("other"),
             "Return union of this set and other.")

        .def("intersection",
             [](const PySet& self, const py::object& other) {
                 return self.intersection(setFromIterable(other));
             },
             py::arg("other"),
             "Return intersection of this set and other.")

        .def("difference", &difference,
             py::arg("other"),
             "Return the elements of this set that are not in other.\n\n"
             "Args:\n"
             "    other: A PersistentSet, PersistentDict (its keys), keys view,\n"
             "           set, frozenset, dict, or any iterable\n\n"
             "Returns:\n"
             "    A new PersistentSet; this very set when nothing was removed")

        .def("symmetric_difference",
             [](const PySet& self, const py::object& other) {
                 return self.symmetricDifference(setFromIterable(other));
             },
             py::arg("other"),
             "Return symmetric difference of this set and other.")

        // Set predicates
        .def("issubset",
             [](const PySet& self, const py::object& other) {
                 return self.isSubset(setFromIterable(other));
             },
             py::arg("other"),
             "Test if this set is a subset of other.")

        .def("issuperset",
             [](const PySet& self, const py::object& other) {
                 return self.isSuperset(setFromIterable(other));
             },
             py::arg("other"),
             "Test if this set is a superset of other.")

        .def("isdisjoint",
             [](const PySet& self, const py::object& other) {
                 return self.isDisjoint(setFromIterable(other));
             },
             py::arg("other"),
             "Test if this set has no elements in common with other.")

        // Python-friendly aliases
        .def("add", &PySet::insert,
             py::arg("elem"),
             "Pythonic alias for conj(). Add element to set.")

        .def("remove", &PySet::erase,
             py::arg("elem"),
             "Pythonic alias for disj(). Remove element from set.")

        // Python protocols
        .def("__contains__", &PySet::contains,
             py::arg("elem"),
             "Check if element is in set.")

        .def("__len__", &PySet::size,
             "Return number of elements in the set.")

        .def("__iter__", [](const PySet& self) { return PySetIterator(self); },
             "Iterate over elements in the set.")

        // Set operators
        .def("__or__",
             [](const PySet& self, const py::object& other) {
                 return self.union_(setFromIterable(other));
             },
             py::arg("other"),
             "Union using | operator.")

        .def("__and__",
             [](const PySet& self, const py::object& other) {
                 return self.intersection(setFromIterable(other));
             },
             py::arg("other"),
             "Intersection using & operator.")

        .def("__sub__", &difference,
             py::arg("other"),
             "Difference using - operator.")

        .def("__xor__",
             [](const PySet& self, const py::object& other) {
                 return self.symmetricDifference(setFromIterable(other));
             },
             py::arg("other"),
             "Symmetric difference using ^ operator.")

        .def("__le__",
             [](const PySet& self, const py::object& other) {
                 return self.isSubset(setFromIterable(other));
             },
             py::arg("other"),
             "Subset test using <= operator.")

        .def("__ge__",
             [](const PySet& self, const py::object& other) {
                 return self.isSuperset(setFromIterable(other));
             },
             py::arg("other"),
             "Superset test using >= operator.")

        .def("__eq__",
             [](const PySet& self, py::object other) -> bool {
                 if (!py::isinstance<PySet>(other)) {
                     return false;
                 }
                 return self == other.cast<const PySet&>();
             },
             py::arg("other"),
             "Check equality with another set.")

        .def("_shares_root",
             [](const PySet& self, const PySet& other) { return self.root() == other.root(); },
             py::arg("other"),
             "True when both sets hold the same root node.")

        .def("__repr__", &setRepr,
             "String representation of the set.");

    m.attr("__version__") = "0.1.0";
}

}  // namespace pyhamt
