#pragma once

#include <pybind11/pybind11.h>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include "containment.hpp"
#include "persistent_hash_set.hpp"
#include "persistent_map.hpp"

namespace py = pybind11;

namespace pyhamt {

// Python utility functions
namespace pyutils {

    // Python's __hash__; raises the Python error for unhashable objects
    uint64_t hashObject(const py::object& obj);

    // Python's ==, short-circuiting on identity
    bool objectsEqual(const py::object& o1, const py::object& o2);

    struct ObjectHash {
        uint64_t operator()(const py::object& obj) const { return hashObject(obj); }
    };

    struct ObjectEqual {
        bool operator()(const py::object& o1, const py::object& o2) const {
            return objectsEqual(o1, o2);
        }
    };

    // Input iterator over a Python iterator, yielding owned references
    class ObjectIterator {
    private:
        py::iterator iter_;

    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = py::object;
        using difference_type = std::ptrdiff_t;
        using pointer = const py::object*;
        using reference = py::object;

        ObjectIterator() : iter_(py::iterator::sentinel()) {}
        explicit ObjectIterator(py::iterator iter) : iter_(std::move(iter)) {}

        py::object operator*() const { return py::reinterpret_borrow<py::object>(*iter_); }

        ObjectIterator& operator++() {
            ++iter_;
            return *this;
        }

        bool operator==(const ObjectIterator& other) const { return iter_ == other.iter_; }
        bool operator!=(const ObjectIterator& other) const { return !(iter_ == other.iter_); }
    };

    // Any Python iterable, consumed lazily
    class Iterable {
    protected:
        py::object obj_;

    public:
        using value_type = py::object;
        using const_iterator = ObjectIterator;

        explicit Iterable(py::object obj) : obj_(std::move(obj)) {}

        ObjectIterator begin() const { return ObjectIterator(py::iter(obj_)); }
        ObjectIterator end() const { return ObjectIterator(); }
    };

    // A set, frozenset or dict: iterable with a constant-time `in`
    class Container : public Iterable, public ContainmentHook<py::object> {
    public:
        explicit Container(py::object obj) : Iterable(std::move(obj)) {}

        std::optional<bool> fastContains(const py::object& element) const override;
    };

    // True for the builtin containers whose `in` is a hash lookup
    bool hasFastContains(const py::handle& obj);
}

using PySet = PersistentHashSet<py::object, pyutils::ObjectHash, pyutils::ObjectEqual>;
using PyDict = PersistentHashMap<py::object, py::object,
                                 pyutils::ObjectHash, pyutils::ObjectEqual, pyutils::ObjectEqual>;
using PyDictKeys = PyDict::Keys;

}  // namespace pyhamt
