#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <pybind11/embed.h>
#include "bindings.hpp"
#include "config.hpp"

namespace py = pybind11;

PYBIND11_EMBEDDED_MODULE(pyhamt, m) {
    pyhamt::registerBindings(m);
}

namespace pyhamt::test {

namespace {

// Runs a snippet with the module imported as `pyhamt`; failed asserts surface as exceptions
void run(const char* code) {
    py::dict scope;
    scope["__name__"] = "__main__";
    scope["pyhamt"] = py::module_::import("pyhamt");
    py::exec(code, scope);
}

}  // namespace

TEST_CASE("PersistentSet difference with every kind of operand", "[bindings]") {
    CHECK_NOTHROW(run(R"(
S = pyhamt.PersistentSet
a = S([1, 2, 3, 4])
assert set(a - S([0, 2, 4, 6])) == {1, 3}
assert set(a.difference([0, 2, 4, 6])) == {1, 3}
assert set(a.difference((x for x in [0, 2, 4, 6]))) == {1, 3}
assert set(a - {0, 2, 4, 6}) == {1, 3}
assert set(a - frozenset({2})) == {1, 3, 4}
assert set(a - {0: 'a', 2: 'b', 4: 'c', 6: 'd'}) == {1, 3}

m = pyhamt.PersistentDict({0: 'a', 2: 'b', 4: 'c', 6: 'd'})
assert set(a - m.keys()) == {1, 3}
assert set(a - m) == {1, 3}

assert len(S() - [1, 2]) == 0
assert len(S([1, 2, 3]) - S([1, 2, 3])) == 0
assert a.difference(S())._shares_root(a)
assert a.difference([100, 200])._shares_root(a)
assert not (a - [1])._shares_root(a)
)"));
}

TEST_CASE("PersistentSet difference on an empty set does not consume the iterable", "[bindings]") {
    CHECK_NOTHROW(run(R"(
consumed = []
def items():
    for x in [1, 2, 3]:
        consumed.append(x)
        yield x
assert len(pyhamt.PersistentSet() - items()) == 0
assert consumed == []
)"));
}

TEST_CASE("PersistentSet handles colliding Python hashes", "[bindings]") {
    CHECK_NOTHROW(run(R"(
class Key:
    def __init__(self, v): self.v = v
    def __hash__(self): return 7
    def __eq__(self, other): return isinstance(other, Key) and self.v == other.v
    def __repr__(self): return f"Key({self.v})"

a = pyhamt.PersistentSet([Key(1), Key(2), Key(3)])
b = pyhamt.PersistentSet([Key(2), Key(4)])
result = a - b
assert len(result) == 2
assert Key(1) in result and Key(3) in result and Key(2) not in result
)"));
}

TEST_CASE("PersistentSet algebra and protocols", "[bindings]") {
    CHECK_NOTHROW(run(R"(
S = pyhamt.PersistentSet
a = S([1, 2, 3])
b = S([3, 4])
assert set(a | b) == {1, 2, 3, 4}
assert set(a & b) == {3}
assert set(a ^ b) == {1, 2, 4}
assert set(a.union([5])) == {1, 2, 3, 5}
assert S([1]).issubset(a) and a.issuperset([1, 2]) and a.isdisjoint([9])
assert S([1]) <= a and a >= S([1])
assert a.add(9).contains(9) and not a.contains(9)
assert 2 not in a.remove(2)
assert sorted(a) == [1, 2, 3]
assert a == S([3, 2, 1]) and a != b and a != {1, 2, 3}
assert repr(S([1])) == "PersistentSet({1})"
)"));
}

TEST_CASE("PersistentSet operators accept any iterable", "[bindings]") {
    CHECK_NOTHROW(run(R"(
S = pyhamt.PersistentSet
a = S([1, 2, 3])
assert set(a | {4}) == {1, 2, 3, 4}
assert set(a | [3, 5]) == {1, 2, 3, 5}
assert set(a & [2, 3, 9]) == {2, 3}
assert set(a ^ (x for x in [3, 4])) == {1, 2, 4}
assert a <= {1, 2, 3, 4} and not a <= [1, 2]
assert a >= [1, 3] and not a >= {7}
try:
    a | 5
    assert False
except TypeError:
    pass
)"));
}

TEST_CASE("PersistentDict protocols", "[bindings]") {
    CHECK_NOTHROW(run(R"(
D = pyhamt.PersistentDict
d = D({'a': 1}).assoc('b', 2).set('c', 3)
assert len(d) == 3
assert d['b'] == 2 and d.get('z', 0) == 0 and 'c' in d
assert sorted(d) == ['a', 'b', 'c']
assert sorted(d.keys()) == ['a', 'b', 'c'] and len(d.keys()) == 3 and 'a' in d.keys()
assert sorted(d.items()) == [('a', 1), ('b', 2), ('c', 3)]
assert 'b' not in d.dissoc('b') and 'a' not in d.delete('a')
assert d == D({'c': 3, 'b': 2, 'a': 1})
try:
    d['missing']
    assert False
except KeyError:
    pass
)"));
}

TEST_CASE("Python errors propagate out of the trie", "[bindings]") {
    CHECK_NOTHROW(run(R"(
try:
    pyhamt.PersistentSet([[1]])
    assert False
except TypeError:
    pass

try:
    pyhamt.PersistentSet([1]) - 5
    assert False
except TypeError:
    pass
)"));
}

TEST_CASE("configure changes the runtime settings", "[bindings]") {
    CHECK_NOTHROW(run(R"(
pyhamt.configure(validate=False)
assert not pyhamt.is_validating()
pyhamt.configure(validate=True)
assert pyhamt.is_validating()
)"));
    CHECK(Config::validate());
}

}  // namespace pyhamt::test

int main(int argc, char* argv[]) {
    py::scoped_interpreter guard{};
    pyhamt::Config::setValidate(true);
    return Catch::Session().run(argc, argv);
}
