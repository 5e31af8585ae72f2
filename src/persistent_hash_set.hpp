#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <type_traits>
#include <utility>
#include "config.hpp"
#include "containment.hpp"
#include "debug_log.hpp"
#include "invariant_check.hpp"
#include "node_algebra.hpp"
#include "persistent_map.hpp"

namespace pyhamt {

/**
 * PersistentHashSet - Immutable set implementation
 *
 * A persistent (immutable) hash set implemented as a wrapper around
 * PersistentHashMap, where keys are set elements and all values are Unit.
 *
 * Inherits all performance characteristics from PersistentHashMap:
 * - O(log32 n) operations (insert, erase, contains)
 * - Structural sharing for memory efficiency
 * - Copy-on-write semantics
 *
 * Set algebra works on the tries directly: sub-trees that do not change are
 * linked into the result instead of being rebuilt, and an operation that
 * changes nothing returns the receiver's own root.
 */
template <typename Element,
          typename Hash = std::hash<Element>,
          typename KeyEqual = std::equal_to<Element>>
class PersistentHashSet {
public:
    using Map = PersistentHashMap<Element, Unit, Hash, KeyEqual>;
    using Traits = typename Map::Traits;
    using Ptr = NodePtr<Traits>;
    using key_type = Element;
    using value_type = Element;
    using const_iterator = KeyIterator<Traits>;
    using iterator = const_iterator;

private:
    Map map_;  // Keys are set elements, values are always Unit

    explicit PersistentHashSet(Map map) : map_(std::move(map)) {}

    // Finalize the outcome of a top-level algebra operation
    PersistentHashSet finish(std::optional<NodeBuilder<Traits>> builder) const {
        if (!builder) {
            return *this;
        }
        Ptr result = builder->finalize(Level::top());
        if (Config::validate()) {
            fullInvariantCheck(result);
        }
        return fromNewRoot(std::move(result));
    }

    template <typename OtherTraits>
    PersistentHashSet subtractingNode(const NodePtr<OtherTraits>& other) const {
        if (empty() || !other) {
            return *this;
        }
        debug::log("subtracting: pairwise, ", size(), " - ", other->count());
        return finish(subtract(Level::top(), root(), other.get()));
    }

    template <typename Sequence>
    static bool sequenceContains(const Sequence& other, const Element& element) {
        if constexpr (std::is_base_of<ContainmentHook<Element>, Sequence>::value) {
            std::optional<bool> answer =
                static_cast<const ContainmentHook<Element>&>(other).fastContains(element);
            if (answer) {
                return *answer;
            }
        }
        return std::any_of(other.begin(), other.end(),
                           [&](const Element& item) { return Traits::keysEqual(item, element); });
    }

public:
    // Constructors
    PersistentHashSet() = default;

    PersistentHashSet(std::initializer_list<Element> init)
        : PersistentHashSet(init.begin(), init.end()) {}

    template <typename InputIt>
    PersistentHashSet(InputIt first, InputIt last) {
        Ptr built;
        for (; first != last; ++first) {
            const Element& elem = *first;
            pyhamt::insert(built, HashPath::top(Traits::hashOf(elem)),
                           typename Traits::entry_type(elem, Unit()), false);
        }
        map_ = Map::fromNewRoot(std::move(built));
    }

    // Wrap an already validated root
    static PersistentHashSet fromNewRoot(Ptr root) {
        return PersistentHashSet(Map::fromNewRoot(std::move(root)));
    }

    const Ptr& root() const { return map_.root(); }

    // Core operations (functional style)
    PersistentHashSet insert(const Element& elem) const {
        return PersistentHashSet(map_.assoc(elem, Unit()));
    }

    PersistentHashSet erase(const Element& elem) const {
        return PersistentHashSet(map_.dissoc(elem));
    }

    bool contains(const Element& elem) const {
        return map_.contains(elem);
    }

    // Size
    size_t size() const { return map_.size(); }
    bool empty() const { return map_.empty(); }

    // Iteration
    const_iterator begin() const { return const_iterator(map_.begin()); }
    const_iterator end() const { return const_iterator(); }

    // Difference

    /**
     * Elements of this set that are not in `other`.
     *
     * Works on both tries at once; sub-trees with nothing to remove are
     * shared with the result. Returns this set's own root when nothing is
     * removed.
     */
    PersistentHashSet subtracting(const PersistentHashSet& other) const {
        return subtractingNode(other.root());
    }

    // Elements of this set that are not keys of the viewed map
    template <typename OtherTraits>
    PersistentHashSet subtracting(const MapKeysView<OtherTraits>& keys) const {
        return subtractingNode(keys.root());
    }

    /**
     * Elements of this set that do not occur in an arbitrary finite sequence.
     *
     * - An empty set returns immediately, without touching the sequence.
     * - A sequence with a ContainmentHook that answers for a sample element
     *   filters this set through it.
     * - Otherwise every item is removed from one evolving copy-on-write root:
     *   O(n) in the length of the sequence, independent of this set's size.
     */
    template <typename Sequence>
    PersistentHashSet subtracting(const Sequence& other) const {
        if (empty()) {
            debug::log("subtracting: empty receiver, sequence not consumed");
            return PersistentHashSet();
        }

        if constexpr (std::is_base_of<ContainmentHook<Element>, Sequence>::value) {
            const auto& hook = static_cast<const ContainmentHook<Element>&>(other);
            if (hook.fastContains(*begin()).has_value()) {
                // Fast path: the sequence has fast containment checks
                debug::log("subtracting: containment fast path over ", size(), " elements");
                return filter([&](const Element& elem) { return !sequenceContains(other, elem); });
            }
        }

        debug::log("subtracting: per-element removal");
        Ptr working = root();
        for (const auto& item : other) {
            const Element& elem = item;
            if (pyhamt::remove(working, HashPath::top(Traits::hashOf(elem)), elem) && !working) {
                break;
            }
        }
        if (working == root()) {
            return *this;
        }
        if (Config::validate()) {
            fullInvariantCheck(working);
        }
        return fromNewRoot(std::move(working));
    }

    // Elements for which `pred` holds, sharing every untouched sub-tree
    template <typename Predicate>
    PersistentHashSet filter(Predicate pred) const {
        if (empty()) {
            return *this;
        }
        auto keep = [&](const typename Traits::entry_type& entry) { return pred(entry.key); };
        return finish(pyhamt::filter(Level::top(), root(), keep));
    }

    // Set operations
    PersistentHashSet intersection(const PersistentHashSet& other) const {
        if (empty() || other.empty()) {
            return PersistentHashSet();
        }
        return finish(intersect(Level::top(), root(), other.root().get()));
    }

    PersistentHashSet union_(const PersistentHashSet& other) const {
        if (other.empty()) return *this;
        if (empty()) return other;
        return finish(unite(Level::top(), root(), other.root()));
    }

    PersistentHashSet symmetricDifference(const PersistentHashSet& other) const {
        // (A - B) ∪ (B - A)
        return subtracting(other).union_(other.subtracting(*this));
    }

    // Set predicates
    bool isSubset(const PersistentHashSet& other) const {
        // All elements of this must be in other
        if (size() > other.size()) return false;
        if (root() == other.root()) return true;

        for (const auto& elem : *this) {
            if (!other.contains(elem)) {
                return false;
            }
        }
        return true;
    }

    bool isSuperset(const PersistentHashSet& other) const {
        return other.isSubset(*this);
    }

    bool isDisjoint(const PersistentHashSet& other) const {
        // No elements in common
        if (empty() || other.empty()) return true;
        if (root() == other.root()) return false;

        const PersistentHashSet& smaller = (size() <= other.size()) ? *this : other;
        const PersistentHashSet& larger = (size() <= other.size()) ? other : *this;
        for (const auto& elem : smaller) {
            if (larger.contains(elem)) {
                return false;
            }
        }
        return true;
    }

    // Equality
    bool operator==(const PersistentHashSet& other) const { return map_ == other.map_; }
    bool operator!=(const PersistentHashSet& other) const { return !(*this == other); }
};

}  // namespace pyhamt
