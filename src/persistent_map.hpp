#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <utility>
#include "node.hpp"
#include "node_iterator.hpp"

namespace pyhamt {

/**
 * MapKeysView - the keys of a persistent map, sharing its trie.
 *
 * Exposes the underlying root so that set algebra can combine a set with the
 * keys of a map node by node, without the map's values taking part.
 */
template <typename Traits>
class MapKeysView {
public:
    using key_type = typename Traits::key_type;
    using value_type = key_type;
    using const_iterator = KeyIterator<Traits>;
    using iterator = const_iterator;

private:
    NodePtr<Traits> root_;

public:
    explicit MapKeysView(NodePtr<Traits> root) : root_(std::move(root)) {}

    const NodePtr<Traits>& root() const { return root_; }

    size_t size() const { return root_ ? root_->count() : 0; }
    bool empty() const { return !root_; }

    bool contains(const key_type& key) const {
        return root_ && root_->find(HashPath::top(Traits::hashOf(key)), key) != nullptr;
    }

    const_iterator begin() const { return const_iterator(NodeIterator<Traits>(root_.get())); }
    const_iterator end() const { return const_iterator(); }
};

/**
 * PersistentHashMap - Immutable hash map over a hash array mapped trie.
 *
 * - O(log32 n) assoc, dissoc and lookups
 * - Structural sharing between versions
 * - Copy-on-write: a new version copies only the path it changes
 *
 * An empty map has a null root.
 */
template <typename K, typename V,
          typename Hash = std::hash<K>,
          typename KeyEqual = std::equal_to<K>,
          typename ValueEqual = std::equal_to<V>>
class PersistentHashMap {
public:
    using Traits = HamtTraits<K, V, Hash, KeyEqual, ValueEqual>;
    using key_type = K;
    using mapped_type = V;
    using entry_type = typename Traits::entry_type;
    using value_type = entry_type;
    using Ptr = NodePtr<Traits>;
    using const_iterator = NodeIterator<Traits>;
    using iterator = const_iterator;
    using Keys = MapKeysView<Traits>;

private:
    Ptr root_;

    explicit PersistentHashMap(Ptr root) : root_(std::move(root)) {}

public:
    PersistentHashMap() = default;

    PersistentHashMap(std::initializer_list<std::pair<K, V>> init) {
        for (const auto& kv : init) {
            insert(root_, HashPath::top(Traits::hashOf(kv.first)), entry_type(kv.first, kv.second), true);
        }
    }

    // Wrap an already validated root
    static PersistentHashMap fromNewRoot(Ptr root) {
        return PersistentHashMap(std::move(root));
    }

    const Ptr& root() const { return root_; }

    // Core operations (functional style)

    PersistentHashMap assoc(const K& key, const V& val) const {
        Ptr root = root_;
        insert(root, HashPath::top(Traits::hashOf(key)), entry_type(key, val), true);
        return PersistentHashMap(std::move(root));
    }

    PersistentHashMap dissoc(const K& key) const {
        Ptr root = root_;
        if (!remove(root, HashPath::top(Traits::hashOf(key)), key)) {
            // Key not found
            return *this;
        }
        return PersistentHashMap(std::move(root));
    }

    const V* find(const K& key) const {
        if (!root_) return nullptr;
        const entry_type* entry = root_->find(HashPath::top(Traits::hashOf(key)), key);
        return entry ? &entry->value : nullptr;
    }

    std::optional<V> get(const K& key) const {
        const V* value = find(key);
        if (value == nullptr) return std::nullopt;
        return *value;
    }

    bool contains(const K& key) const {
        return find(key) != nullptr;
    }

    // Size
    size_t size() const { return root_ ? root_->count() : 0; }
    bool empty() const { return !root_; }

    // Iteration
    const_iterator begin() const { return const_iterator(root_.get()); }
    const_iterator end() const { return const_iterator(); }

    Keys keys() const { return Keys(root_); }

    // Equality
    bool operator==(const PersistentHashMap& other) const {
        if (size() != other.size()) {
            return false;
        }
        if (root_ == other.root_) {
            return true;
        }
        for (const auto& entry : *this) {
            const V* otherVal = other.find(entry.key);
            if (otherVal == nullptr || !Traits::valuesEqual(entry.value, *otherVal)) {
                return false;
            }
        }
        return true;
    }

    bool operator!=(const PersistentHashMap& other) const { return !(*this == other); }
};

}  // namespace pyhamt
