#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>
#include "hash_path.hpp"

namespace pyhamt {

// Payload of set entries
struct Unit {
    bool operator==(const Unit&) const { return true; }
    bool operator!=(const Unit&) const { return false; }
};

// Entry structure for key-value pairs
template <typename K, typename V>
struct Entry {
    K key;
    V value;

    Entry(const K& k, const V& v) : key(k), value(v) {}
};

/**
 * HamtTraits - bundles the key/value types and the hashing and equality
 * functors a trie is instantiated with. Only keys take part in placement.
 */
template <typename K, typename V,
          typename Hash = std::hash<K>,
          typename KeyEqual = std::equal_to<K>,
          typename ValueEqual = std::equal_to<V>>
struct HamtTraits {
    using key_type = K;
    using mapped_type = V;
    using hasher = Hash;
    using key_equal = KeyEqual;
    using value_equal = ValueEqual;
    using entry_type = Entry<K, V>;

    static uint64_t hashOf(const K& key) {
        return static_cast<uint64_t>(Hash{}(key));
    }

    static bool keysEqual(const K& k1, const K& k2) {
        return KeyEqual{}(k1, k2);
    }

    static bool valuesEqual(const V& v1, const V& v2) {
        return ValueEqual{}(v1, v2);
    }
};

// Process-wide node allocation counter
struct NodeStats {
    static std::atomic<uint64_t>& counter() {
        static std::atomic<uint64_t> allocations{0};
        return allocations;
    }

    static uint64_t allocations() {
        return counter().load(std::memory_order_relaxed);
    }
};

// Forward declarations
template <typename Traits> class NodeBase;
template <typename Traits> class BitmapNode;
template <typename Traits> class CollisionNode;

/**
 * NodePtr - owning handle over the intrusive reference count of a node.
 *
 * A freshly allocated node starts with refcount 0; wrapping it in a NodePtr
 * takes the first reference.
 */
template <typename Traits>
class NodePtr {
private:
    NodeBase<Traits>* node_;

public:
    NodePtr() : node_(nullptr) {}

    explicit NodePtr(NodeBase<Traits>* node) : node_(node) {
        if (node_) node_->addRef();
    }

    NodePtr(const NodePtr& other) : node_(other.node_) {
        if (node_) node_->addRef();
    }

    NodePtr(NodePtr&& other) noexcept : node_(other.node_) {
        other.node_ = nullptr;
    }

    ~NodePtr() {
        if (node_) node_->release();
    }

    NodePtr& operator=(const NodePtr& other) {
        if (this != &other) {
            if (other.node_) other.node_->addRef();
            if (node_) node_->release();
            node_ = other.node_;
        }
        return *this;
    }

    NodePtr& operator=(NodePtr&& other) noexcept {
        if (this != &other) {
            if (node_) node_->release();
            node_ = other.node_;
            other.node_ = nullptr;
        }
        return *this;
    }

    void reset() {
        if (node_) node_->release();
        node_ = nullptr;
    }

    NodeBase<Traits>* get() const { return node_; }
    NodeBase<Traits>* operator->() const { return node_; }
    NodeBase<Traits>& operator*() const { return *node_; }
    explicit operator bool() const { return node_ != nullptr; }

    // Only this handle refers to the node, so it may be edited in place
    bool isUnique() const { return node_ != nullptr && node_->getRefCount() == 1; }

    friend bool operator==(const NodePtr& a, const NodePtr& b) { return a.node_ == b.node_; }
    friend bool operator!=(const NodePtr& a, const NodePtr& b) { return a.node_ != b.node_; }
};

// Abstract base class for all node types with intrusive reference counting
template <typename Traits>
class NodeBase {
protected:
    mutable std::atomic<uint32_t> refcount_;
    size_t count_;  // entries in this subtree

public:
    using key_type = typename Traits::key_type;
    using entry_type = typename Traits::entry_type;

    explicit NodeBase(size_t count) : refcount_(0), count_(count) {
        NodeStats::counter().fetch_add(1, std::memory_order_relaxed);
    }
    NodeBase(const NodeBase&) = delete;
    NodeBase& operator=(const NodeBase&) = delete;
    virtual ~NodeBase() = default;

    // Reference counting
    void addRef() const {
        refcount_.fetch_add(1, std::memory_order_relaxed);
    }

    void release() const {
        if (refcount_.fetch_sub(1, std::memory_order_release) == 1) {
            std::atomic_thread_fence(std::memory_order_acquire);
            delete this;
        }
    }

    uint32_t getRefCount() const {
        return refcount_.load(std::memory_order_acquire);
    }

    size_t count() const { return count_; }

    virtual bool isCollision() const = 0;

    virtual const entry_type* find(HashPath path, const key_type& key) const = 0;

    virtual void iterate(const std::function<void(const entry_type&)>& callback) const = 0;

    // Some entry of the subtree; used to fold a single-entry child into its parent
    virtual const entry_type& anyEntry() const = 0;

    // Shallow copy for copy-on-write; children are shared with the original
    virtual NodeBase* clone() const = 0;
};

// BitmapNode: Main HAMT node using bitmap indexing
template <typename Traits>
class BitmapNode : public NodeBase<Traits> {
public:
    using Base = NodeBase<Traits>;
    using key_type = typename Traits::key_type;
    using entry_type = typename Traits::entry_type;
    using Ptr = NodePtr<Traits>;

private:
    uint32_t dataMap_;   // slots holding an inline entry
    uint32_t childMap_;  // slots holding a child node
    std::vector<entry_type> entries_;
    std::vector<Ptr> children_;

    static size_t countOf(const std::vector<entry_type>& entries, const std::vector<Ptr>& children) {
        size_t count = entries.size();
        for (const auto& child : children) {
            count += child->count();
        }
        return count;
    }

public:
    BitmapNode() : Base(0), dataMap_(0), childMap_(0) {}

    BitmapNode(uint32_t dataMap, uint32_t childMap,
               std::vector<entry_type> entries, std::vector<Ptr> children)
        : Base(countOf(entries, children)),
          dataMap_(dataMap), childMap_(childMap),
          entries_(std::move(entries)), children_(std::move(children)) {}

    bool isCollision() const override { return false; }

    const entry_type* find(HashPath path, const key_type& key) const override {
        uint32_t bit = bitFor(path.chunk());

        if (dataMap_ & bit) {
            const entry_type& entry = entries_[indexFor(dataMap_, bit)];
            return Traits::keysEqual(entry.key, key) ? &entry : nullptr;
        }
        if (childMap_ & bit) {
            return children_[indexFor(childMap_, bit)]->find(path.descend(), key);
        }
        return nullptr;
    }

    void iterate(const std::function<void(const entry_type&)>& callback) const override {
        for (const auto& entry : entries_) {
            callback(entry);
        }
        for (const auto& child : children_) {
            child->iterate(callback);
        }
    }

    const entry_type& anyEntry() const override {
        return entries_.empty() ? children_.front()->anyEntry() : entries_.front();
    }

    Base* clone() const override {
        return new BitmapNode(dataMap_, childMap_, entries_, children_);
    }

    uint32_t dataMap() const { return dataMap_; }
    uint32_t childMap() const { return childMap_; }
    const std::vector<entry_type>& entries() const { return entries_; }
    const std::vector<Ptr>& children() const { return children_; }

    const entry_type& entryAt(uint32_t bit) const { return entries_[indexFor(dataMap_, bit)]; }
    const Ptr& childAt(uint32_t bit) const { return children_[indexFor(childMap_, bit)]; }

    // In-place edits; only valid while the node is uniquely owned

    void insertEntry(uint32_t bit, entry_type entry) {
        entries_.insert(entries_.begin() + indexFor(dataMap_, bit), std::move(entry));
        dataMap_ |= bit;
        this->count_ += 1;
    }

    void eraseEntry(uint32_t bit) {
        entries_.erase(entries_.begin() + indexFor(dataMap_, bit));
        dataMap_ &= ~bit;
        this->count_ -= 1;
    }

    void replaceEntry(uint32_t bit, entry_type entry) {
        entries_[indexFor(dataMap_, bit)] = std::move(entry);
    }

    void insertChild(uint32_t bit, Ptr child) {
        this->count_ += child->count();
        children_.insert(children_.begin() + indexFor(childMap_, bit), std::move(child));
        childMap_ |= bit;
    }

    void eraseChild(uint32_t bit) {
        auto it = children_.begin() + indexFor(childMap_, bit);
        this->count_ -= (*it)->count();
        children_.erase(it);
        childMap_ &= ~bit;
    }

    Ptr& mutableChild(uint32_t bit) { return children_[indexFor(childMap_, bit)]; }

    // Re-sync the cached count after a child was edited through mutableChild()
    void childResized(size_t before, size_t after) {
        this->count_ = this->count_ - before + after;
    }
};

// CollisionNode: Handles hash collisions when multiple keys have the same hash
template <typename Traits>
class CollisionNode : public NodeBase<Traits> {
public:
    using Base = NodeBase<Traits>;
    using key_type = typename Traits::key_type;
    using entry_type = typename Traits::entry_type;

private:
    uint64_t hash_;
    std::vector<entry_type> entries_;

public:
    CollisionNode(uint64_t hash, std::vector<entry_type> entries)
        : Base(entries.size()), hash_(hash), entries_(std::move(entries)) {}

    bool isCollision() const override { return true; }

    const entry_type* find(HashPath path, const key_type& key) const override {
        if (path.hash() != hash_) {
            return nullptr;
        }
        for (const auto& entry : entries_) {
            if (Traits::keysEqual(entry.key, key)) {
                return &entry;
            }
        }
        return nullptr;
    }

    void iterate(const std::function<void(const entry_type&)>& callback) const override {
        for (const auto& entry : entries_) {
            callback(entry);
        }
    }

    const entry_type& anyEntry() const override { return entries_.front(); }

    Base* clone() const override { return new CollisionNode(hash_, entries_); }

    uint64_t hash() const { return hash_; }
    const std::vector<entry_type>& entries() const { return entries_; }

    // In-place edits; only valid while the node is uniquely owned

    void append(entry_type entry) {
        entries_.push_back(std::move(entry));
        this->count_ += 1;
    }

    void eraseAt(size_t index) {
        entries_.erase(entries_.begin() + index);
        this->count_ -= 1;
    }

    void replaceAt(size_t index, entry_type entry) {
        entries_[index] = std::move(entry);
    }
};

//=============================================================================
// Point operations
//=============================================================================

// Make `node` safe to edit in place, copying it if anyone else holds it
template <typename Traits>
void ensureUnique(NodePtr<Traits>& node) {
    if (!node.isUnique()) {
        node = NodePtr<Traits>(node->clone());
    }
}

// Helper to create a subtree holding two entries with different keys
template <typename Traits>
NodePtr<Traits> makeNode(Level level,
                         const typename Traits::entry_type& entry1, uint64_t hash1,
                         const typename Traits::entry_type& entry2, uint64_t hash2) {
    using entry_type = typename Traits::entry_type;

    if (level.isExhausted()) {
        // Too deep, use collision node
        std::vector<entry_type> entries;
        entries.push_back(entry1);
        entries.push_back(entry2);
        return NodePtr<Traits>(new CollisionNode<Traits>(hash1, std::move(entries)));
    }

    uint32_t idx1 = level.bucket(hash1);
    uint32_t idx2 = level.bucket(hash2);

    if (idx1 == idx2) {
        // Same index at this level, recurse deeper
        std::vector<NodePtr<Traits>> children;
        children.push_back(makeNode<Traits>(level.descend(), entry1, hash1, entry2, hash2));
        return NodePtr<Traits>(new BitmapNode<Traits>(0, bitFor(idx1), {}, std::move(children)));
    }

    // Different indices, create node with both entries
    std::vector<entry_type> entries;
    if (idx1 < idx2) {
        entries.push_back(entry1);
        entries.push_back(entry2);
    } else {
        entries.push_back(entry2);
        entries.push_back(entry1);
    }
    return NodePtr<Traits>(new BitmapNode<Traits>(bitFor(idx1) | bitFor(idx2), 0,
                                                  std::move(entries), {}));
}

namespace detail {

template <typename Traits>
bool insertUnique(NodePtr<Traits>& node, HashPath path,
                  const typename Traits::entry_type& entry, bool replace) {
    if (path.isExhausted()) {
        auto* collision = static_cast<CollisionNode<Traits>*>(node.get());
        const auto& entries = collision->entries();
        for (size_t i = 0; i < entries.size(); ++i) {
            if (Traits::keysEqual(entries[i].key, entry.key)) {
                if (!replace) return false;
                collision->replaceAt(i, entry);
                return true;
            }
        }
        collision->append(entry);
        return true;
    }

    auto* bitmap = static_cast<BitmapNode<Traits>*>(node.get());
    uint32_t bit = bitFor(path.chunk());

    if (bitmap->dataMap() & bit) {
        const auto& existing = bitmap->entryAt(bit);
        if (Traits::keysEqual(existing.key, entry.key)) {
            if (!replace) return false;
            bitmap->replaceEntry(bit, entry);
            return true;
        }

        // Different key, same slot - push both one level down
        NodePtr<Traits> child = makeNode<Traits>(path.level().descend(),
                                                 existing, Traits::hashOf(existing.key),
                                                 entry, path.hash());
        bitmap->eraseEntry(bit);
        bitmap->insertChild(bit, std::move(child));
        return true;
    }

    if (bitmap->childMap() & bit) {
        NodePtr<Traits>& child = bitmap->mutableChild(bit);
        size_t before = child->count();
        ensureUnique(child);
        bool changed = insertUnique(child, path.descend(), entry, replace);
        bitmap->childResized(before, child->count());
        return changed;
    }

    bitmap->insertEntry(bit, entry);
    return true;
}

// Removes a key known to be present below `node`
template <typename Traits>
void removeUnique(NodePtr<Traits>& node, HashPath path, const typename Traits::key_type& key) {
    if (path.isExhausted()) {
        auto* collision = static_cast<CollisionNode<Traits>*>(node.get());
        const auto& entries = collision->entries();
        for (size_t i = 0; i < entries.size(); ++i) {
            if (Traits::keysEqual(entries[i].key, key)) {
                collision->eraseAt(i);
                return;
            }
        }
        return;
    }

    auto* bitmap = static_cast<BitmapNode<Traits>*>(node.get());
    uint32_t bit = bitFor(path.chunk());

    if (bitmap->dataMap() & bit) {
        bitmap->eraseEntry(bit);
        return;
    }

    NodePtr<Traits>& child = bitmap->mutableChild(bit);
    size_t before = child->count();
    ensureUnique(child);
    removeUnique(child, path.descend(), key);
    bitmap->childResized(before, child->count());

    if (child->count() == 1) {
        // Fold the last entry of the child back into this node
        typename Traits::entry_type last = child->anyEntry();
        bitmap->eraseChild(bit);
        bitmap->insertEntry(bit, std::move(last));
    }
}

}  // namespace detail

/**
 * Insert `entry` into the subtree rooted at `node`, editing in place where
 * the path is uniquely owned and copying it otherwise. `path` is the hash of
 * `entry.key` consumed down to the level of `node`.
 *
 * Returns false (and leaves `node` untouched, with no allocation) when the
 * key is already present and `replace` is false.
 */
template <typename Traits>
bool insert(NodePtr<Traits>& node, HashPath path,
            const typename Traits::entry_type& entry, bool replace) {
    if (!node) {
        std::vector<typename Traits::entry_type> entries;
        entries.push_back(entry);
        node = NodePtr<Traits>(new BitmapNode<Traits>(bitFor(path.chunk()), 0,
                                                      std::move(entries), {}));
        return true;
    }

    if (!replace && node->find(path, entry.key) != nullptr) {
        return false;
    }

    ensureUnique(node);
    return detail::insertUnique(node, path, entry, replace);
}

/**
 * Remove `key` from the subtree rooted at `node`.
 *
 * Returns false when the key is absent; `node` is then left pointing at the
 * same allocation. A node emptied by the removal becomes null. A
 * single-entry child left behind is folded into its parent.
 */
template <typename Traits>
bool remove(NodePtr<Traits>& node, HashPath path, const typename Traits::key_type& key) {
    if (!node || node->find(path, key) == nullptr) {
        return false;
    }

    ensureUnique(node);
    detail::removeUnique(node, path, key);

    if (node->count() == 0) {
        node.reset();
    }
    return true;
}

}  // namespace pyhamt
