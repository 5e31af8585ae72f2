#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <vector>
#include "node.hpp"
#include "node_builder.hpp"

namespace pyhamt {

/**
 * Structural set algebra over two tries.
 *
 * Every operation walks both tries level by level, slot by slot. A result of
 * std::nullopt means "no change": the caller keeps its own node by
 * reference. Otherwise the returned builder holds the edits for this level
 * and still has to be finalized.
 *
 * Operands at the same position of two tries always sit at the same level,
 * so they are both bitmap nodes or both collision nodes.
 */

namespace detail {

template <typename Traits, typename OtherTraits>
void requireCompatible() {
    static_assert(std::is_same<typename Traits::key_type, typename OtherTraits::key_type>::value,
                  "tries must share the key type");
    static_assert(std::is_same<typename Traits::hasher, typename OtherTraits::hasher>::value,
                  "tries must share the hash function");
    static_assert(std::is_same<typename Traits::key_equal, typename OtherTraits::key_equal>::value,
                  "tries must share the key equality");
}

template <typename Traits, typename OtherTraits>
bool sameNode(const NodeBase<Traits>* a, const NodeBase<OtherTraits>* b) {
    return static_cast<const void*>(a) == static_cast<const void*>(b);
}

template <typename Traits>
uint32_t occupied(const BitmapNode<Traits>* node) {
    return node->dataMap() | node->childMap();
}

}  // namespace detail

//=============================================================================
// Subtraction
//=============================================================================

/**
 * Remove from `self` every key stored in `other`.
 *
 * Per slot:
 *  - only in self: kept as is; only in other: nothing to do
 *  - entry/entry: removed when the keys are equal
 *  - entry/child: removed when a lookup finds the key in the other child
 *  - child/entry: the single key is removed from the child
 *  - child/child: recursion
 * The same node on both sides subtracts to nothing without descending.
 */
template <typename Traits, typename OtherTraits>
std::optional<NodeBuilder<Traits>> subtract(Level level, const NodePtr<Traits>& self,
                                            const NodeBase<OtherTraits>* other) {
    detail::requireCompatible<Traits, OtherTraits>();
    using Builder = NodeBuilder<Traits>;
    using entry_type = typename Traits::entry_type;

    if (detail::sameNode(self.get(), other)) {
        return Builder::empty(level);
    }

    if (level.isExhausted()) {
        const auto* mine = static_cast<const CollisionNode<Traits>*>(self.get());
        const auto* theirs = static_cast<const CollisionNode<OtherTraits>*>(other);
        if (mine->hash() != theirs->hash()) {
            return std::nullopt;
        }

        std::vector<entry_type> survivors;
        for (const auto& entry : mine->entries()) {
            if (theirs->find(HashPath(mine->hash(), level), entry.key) == nullptr) {
                survivors.push_back(entry);
            }
        }
        if (survivors.size() == mine->entries().size()) {
            return std::nullopt;
        }
        return Builder::collision(level, mine->hash(), std::move(survivors));
    }

    const auto* mine = static_cast<const BitmapNode<Traits>*>(self.get());
    const auto* theirs = static_cast<const BitmapNode<OtherTraits>*>(other);

    std::optional<Builder> builder;
    auto edit = [&]() -> Builder& {
        if (!builder) builder.emplace(Builder::fromExisting(level, self));
        return *builder;
    };

    uint32_t shared = detail::occupied(mine) & detail::occupied(theirs);
    for (uint32_t bucket = 0; shared != 0 && bucket < MAX_BITMAP_SIZE; ++bucket) {
        uint32_t bit = bitFor(bucket);
        if ((shared & bit) == 0) continue;
        shared &= ~bit;

        if (mine->dataMap() & bit) {
            const entry_type& entry = mine->entryAt(bit);
            if (theirs->dataMap() & bit) {
                if (Traits::keysEqual(entry.key, theirs->entryAt(bit).key)) {
                    edit().removeSlot(bucket);
                }
            } else {
                HashPath path(Traits::hashOf(entry.key), level.descend());
                if (theirs->childAt(bit)->find(path, entry.key) != nullptr) {
                    edit().removeSlot(bucket);
                }
            }
            continue;
        }

        const NodePtr<Traits>& child = mine->childAt(bit);
        if (theirs->dataMap() & bit) {
            const auto& key = theirs->entryAt(bit).key;
            NodePtr<Traits> updated = child;
            if (remove(updated, HashPath(Traits::hashOf(key), level.descend()), key)) {
                edit().replaceChild(bucket, std::move(updated));
            }
        } else {
            auto result = subtract(level.descend(), child, theirs->childAt(bit).get());
            if (result) {
                edit().replaceChild(bucket, result->finalize(level.descend()));
            }
        }
    }
    return builder;
}

//=============================================================================
// Intersection
//=============================================================================

// Keep only the keys of `self` that are also stored in `other`
template <typename Traits>
std::optional<NodeBuilder<Traits>> intersect(Level level, const NodePtr<Traits>& self,
                                             const NodeBase<Traits>* other) {
    using Builder = NodeBuilder<Traits>;
    using entry_type = typename Traits::entry_type;

    if (detail::sameNode(self.get(), other)) {
        return std::nullopt;
    }

    if (level.isExhausted()) {
        const auto* mine = static_cast<const CollisionNode<Traits>*>(self.get());
        const auto* theirs = static_cast<const CollisionNode<Traits>*>(other);

        std::vector<entry_type> survivors;
        if (mine->hash() == theirs->hash()) {
            for (const auto& entry : mine->entries()) {
                if (theirs->find(HashPath(mine->hash(), level), entry.key) != nullptr) {
                    survivors.push_back(entry);
                }
            }
        }
        if (survivors.size() == mine->entries().size()) {
            return std::nullopt;
        }
        return Builder::collision(level, mine->hash(), std::move(survivors));
    }

    const auto* mine = static_cast<const BitmapNode<Traits>*>(self.get());
    const auto* theirs = static_cast<const BitmapNode<Traits>*>(other);

    std::optional<Builder> builder;
    auto edit = [&]() -> Builder& {
        if (!builder) builder.emplace(Builder::fromExisting(level, self));
        return *builder;
    };

    uint32_t remaining = detail::occupied(mine);
    for (uint32_t bucket = 0; remaining != 0 && bucket < MAX_BITMAP_SIZE; ++bucket) {
        uint32_t bit = bitFor(bucket);
        if ((remaining & bit) == 0) continue;
        remaining &= ~bit;

        if ((detail::occupied(theirs) & bit) == 0) {
            edit().removeSlot(bucket);
            continue;
        }

        if (mine->dataMap() & bit) {
            const entry_type& entry = mine->entryAt(bit);
            bool found;
            if (theirs->dataMap() & bit) {
                found = Traits::keysEqual(entry.key, theirs->entryAt(bit).key);
            } else {
                HashPath path(Traits::hashOf(entry.key), level.descend());
                found = theirs->childAt(bit)->find(path, entry.key) != nullptr;
            }
            if (!found) {
                edit().removeSlot(bucket);
            }
            continue;
        }

        const NodePtr<Traits>& child = mine->childAt(bit);
        if (theirs->dataMap() & bit) {
            // At most the other entry survives; keep our own copy of it
            const auto& key = theirs->entryAt(bit).key;
            const entry_type* kept = child->find(HashPath(Traits::hashOf(key), level.descend()), key);
            if (kept != nullptr) {
                entry_type survivor = *kept;
                edit().removeSlot(bucket);
                edit().insert(bucket, std::move(survivor));
            } else {
                edit().removeSlot(bucket);
            }
        } else {
            auto result = intersect(level.descend(), child, theirs->childAt(bit).get());
            if (result) {
                edit().replaceChild(bucket, result->finalize(level.descend()));
            }
        }
    }
    return builder;
}

//=============================================================================
// Union
//=============================================================================

// Add the keys of `other` missing from `self`; entries of `self` win
template <typename Traits>
std::optional<NodeBuilder<Traits>> unite(Level level, const NodePtr<Traits>& self,
                                         const NodePtr<Traits>& other) {
    using Builder = NodeBuilder<Traits>;
    using entry_type = typename Traits::entry_type;

    if (self == other) {
        return std::nullopt;
    }

    if (level.isExhausted()) {
        const auto* mine = static_cast<const CollisionNode<Traits>*>(self.get());
        const auto* theirs = static_cast<const CollisionNode<Traits>*>(other.get());

        std::vector<entry_type> merged = mine->entries();
        for (const auto& entry : theirs->entries()) {
            if (mine->find(HashPath(theirs->hash(), level), entry.key) == nullptr) {
                merged.push_back(entry);
            }
        }
        if (merged.size() == mine->entries().size()) {
            return std::nullopt;
        }
        return Builder::collision(level, mine->hash(), std::move(merged));
    }

    const auto* mine = static_cast<const BitmapNode<Traits>*>(self.get());
    const auto* theirs = static_cast<const BitmapNode<Traits>*>(other.get());

    std::optional<Builder> builder;
    auto edit = [&]() -> Builder& {
        if (!builder) builder.emplace(Builder::fromExisting(level, self));
        return *builder;
    };

    uint32_t remaining = detail::occupied(theirs);
    for (uint32_t bucket = 0; remaining != 0 && bucket < MAX_BITMAP_SIZE; ++bucket) {
        uint32_t bit = bitFor(bucket);
        if ((remaining & bit) == 0) continue;
        remaining &= ~bit;

        if ((detail::occupied(mine) & bit) == 0) {
            // Link the other side's slot in as is
            if (theirs->dataMap() & bit) {
                edit().insert(bucket, theirs->entryAt(bit));
            } else {
                edit().insertChild(bucket, theirs->childAt(bit));
            }
            continue;
        }

        if (mine->dataMap() & bit) {
            const entry_type& entry = mine->entryAt(bit);
            uint64_t hash = Traits::hashOf(entry.key);
            NodePtr<Traits> child;
            if (theirs->dataMap() & bit) {
                const entry_type& otherEntry = theirs->entryAt(bit);
                if (Traits::keysEqual(entry.key, otherEntry.key)) {
                    continue;
                }
                child = makeNode<Traits>(level.descend(), entry, hash,
                                         otherEntry, Traits::hashOf(otherEntry.key));
            } else {
                child = theirs->childAt(bit);
                insert(child, HashPath(hash, level.descend()), entry, true);
            }
            edit().removeSlot(bucket);
            edit().insertChild(bucket, std::move(child));
            continue;
        }

        const NodePtr<Traits>& child = mine->childAt(bit);
        if (theirs->dataMap() & bit) {
            const entry_type& otherEntry = theirs->entryAt(bit);
            NodePtr<Traits> updated = child;
            HashPath path(Traits::hashOf(otherEntry.key), level.descend());
            if (insert(updated, path, otherEntry, false)) {
                edit().replaceChild(bucket, std::move(updated));
            }
        } else {
            auto result = unite(level.descend(), child, theirs->childAt(bit));
            if (result) {
                edit().replaceChild(bucket, result->finalize(level.descend()));
            }
        }
    }
    return builder;
}

//=============================================================================
// Filter
//=============================================================================

// Keep the entries of `self` for which `keep` returns true
template <typename Traits, typename Predicate>
std::optional<NodeBuilder<Traits>> filter(Level level, const NodePtr<Traits>& self,
                                          Predicate& keep) {
    using Builder = NodeBuilder<Traits>;
    using entry_type = typename Traits::entry_type;

    if (level.isExhausted()) {
        const auto* mine = static_cast<const CollisionNode<Traits>*>(self.get());
        std::vector<entry_type> survivors;
        for (const auto& entry : mine->entries()) {
            if (keep(entry)) {
                survivors.push_back(entry);
            }
        }
        if (survivors.size() == mine->entries().size()) {
            return std::nullopt;
        }
        return Builder::collision(level, mine->hash(), std::move(survivors));
    }

    const auto* mine = static_cast<const BitmapNode<Traits>*>(self.get());

    std::optional<Builder> builder;
    auto edit = [&]() -> Builder& {
        if (!builder) builder.emplace(Builder::fromExisting(level, self));
        return *builder;
    };

    uint32_t remaining = detail::occupied(mine);
    for (uint32_t bucket = 0; remaining != 0 && bucket < MAX_BITMAP_SIZE; ++bucket) {
        uint32_t bit = bitFor(bucket);
        if ((remaining & bit) == 0) continue;
        remaining &= ~bit;

        if (mine->dataMap() & bit) {
            if (!keep(mine->entryAt(bit))) {
                edit().removeSlot(bucket);
            }
        } else {
            auto result = filter(level.descend(), mine->childAt(bit), keep);
            if (result) {
                edit().replaceChild(bucket, result->finalize(level.descend()));
            }
        }
    }
    return builder;
}

}  // namespace pyhamt
