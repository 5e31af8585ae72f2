#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include "debug_log.hpp"
#include "node.hpp"

namespace pyhamt {

// Raised when a trie reached through the engine is structurally corrupt
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

namespace detail {

[[noreturn]] inline void invariantFailed(Level level, const std::string& what) {
    std::ostringstream oss;
    oss << "trie invariant violated at depth " << level.depth() << ": " << what;
    debug::log("invariant: ", oss.str());
    throw InvariantViolation(oss.str());
}

// Returns the number of entries below `node`
template <typename Traits>
size_t checkNode(const NodeBase<Traits>* node, Level level, uint64_t path, bool isRoot) {
    if (node == nullptr) {
        invariantFailed(level, "null child link");
    }
    if (level.depth() > MAX_DEPTH) {
        invariantFailed(level, "trie deeper than the hash allows");
    }
    if (node->isCollision() != level.isExhausted()) {
        invariantFailed(level, node->isCollision() ? "collision node above the exhausted level"
                                                   : "bitmap node below the exhausted level");
    }

    if (node->isCollision()) {
        const auto* collision = static_cast<const CollisionNode<Traits>*>(node);
        const auto& entries = collision->entries();
        if (entries.size() < 2) {
            invariantFailed(level, "collision node with fewer than two entries");
        }
        if (level.prefix(collision->hash()) != path) {
            invariantFailed(level, "collision hash does not match its position");
        }
        for (size_t i = 0; i < entries.size(); ++i) {
            if (Traits::hashOf(entries[i].key) != collision->hash()) {
                invariantFailed(level, "collision entry with a different hash");
            }
            for (size_t j = i + 1; j < entries.size(); ++j) {
                if (Traits::keysEqual(entries[i].key, entries[j].key)) {
                    invariantFailed(level, "duplicate key in collision node");
                }
            }
        }
        if (node->count() != entries.size()) {
            invariantFailed(level, "collision node count out of sync");
        }
        return entries.size();
    }

    const auto* bitmap = static_cast<const BitmapNode<Traits>*>(node);
    uint32_t dataMap = bitmap->dataMap();
    uint32_t childMap = bitmap->childMap();

    if (dataMap & childMap) {
        invariantFailed(level, "slot marked as both entry and child");
    }
    if (popcount(dataMap) != bitmap->entries().size()) {
        invariantFailed(level, "data bitmap does not match entry count");
    }
    if (popcount(childMap) != bitmap->children().size()) {
        invariantFailed(level, "child bitmap does not match child count");
    }

    size_t total = 0;
    uint32_t bucket = 0;
    for (size_t i = 0; i < bitmap->entries().size(); ++i, ++bucket) {
        while ((dataMap & bitFor(bucket)) == 0) ++bucket;
        uint64_t hash = Traits::hashOf(bitmap->entries()[i].key);
        if (level.prefix(hash) != path || level.bucket(hash) != bucket) {
            invariantFailed(level, "entry stored outside its hash slot");
        }
        ++total;
    }

    bucket = 0;
    for (size_t i = 0; i < bitmap->children().size(); ++i, ++bucket) {
        while ((childMap & bitFor(bucket)) == 0) ++bucket;
        uint64_t childPath = path | (uint64_t(bucket) << level.shift());
        total += checkNode(bitmap->children()[i].get(), level.descend(), childPath, false);
    }

    if (node->count() != total) {
        invariantFailed(level, "cached subtree count out of sync");
    }
    if (!isRoot && total < 2) {
        invariantFailed(level, "non-root node with fewer than two entries");
    }
    if (isRoot && total == 0) {
        invariantFailed(level, "empty root node instead of a null root");
    }
    return total;
}

}  // namespace detail

/**
 * Recursively validate a whole trie: bitmap/array agreement, slot placement
 * of every entry, cached counts, collision buckets only at the exhausted
 * level with at least two distinct entries, and no non-root node below two
 * entries. Throws InvariantViolation on the first defect found.
 */
template <typename Traits>
void fullInvariantCheck(const NodePtr<Traits>& root) {
    if (!root) return;
    detail::checkNode(root.get(), Level::top(), 0, true);
}

}  // namespace pyhamt
