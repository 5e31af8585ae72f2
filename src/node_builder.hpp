#pragma once

#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>
#include "debug_log.hpp"
#include "node.hpp"

namespace pyhamt {

/**
 * NodeBuilder - transient staging area for the edits of one trie level.
 *
 * A builder starts out referencing its source node. The first edit detaches
 * it: the slot arrays are copied, so the source node is never changed.
 * Edits address slots by their bucket index at the builder's level.
 *
 * finalize() produces the immutable node exactly once:
 * - every child left with a single entry is folded back into an inline
 *   entry of this level, and the bitmaps follow the final occupied slots,
 * - an empty result finalizes to a null node.
 *
 * At an exhausted level the builder stages the entries of a collision node
 * instead of slots.
 */
template <typename Traits>
class NodeBuilder {
public:
    using entry_type = typename Traits::entry_type;
    using Ptr = NodePtr<Traits>;

private:
    Level level_;
    Ptr source_;        // referenced until the first edit
    bool detached_;
    bool finalized_;

    // Working copy of the slot arrays, valid once detached
    std::vector<entry_type> entries_;   // inline entries, or collision entries
    std::vector<Ptr> children_;
    uint32_t dataMap_;
    uint32_t childMap_;
    uint64_t collisionHash_;

    NodeBuilder(Level level, Ptr source)
        : level_(level), source_(std::move(source)), detached_(false), finalized_(false),
          dataMap_(0), childMap_(0), collisionHash_(0) {}

    void checkUsable() const {
        if (finalized_) {
            throw std::logic_error("NodeBuilder used after finalize()");
        }
    }

    void checkBitmapLevel() const {
        if (level_.isExhausted()) {
            throw std::logic_error("slot edit on a collision level builder");
        }
    }

    // Copy-on-write split from the source node
    void detach() {
        checkUsable();
        if (detached_) return;
        detached_ = true;
        if (!source_) return;

        auto* node = static_cast<const BitmapNode<Traits>*>(source_.get());
        dataMap_ = node->dataMap();
        childMap_ = node->childMap();
        entries_ = node->entries();
        children_ = node->children();
        debug::log("builder: copy-on-write split at depth ", level_.depth(),
                   " (", node->count(), " entries)");
        source_.reset();
    }

    // Occupancy as seen by the next edit
    uint32_t currentDataMap() const {
        if (detached_ || !source_) return dataMap_;
        return static_cast<const BitmapNode<Traits>*>(source_.get())->dataMap();
    }

    uint32_t currentChildMap() const {
        if (detached_ || !source_) return childMap_;
        return static_cast<const BitmapNode<Traits>*>(source_.get())->childMap();
    }

    void requireFree(uint32_t bit) const {
        if ((currentDataMap() | currentChildMap()) & bit) {
            throw std::logic_error("NodeBuilder slot already occupied");
        }
    }

public:
    NodeBuilder(const NodeBuilder&) = delete;
    NodeBuilder& operator=(const NodeBuilder&) = delete;
    NodeBuilder(NodeBuilder&&) noexcept = default;
    NodeBuilder& operator=(NodeBuilder&&) noexcept = default;

    static NodeBuilder fromExisting(Level level, Ptr node) {
        return NodeBuilder(level, std::move(node));
    }

    static NodeBuilder empty(Level level) {
        NodeBuilder builder(level, Ptr());
        builder.detached_ = true;
        return builder;
    }

    // Stages a replacement collision bucket
    static NodeBuilder collision(Level level, uint64_t hash, std::vector<entry_type> entries) {
        NodeBuilder builder(level, Ptr());
        builder.detached_ = true;
        builder.collisionHash_ = hash;
        builder.entries_ = std::move(entries);
        return builder;
    }

    Level level() const { return level_; }
    bool isFinalized() const { return finalized_; }

    void insert(uint32_t slot, entry_type entry) {
        checkUsable();
        checkBitmapLevel();
        uint32_t bit = bitFor(slot);
        requireFree(bit);
        detach();
        entries_.insert(entries_.begin() + indexFor(dataMap_, bit), std::move(entry));
        dataMap_ |= bit;
    }

    void insertChild(uint32_t slot, Ptr child) {
        checkUsable();
        checkBitmapLevel();
        uint32_t bit = bitFor(slot);
        requireFree(bit);
        if (!child) return;
        detach();
        children_.insert(children_.begin() + indexFor(childMap_, bit), std::move(child));
        childMap_ |= bit;
    }

    void removeSlot(uint32_t slot) {
        checkUsable();
        checkBitmapLevel();
        uint32_t bit = bitFor(slot);
        if (((currentDataMap() | currentChildMap()) & bit) == 0) {
            throw std::logic_error("NodeBuilder::removeSlot on an empty slot");
        }
        detach();
        if (dataMap_ & bit) {
            entries_.erase(entries_.begin() + indexFor(dataMap_, bit));
            dataMap_ &= ~bit;
        } else {
            children_.erase(children_.begin() + indexFor(childMap_, bit));
            childMap_ &= ~bit;
        }
    }

    // A null child clears the slot
    void replaceChild(uint32_t slot, Ptr child) {
        checkUsable();
        checkBitmapLevel();
        uint32_t bit = bitFor(slot);
        if ((currentChildMap() & bit) == 0) {
            throw std::logic_error("NodeBuilder::replaceChild on a slot without a child");
        }
        if (!child || child->count() == 0) {
            removeSlot(slot);
            return;
        }
        detach();
        children_[indexFor(childMap_, bit)] = std::move(child);
    }

    /**
     * Produce the node for this level. Returns the untouched source when no
     * edit was made, and a null node when nothing is left.
     */
    Ptr finalize(Level level) {
        checkUsable();
        if (level != level_) {
            throw std::logic_error("NodeBuilder finalized at a different level");
        }

        if (!detached_) {
            finalized_ = true;
            return std::move(source_);
        }

        if (level_.isExhausted()) {
            finalized_ = true;
            if (entries_.empty()) return Ptr();
            // A single survivor is folded into the parent by its own finalize()
            return Ptr(new CollisionNode<Traits>(collisionHash_, std::move(entries_)));
        }

        // Collapse children reduced to one entry into inline entries
        uint32_t remaining = childMap_;
        while (remaining) {
            uint32_t bit = remaining & (~remaining + 1);
            remaining &= ~bit;

            const Ptr& child = children_[indexFor(childMap_, bit)];
            if (child->count() == 1) {
                entry_type last = child->anyEntry();
                children_.erase(children_.begin() + indexFor(childMap_, bit));
                childMap_ &= ~bit;
                entries_.insert(entries_.begin() + indexFor(dataMap_, bit), std::move(last));
                dataMap_ |= bit;
            }
        }

        finalized_ = true;
        if (entries_.empty() && children_.empty()) {
            return Ptr();
        }
        return Ptr(new BitmapNode<Traits>(dataMap_, childMap_, std::move(entries_),
                                          std::move(children_)));
    }
};

}  // namespace pyhamt
