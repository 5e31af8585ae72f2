#pragma once

#include <cstddef>
#include <iterator>
#include <vector>
#include "node.hpp"

namespace pyhamt {

/**
 * NodeIterator - depth-first walk over the entries of a trie, O(depth)
 * memory. Inline entries of a node come before its children.
 *
 * The iterator does not own the trie; the collection it came from must stay
 * alive while it is in use.
 */
template <typename Traits>
class NodeIterator {
public:
    using entry_type = typename Traits::entry_type;

    using iterator_category = std::forward_iterator_tag;
    using value_type = entry_type;
    using difference_type = std::ptrdiff_t;
    using pointer = const entry_type*;
    using reference = const entry_type&;

private:
    struct StackFrame {
        const NodeBase<Traits>* node;
        size_t index;
    };
    std::vector<StackFrame> stack_;
    const entry_type* current_;

    void advance() {
        current_ = nullptr;
        while (!stack_.empty()) {
            // Don't hold frame references across stack modifications
            const NodeBase<Traits>* node = stack_.back().node;
            size_t idx = stack_.back().index;

            if (node->isCollision()) {
                const auto& entries = static_cast<const CollisionNode<Traits>*>(node)->entries();
                if (idx < entries.size()) {
                    stack_.back().index = idx + 1;
                    current_ = &entries[idx];
                    return;
                }
                stack_.pop_back();
                continue;
            }

            const auto* bitmapNode = static_cast<const BitmapNode<Traits>*>(node);
            const auto& entries = bitmapNode->entries();
            const auto& children = bitmapNode->children();

            if (idx < entries.size()) {
                stack_.back().index = idx + 1;
                current_ = &entries[idx];
                return;
            }
            if (idx - entries.size() < children.size()) {
                stack_.back().index = idx + 1;
                stack_.push_back({children[idx - entries.size()].get(), 0});
                continue;
            }
            stack_.pop_back();
        }
    }

public:
    NodeIterator() : current_(nullptr) {}

    explicit NodeIterator(const NodeBase<Traits>* root) : current_(nullptr) {
        if (root) {
            stack_.push_back({root, 0});
            advance();
        }
    }

    reference operator*() const { return *current_; }
    pointer operator->() const { return current_; }

    NodeIterator& operator++() {
        advance();
        return *this;
    }

    NodeIterator operator++(int) {
        NodeIterator previous = *this;
        advance();
        return previous;
    }

    bool operator==(const NodeIterator& other) const { return current_ == other.current_; }
    bool operator!=(const NodeIterator& other) const { return current_ != other.current_; }
};

/**
 * KeyIterator - NodeIterator projected onto the keys of the entries.
 */
template <typename Traits>
class KeyIterator {
public:
    using key_type = typename Traits::key_type;

    using iterator_category = std::forward_iterator_tag;
    using value_type = key_type;
    using difference_type = std::ptrdiff_t;
    using pointer = const key_type*;
    using reference = const key_type&;

private:
    NodeIterator<Traits> iter_;

public:
    KeyIterator() = default;
    explicit KeyIterator(NodeIterator<Traits> iter) : iter_(std::move(iter)) {}

    reference operator*() const { return iter_->key; }
    pointer operator->() const { return &iter_->key; }

    KeyIterator& operator++() {
        ++iter_;
        return *this;
    }

    KeyIterator operator++(int) {
        KeyIterator previous = *this;
        ++iter_;
        return previous;
    }

    bool operator==(const KeyIterator& other) const { return iter_ == other.iter_; }
    bool operator!=(const KeyIterator& other) const { return iter_ != other.iter_; }
};

}  // namespace pyhamt
