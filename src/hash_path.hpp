#pragma once

#include <cstdint>

namespace pyhamt {

// Constants for HAMT structure
constexpr uint32_t HASH_BITS = 5;
constexpr uint32_t HASH_MASK = (1 << HASH_BITS) - 1;  // 0b11111
constexpr uint32_t MAX_BITMAP_SIZE = 1 << HASH_BITS;  // 32
constexpr uint32_t HASH_WIDTH = 64;
constexpr uint32_t MAX_DEPTH = (HASH_WIDTH + HASH_BITS - 1) / HASH_BITS;  // 13

// Utility functions for popcount (bit counting)
#if defined(__GNUC__) || defined(__clang__)
    inline uint32_t popcount(uint32_t x) {
        return static_cast<uint32_t>(__builtin_popcount(x));  // Compiler intrinsic
    }
#else
    // Fallback implementation
    inline uint32_t popcount(uint32_t x) {
        x = x - ((x >> 1) & 0x55555555);
        x = (x & 0x33333333) + ((x >> 2) & 0x33333333);
        return (((x + (x >> 4)) & 0x0F0F0F0F) * 0x01010101) >> 24;
    }
#endif

/**
 * Level - depth of a node in the trie, expressed as the number of hash
 * bits already consumed on the way down from the root.
 *
 * Nodes at an exhausted level (all 64 bits consumed) are collision nodes.
 */
class Level {
private:
    uint32_t shift_;

    explicit constexpr Level(uint32_t shift) : shift_(shift) {}

public:
    static constexpr Level top() { return Level(0); }

    constexpr Level descend() const { return Level(shift_ + HASH_BITS); }

    constexpr bool isTop() const { return shift_ == 0; }
    constexpr bool isExhausted() const { return shift_ >= HASH_WIDTH; }

    constexpr uint32_t shift() const { return shift_; }
    constexpr uint32_t depth() const { return shift_ / HASH_BITS; }

    // Slot index of `hash` at this level; always 0 once the hash is exhausted
    constexpr uint32_t bucket(uint64_t hash) const {
        return isExhausted() ? 0 : static_cast<uint32_t>(hash >> shift_) & HASH_MASK;
    }

    // Bits of `hash` consumed above this level
    constexpr uint64_t prefix(uint64_t hash) const {
        return isExhausted() ? hash : hash & ((uint64_t(1) << shift_) - 1);
    }

    constexpr bool operator==(const Level& other) const { return shift_ == other.shift_; }
    constexpr bool operator!=(const Level& other) const { return shift_ != other.shift_; }
};

/**
 * HashPath - an element's full hash together with the level it has been
 * consumed to. `top(hash)` is the untouched path at the root; every
 * `descend()` consumes one HASH_BITS chunk.
 */
class HashPath {
private:
    uint64_t hash_;
    Level level_;

public:
    constexpr HashPath(uint64_t hash, Level level) : hash_(hash), level_(level) {}

    static constexpr HashPath top(uint64_t hash) { return HashPath(hash, Level::top()); }

    constexpr uint64_t hash() const { return hash_; }
    constexpr Level level() const { return level_; }

    // Chunk consumed at the current level
    constexpr uint32_t chunk() const { return level_.bucket(hash_); }

    constexpr HashPath descend() const { return HashPath(hash_, level_.descend()); }

    constexpr bool isExhausted() const { return level_.isExhausted(); }
};

inline uint32_t bitFor(uint32_t bucket) {
    return uint32_t(1) << bucket;
}

// Position of `bit` among the set bits of `bitmap`
inline uint32_t indexFor(uint32_t bitmap, uint32_t bit) {
    return popcount(bitmap & (bit - 1));
}

}  // namespace pyhamt
