#include <catch2/catch.hpp>

#include <stdexcept>
#include "invariant_check.hpp"
#include "node_builder.hpp"
#include "test_support.hpp"

namespace pyhamt::test {

using Builder = NodeBuilder<IntTraits>;
using IntEntry = IntTraits::entry_type;

TEST_CASE("NodeBuilder without edits finalizes to its source", "[builder]") {
    IntSet set{1, 2, 3};
    Builder builder = Builder::fromExisting(Level::top(), set.root());

    AllocationCounter allocations;
    auto result = builder.finalize(Level::top());
    CHECK(result == set.root());
    CHECK(allocations.count() == 0);
}

TEST_CASE("NodeBuilder edits never touch the source node", "[builder]") {
    IntSet set{1, 2, 3};
    Builder builder = Builder::fromExisting(Level::top(), set.root());
    builder.removeSlot(2);
    builder.insert(7, IntEntry(7, Unit()));

    auto result = builder.finalize(Level::top());
    REQUIRE(result);
    CHECK(result != set.root());
    CHECK(result->count() == 3);
    CHECK(asBitmap(result)->dataMap() == (bitFor(1) | bitFor(3) | bitFor(7)));

    CHECK(set.size() == 3);
    CHECK(set.contains(2));
    CHECK_FALSE(set.contains(7));
    CHECK(asBitmap(set.root())->dataMap() == (bitFor(1) | bitFor(2) | bitFor(3)));
    CHECK_NOTHROW(fullInvariantCheck(result));
}

TEST_CASE("NodeBuilder handed the only reference to its source copies it", "[builder]") {
    NodePtr<IntTraits> root;
    for (int key : {1, 2, 3}) {
        insert(root, HashPath::top(IntTraits::hashOf(key)), IntEntry(key, Unit()), false);
    }
    REQUIRE(root.isUnique());

    Builder builder = Builder::fromExisting(Level::top(), std::move(root));
    builder.removeSlot(1);
    builder.insert(9, IntEntry(9, Unit()));

    auto result = builder.finalize(Level::top());
    REQUIRE(result);
    CHECK(result->count() == 3);
    CHECK(asBitmap(result)->dataMap() == (bitFor(2) | bitFor(3) | bitFor(9)));
    CHECK(result->find(HashPath::top(9), 9) != nullptr);
    CHECK(result->find(HashPath::top(1), 1) == nullptr);
    CHECK_NOTHROW(fullInvariantCheck(result));
}

TEST_CASE("NodeBuilder finalize collapses a child left with one entry", "[builder]") {
    IntSet set{1, 33, 5};
    const auto& child = asBitmap(set.root())->childAt(bitFor(1));
    REQUIRE(child->count() == 2);

    // Drop 33 from the child, then hand the shrunken child to the root
    Builder childBuilder = Builder::fromExisting(Level::top().descend(), child);
    childBuilder.removeSlot(1);
    auto shrunk = childBuilder.finalize(Level::top().descend());
    REQUIRE(shrunk->count() == 1);

    Builder rootBuilder = Builder::fromExisting(Level::top(), set.root());
    rootBuilder.replaceChild(1, shrunk);
    auto result = rootBuilder.finalize(Level::top());

    const auto* node = asBitmap(result);
    CHECK(node->childMap() == 0);
    CHECK(node->dataMap() == (bitFor(1) | bitFor(5)));
    CHECK(node->entryAt(bitFor(1)).key == 1);
    CHECK(result->count() == 2);
    CHECK_NOTHROW(fullInvariantCheck(result));
}

TEST_CASE("NodeBuilder replaceChild with nothing clears the slot", "[builder]") {
    IntSet set{1, 33, 5};
    Builder builder = Builder::fromExisting(Level::top(), set.root());
    builder.replaceChild(1, NodePtr<IntTraits>());
    auto result = builder.finalize(Level::top());

    REQUIRE(result);
    CHECK(result->count() == 1);
    CHECK(asBitmap(result)->dataMap() == bitFor(5));
}

TEST_CASE("NodeBuilder finalizes an emptied node to null", "[builder]") {
    IntSet set{4};
    Builder builder = Builder::fromExisting(Level::top(), set.root());
    builder.removeSlot(4);
    CHECK_FALSE(builder.finalize(Level::top()));

    Builder empty = Builder::empty(Level::top());
    CHECK_FALSE(empty.finalize(Level::top()));
}

TEST_CASE("NodeBuilder builds from scratch", "[builder]") {
    IntSet other{1, 33};
    Builder builder = Builder::empty(Level::top());
    builder.insert(9, IntEntry(9, Unit()));
    builder.insertChild(1, asBitmap(other.root())->childAt(bitFor(1)));
    auto result = builder.finalize(Level::top());

    CHECK(result->count() == 3);
    // The child is linked, not copied
    CHECK(asBitmap(result)->childAt(bitFor(1)) == asBitmap(other.root())->childAt(bitFor(1)));
    CHECK_NOTHROW(fullInvariantCheck(result));
}

TEST_CASE("NodeBuilder rejects misuse", "[builder]") {
    IntSet set{1, 2};

    SECTION("use after finalize") {
        Builder builder = Builder::fromExisting(Level::top(), set.root());
        builder.removeSlot(1);
        builder.finalize(Level::top());
        CHECK(builder.isFinalized());
        CHECK_THROWS_AS(builder.removeSlot(2), std::logic_error);
        CHECK_THROWS_AS(builder.finalize(Level::top()), std::logic_error);
    }

    SECTION("finalize at another level") {
        Builder builder = Builder::fromExisting(Level::top(), set.root());
        CHECK_THROWS_AS(builder.finalize(Level::top().descend()), std::logic_error);
    }

    SECTION("slot edits that do not match the occupancy") {
        Builder builder = Builder::fromExisting(Level::top(), set.root());
        CHECK_THROWS_AS(builder.removeSlot(5), std::logic_error);
        CHECK_THROWS_AS(builder.insert(1, IntEntry(1, Unit())), std::logic_error);
        CHECK_THROWS_AS(builder.replaceChild(2, NodePtr<IntTraits>()), std::logic_error);
    }
}

TEST_CASE("NodeBuilder stages collision buckets", "[builder]") {
    using Traits = CollidingSet::Traits;
    Level bottom = Level::top();
    for (uint32_t i = 0; i < MAX_DEPTH; ++i) bottom = bottom.descend();

    std::vector<Traits::entry_type> entries{{1, Unit()}, {2, Unit()}};
    auto bucket = NodeBuilder<Traits>::collision(bottom, 42, entries).finalize(bottom);
    REQUIRE(bucket);
    CHECK(bucket->isCollision());
    CHECK(bucket->count() == 2);

    auto none = NodeBuilder<Traits>::collision(bottom, 42, {}).finalize(bottom);
    CHECK_FALSE(none);

    auto builder = NodeBuilder<Traits>::collision(bottom, 42, entries);
    CHECK_THROWS_AS(builder.removeSlot(0), std::logic_error);
}

}  // namespace pyhamt::test
