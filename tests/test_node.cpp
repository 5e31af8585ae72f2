#include <catch2/catch.hpp>

#include "invariant_check.hpp"
#include "test_support.hpp"

namespace pyhamt::test {

namespace {

using Ptr = NodePtr<IntTraits>;
using IntEntry = IntTraits::entry_type;

bool insertKey(Ptr& root, int key) {
    return insert(root, HashPath::top(IntTraits::hashOf(key)), IntEntry(key, Unit()), false);
}

bool removeKey(Ptr& root, int key) {
    return remove(root, HashPath::top(IntTraits::hashOf(key)), key);
}

}  // namespace

TEST_CASE("insert places entries in their hash slots", "[node]") {
    Ptr root;
    REQUIRE(insertKey(root, 1));
    REQUIRE(insertKey(root, 4));
    REQUIRE(root);
    CHECK(root->count() == 2);

    const auto* node = asBitmap(root);
    CHECK(node->dataMap() == (bitFor(1) | bitFor(4)));
    CHECK(node->childMap() == 0);
    CHECK(node->entries()[0].key == 1);
    CHECK(node->entries()[1].key == 4);
    CHECK_NOTHROW(fullInvariantCheck(root));
}

TEST_CASE("insert pushes keys sharing a slot one level down", "[node]") {
    Ptr root;
    insertKey(root, 1);
    insertKey(root, 33);  // bucket 1 at the top as well

    const auto* node = asBitmap(root);
    CHECK(node->dataMap() == 0);
    CHECK(node->childMap() == bitFor(1));
    CHECK(root->count() == 2);

    const auto* child = asBitmap(node->childAt(bitFor(1)));
    CHECK(child->dataMap() == (bitFor(0) | bitFor(1)));
    CHECK(root->find(HashPath::top(33), 33) != nullptr);
    CHECK(root->find(HashPath::top(65), 65) == nullptr);
    CHECK_NOTHROW(fullInvariantCheck(root));
}

TEST_CASE("find follows the hash path one chunk per level", "[node]") {
    Ptr root;
    insertKey(root, 1);
    insertKey(root, 33);
    insertKey(root, 65);  // 1, 33 and 65 share bucket 1 at the top

    HashPath path = HashPath::top(65);
    CHECK(path.chunk() == 1);
    const auto* child = asBitmap(root)->childAt(bitFor(path.chunk())).get();
    HashPath below = path.descend();
    CHECK(below.chunk() == 2);
    CHECK(child->find(below, 65) != nullptr);
    CHECK(child->find(below, 33) == nullptr);
    CHECK(child->find(HashPath::top(33).descend(), 33) != nullptr);
    CHECK(root->find(path, 65)->key == 65);
}

TEST_CASE("insert of a present key does not allocate", "[node]") {
    Ptr root;
    insertKey(root, 1);
    insertKey(root, 33);
    Ptr before = root;

    AllocationCounter allocations;
    CHECK_FALSE(insertKey(root, 33));
    CHECK(allocations.count() == 0);
    CHECK(root == before);
}

TEST_CASE("insert copies shared paths and leaves the original intact", "[node]") {
    Ptr original;
    insertKey(original, 1);
    insertKey(original, 33);
    insertKey(original, 2);

    Ptr edited = original;
    insertKey(edited, 65);

    CHECK(edited != original);
    CHECK(original->count() == 3);
    CHECK(edited->count() == 4);
    CHECK(original->find(HashPath::top(65), 65) == nullptr);
    CHECK(edited->find(HashPath::top(65), 65) != nullptr);
}

TEST_CASE("remove of an absent key keeps the node by reference", "[node]") {
    Ptr root;
    insertKey(root, 1);
    insertKey(root, 33);
    Ptr before = root;

    AllocationCounter allocations;
    CHECK_FALSE(removeKey(root, 65));
    CHECK_FALSE(removeKey(root, 7));
    CHECK(allocations.count() == 0);
    CHECK(root == before);
}

TEST_CASE("remove folds a single remaining entry into the parent", "[node]") {
    Ptr root;
    insertKey(root, 1);
    insertKey(root, 33);
    insertKey(root, 2);
    Ptr original = root;

    REQUIRE(removeKey(root, 33));
    const auto* node = asBitmap(root);
    CHECK(node->childMap() == 0);
    CHECK(node->dataMap() == (bitFor(1) | bitFor(2)));
    CHECK(root->count() == 2);
    CHECK_NOTHROW(fullInvariantCheck(root));

    // The shared version still has its child
    CHECK(asBitmap(original)->childMap() == bitFor(1));
    CHECK(original->count() == 3);
}

TEST_CASE("removing the last entry leaves a null root", "[node]") {
    Ptr root;
    insertKey(root, 5);
    REQUIRE(removeKey(root, 5));
    CHECK_FALSE(root);
}

TEST_CASE("full hash collisions are kept in a collision bucket", "[node]") {
    using Traits = CollidingSet::Traits;
    NodePtr<Traits> root;
    for (int key : {1, 2, 3}) {
        insert(root, HashPath::top(Traits::hashOf(key)), Traits::entry_type(key, Unit()), false);
    }
    CHECK(root->count() == 3);
    CHECK_NOTHROW(fullInvariantCheck(root));

    // Walk the chain down to the bottom
    const NodeBase<Traits>* node = root.get();
    Level level = Level::top();
    while (!node->isCollision()) {
        const auto* bitmap = static_cast<const BitmapNode<Traits>*>(node);
        REQUIRE(bitmap->children().size() == 1);
        node = bitmap->children().front().get();
        level = level.descend();
    }
    CHECK(level.isExhausted());
    CHECK(static_cast<const CollisionNode<Traits>*>(node)->entries().size() == 3);

    REQUIRE(remove(root, HashPath::top(Traits::hashOf(2)), 2));
    CHECK(root->count() == 2);
    CHECK(root->find(HashPath::top(42), 2) == nullptr);
    CHECK_NOTHROW(fullInvariantCheck(root));

    // Down to one entry the bucket disappears
    REQUIRE(remove(root, HashPath::top(Traits::hashOf(1)), 1));
    CHECK(root->count() == 1);
    CHECK(root->isCollision() == false);
    CHECK(asBitmap(root)->childMap() == 0);
    CHECK(asBitmap(root)->entries().front().key == 3);
    CHECK_NOTHROW(fullInvariantCheck(root));
}

}  // namespace pyhamt::test
