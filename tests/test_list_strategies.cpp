/**
 * @file test_list_strategies.cpp
 * @brief Tests for list/atomic, list/map and list/set
 */

#include <gtest/gtest.h>
#include "deepmerge/strategies/List.hpp"

#include <optional>
#include <string>
#include <vector>

using namespace deepmerge;
namespace list = deepmerge::strategies::list;

namespace {

struct Item {
    int id = 0;
    std::string v;
    std::optional<std::string> note;

    void merge_from(Item other) {
        deepmerge::merge_from(id, other.id);
        deepmerge::merge_from(v, std::move(other.v));
        deepmerge::merge_from(note, std::move(other.note));
    }

    bool operator==(const Item& o) const { return id == o.id && v == o.v && note == o.note; }
};

Item item(int id, std::string v) {
    Item i;
    i.id = id;
    i.v = std::move(v);
    return i;
}

bool same_id(const Item& a, const Item& b) {
    return a.id == b.id;
}

// Composite key: (protocol, port)
struct Port {
    int port = 0;
    std::string protocol;
    std::optional<std::string> name;

    void merge_from(Port other) {
        deepmerge::merge_from(port, other.port);
        deepmerge::merge_from(protocol, std::move(other.protocol));
        deepmerge::merge_from(name, std::move(other.name));
    }

    bool operator==(const Port& o) const {
        return port == o.port && protocol == o.protocol && name == o.name;
    }
};

Port port(int p, std::string protocol, std::optional<std::string> name = std::nullopt) {
    Port out;
    out.port = p;
    out.protocol = std::move(protocol);
    out.name = std::move(name);
    return out;
}

const std::vector<list::KeyComparator<std::vector<Port>>> kPortKey = {
    [](const Port& a, const Port& b) { return a.port == b.port; },
    [](const Port& a, const Port& b) { return a.protocol == b.protocol; },
};

} // namespace

// ============================================================================
// list/atomic
// ============================================================================

TEST(ListAtomic, ReplacesBareList) {
    std::vector<int> current = {1, 2, 3};
    list::atomic(current, std::vector<int>{9});
    EXPECT_EQ(current, std::vector<int>{9});
}

TEST(ListAtomic, EmptyPatchEmptiesBareList) {
    std::vector<int> current = {1, 2, 3};
    list::atomic(current, std::vector<int>{});
    EXPECT_TRUE(current.empty());
}

TEST(ListAtomic, PresentPatchReplacesOptional) {
    std::optional<std::vector<std::string>> current = std::vector<std::string>{"a", "b"};
    list::atomic(current, std::optional<std::vector<std::string>>(std::vector<std::string>{"c"}));
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(*current, std::vector<std::string>{"c"});
}

TEST(ListAtomic, AbsentPatchKeepsOptional) {
    std::optional<std::vector<std::string>> current = std::vector<std::string>{"a"};
    list::atomic(current, std::nullopt);
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(*current, std::vector<std::string>{"a"});
}

TEST(ListAtomic, PatchIntoAbsentAssigns) {
    std::optional<std::vector<int>> current;
    list::atomic(current, std::optional<std::vector<int>>(std::vector<int>{1}));
    EXPECT_EQ(current, std::optional<std::vector<int>>(std::vector<int>{1}));
}

TEST(ListAtomic, DoesNotMergeElements) {
    std::vector<Item> current = {item(1, "a")};
    current[0].note = "keep?";
    list::atomic(current, std::vector<Item>{item(1, "b")});
    ASSERT_EQ(current.size(), 1u);
    EXPECT_EQ(current[0], item(1, "b"));
    EXPECT_FALSE(current[0].note.has_value());
}

// ============================================================================
// list/map
// ============================================================================

TEST(ListMap, MatchesByKeyAndAppends) {
    std::vector<Item> current = {item(1, "a"), item(2, "b")};
    list::map(current, std::vector<Item>{item(2, "c"), item(3, "d")}, {same_id});

    EXPECT_EQ(current, (std::vector<Item>{item(1, "a"), item(2, "c"), item(3, "d")}));
}

TEST(ListMap, MatchedItemsMergeRecursively) {
    std::vector<Item> current = {item(1, "a")};
    current[0].note = "existing";

    list::map(current, std::vector<Item>{item(1, "b")}, {same_id});

    ASSERT_EQ(current.size(), 1u);
    EXPECT_EQ(current[0].v, "b");
    EXPECT_EQ(current[0].note, std::optional<std::string>("existing"));
}

TEST(ListMap, PreservesCurrentOrderAndAppendsInPatchOrder) {
    std::vector<Item> current = {item(3, "c"), item(1, "a")};
    list::map(current, std::vector<Item>{item(5, "e"), item(1, "A"), item(4, "d")}, {same_id});

    ASSERT_EQ(current.size(), 4u);
    EXPECT_EQ(current[0], item(3, "c"));
    EXPECT_EQ(current[1], item(1, "A"));
    EXPECT_EQ(current[2], item(5, "e"));
    EXPECT_EQ(current[3], item(4, "d"));
}

TEST(ListMap, CompositeKeyRequiresAllComparators) {
    std::vector<Port> current = {port(53, "TCP", std::string("dns-tcp")), port(53, "UDP")};
    list::map(current, std::vector<Port>{port(53, "UDP", std::string("dns")), port(80, "TCP")}, kPortKey);

    ASSERT_EQ(current.size(), 3u);
    EXPECT_EQ(current[0], port(53, "TCP", std::string("dns-tcp")));
    EXPECT_EQ(current[1], port(53, "UDP", std::string("dns")));
    EXPECT_EQ(current[2], port(80, "TCP"));
}

TEST(ListMap, AmbiguousKeyMergesIntoFirstMatch) {
    std::vector<Item> current = {item(1, "first"), item(1, "second")};
    list::map(current, std::vector<Item>{item(1, "patched")}, {same_id});

    ASSERT_EQ(current.size(), 2u);
    EXPECT_EQ(current[0].v, "patched");
    EXPECT_EQ(current[1].v, "second");
}

TEST(ListMap, NoComparatorsMatchesFirstItem) {
    std::vector<Item> current = {item(1, "a"), item(2, "b")};
    list::map(current, std::vector<Item>{item(9, "z")}, {});

    ASSERT_EQ(current.size(), 2u);
    EXPECT_EQ(current[0], item(9, "z"));
    EXPECT_EQ(current[1], item(2, "b"));
}

TEST(ListMap, PatchItemsCanMatchEarlierAppends) {
    std::vector<Item> current;
    list::map(current, std::vector<Item>{item(1, "a"), item(1, "b")}, {same_id});

    ASSERT_EQ(current.size(), 1u);
    EXPECT_EQ(current[0], item(1, "b"));
}

TEST(ListMap, AbsentCurrentTakesPatch) {
    std::optional<std::vector<Item>> current;
    list::map(current, std::optional<std::vector<Item>>(std::vector<Item>{item(1, "a")}), {same_id});
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(*current, std::vector<Item>{item(1, "a")});
}

TEST(ListMap, AbsentPatchIsNoop) {
    std::optional<std::vector<Item>> current = std::vector<Item>{item(1, "a")};
    list::map(current, std::nullopt, {same_id});
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(*current, std::vector<Item>{item(1, "a")});
}

TEST(ListMap, BothAbsentStaysAbsent) {
    std::optional<std::vector<Item>> current;
    list::map(current, std::nullopt, {same_id});
    EXPECT_FALSE(current.has_value());
}

TEST(ListMap, SelfMergeIsIdempotent) {
    const std::vector<Item> original = {item(1, "a"), item(2, "b")};
    std::vector<Item> current = original;
    list::map(current, original, {same_id});
    EXPECT_EQ(current, original);
}

// ============================================================================
// list/set
// ============================================================================

TEST(ListSet, AppendsOnlyMissingValues) {
    std::vector<int> current = {1, 2, 3};
    list::set(current, std::vector<int>{2, 4});
    EXPECT_EQ(current, (std::vector<int>{1, 2, 3, 4}));
}

TEST(ListSet, DeduplicatesWithinPatch) {
    std::vector<std::string> current = {"a"};
    list::set(current, std::vector<std::string>{"b", "b", "a", "c"});
    EXPECT_EQ(current, (std::vector<std::string>{"a", "b", "c"}));
}

TEST(ListSet, KeepsExistingDuplicates) {
    std::vector<int> current = {1, 1};
    list::set(current, std::vector<int>{1});
    EXPECT_EQ(current, (std::vector<int>{1, 1}));
}

TEST(ListSet, UsesFullEqualityNotKeys) {
    std::vector<Item> current = {item(1, "a")};
    list::set(current, std::vector<Item>{item(1, "b"), item(1, "a")});

    ASSERT_EQ(current.size(), 2u);
    EXPECT_EQ(current[0], item(1, "a"));
    EXPECT_EQ(current[1], item(1, "b"));
}

TEST(ListSet, AbsentCurrentTakesPatch) {
    std::optional<std::vector<std::string>> current;
    list::set(current, std::optional<std::vector<std::string>>(std::vector<std::string>{"x", "x"}));
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(*current, (std::vector<std::string>{"x", "x"}));
}

TEST(ListSet, AbsentPatchIsNoop) {
    std::optional<std::vector<int>> current = std::vector<int>{1};
    list::set(current, std::nullopt);
    EXPECT_EQ(current, std::optional<std::vector<int>>(std::vector<int>{1}));
}

TEST(ListSet, SelfMergeIsIdempotent) {
    std::vector<int> current = {3, 1, 2};
    list::set(current, std::vector<int>{3, 1, 2});
    EXPECT_EQ(current, (std::vector<int>{3, 1, 2}));
}
