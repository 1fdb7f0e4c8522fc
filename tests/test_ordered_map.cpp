// ═══════════════════════════════════════════════════════════════════
//  test_ordered_map.cpp — Tests for the insertion-ordered map
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <gqlir/ordered_map.h>

using namespace gqlir;

TEST(OrderedMapTest, IteratesInInsertionOrder) {
    OrderedMap<int> map;
    map.insert("zeta", 1);
    map.insert("alpha", 2);
    map.insert("mid", 3);

    EXPECT_EQ(map.keys(), (std::vector<std::string>{"zeta", "alpha", "mid"}));
    std::vector<int> values;
    for (auto& [key, value] : map) values.push_back(value);
    EXPECT_EQ(values, (std::vector<int>{1, 2, 3}));
}

TEST(OrderedMapTest, InsertKeepsExistingEntry) {
    OrderedMap<int> map;
    EXPECT_TRUE(map.insert("a", 1));
    EXPECT_FALSE(map.insert("a", 2));
    EXPECT_EQ(map.at("a"), 1);
    EXPECT_EQ(map.size(), 1u);
}

TEST(OrderedMapTest, InsertOrAssignKeepsPosition) {
    OrderedMap<int> map;
    map.insert("a", 1);
    map.insert("b", 2);
    map.insertOrAssign("a", 10);

    EXPECT_EQ(map.keys(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(map.at("a"), 10);
}

TEST(OrderedMapTest, FindAndContains) {
    OrderedMap<std::string> map;
    map.insert("op", "query");

    ASSERT_NE(map.find("op"), nullptr);
    EXPECT_EQ(*map.find("op"), "query");
    EXPECT_EQ(map.find("missing"), nullptr);
    EXPECT_TRUE(map.contains("op"));
    EXPECT_FALSE(map.contains("missing"));
}

TEST(OrderedMapTest, AtThrowsForMissingKey) {
    OrderedMap<int> map;
    EXPECT_THROW(map.at("missing"), std::out_of_range);
}

TEST(OrderedMapTest, EqualityIsOrderSensitive) {
    OrderedMap<int> a, b, c;
    a.insert("x", 1); a.insert("y", 2);
    b.insert("x", 1); b.insert("y", 2);
    c.insert("y", 2); c.insert("x", 1);
    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a == c);
    EXPECT_TRUE(OrderedMap<int>().empty());
}
