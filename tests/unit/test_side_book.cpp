#include <gtest/gtest.h>
#include "lob/side_book.hpp"
#include "test_helpers.hpp"

#include <limits>
#include <vector>

using namespace lob;
using lob_test::buy;
using lob_test::fx;
using lob_test::sell;

static std::vector<std::string> ids(const std::vector<Order>& orders) {
    std::vector<std::string> out;
    for (const auto& o : orders) out.push_back(o.id);
    return out;
}

TEST(SideBookTest, EmptyByDefault) {
    AskBook asks;
    EXPECT_TRUE(asks.empty());
    EXPECT_EQ(asks.order_count(), 0u);
    EXPECT_EQ(asks.level_count(), 0u);
    EXPECT_TRUE(asks.orders().empty());
}

TEST(SideBookTest, AsksSortAscendingByPrice) {
    AskBook asks;
    asks.insert(sell("a102", "102", "1"));
    asks.insert(sell("a100", "100", "1"));
    asks.insert(sell("a101", "101", "1"));

    EXPECT_EQ(ids(asks.orders()), (std::vector<std::string>{"a100", "a101", "a102"}));
    EXPECT_EQ(asks.front().id, "a100");
}

TEST(SideBookTest, BidsSortDescendingByPrice) {
    BidBook bids;
    bids.insert(buy("b100", "100", "1"));
    bids.insert(buy("b102", "102", "1"));
    bids.insert(buy("b101", "101", "1"));

    EXPECT_EQ(ids(bids.orders()), (std::vector<std::string>{"b102", "b101", "b100"}));
    EXPECT_EQ(bids.front().id, "b102");
}

TEST(SideBookTest, EqualPriceKeepsInsertionOrder) {
    BidBook bids;
    bids.insert(buy("first", "100", "1"));
    bids.insert(buy("better", "101", "1"));
    bids.insert(buy("second", "100", "2"));
    bids.insert(buy("third", "100", "3"));

    EXPECT_EQ(ids(bids.orders()),
              (std::vector<std::string>{"better", "first", "second", "third"}));
    EXPECT_EQ(bids.level_count(), 2u);
    EXPECT_EQ(bids.order_count(), 4u);
}

TEST(SideBookTest, EraseMiddleKeepsOthersInOrder) {
    AskBook asks;
    asks.insert(sell("a1", "100", "1"));
    auto mid = asks.insert(sell("a2", "100", "1"));
    asks.insert(sell("a3", "100", "1"));

    asks.erase(fx("100"), mid);

    EXPECT_EQ(ids(asks.orders()), (std::vector<std::string>{"a1", "a3"}));
    EXPECT_EQ(asks.order_count(), 2u);
}

TEST(SideBookTest, EraseLastOrderDropsLevel) {
    AskBook asks;
    auto it = asks.insert(sell("a1", "100", "1"));
    asks.insert(sell("a2", "101", "1"));

    asks.erase(fx("100"), it);

    EXPECT_EQ(asks.level_count(), 1u);
    EXPECT_EQ(asks.front().id, "a2");
}

TEST(SideBookTest, PopFrontAdvancesThroughLevels) {
    AskBook asks;
    asks.insert(sell("a1", "100", "1"));
    asks.insert(sell("a2", "100", "1"));
    asks.insert(sell("a3", "101", "1"));

    asks.pop_front();
    EXPECT_EQ(asks.front().id, "a2");
    asks.pop_front();
    EXPECT_EQ(asks.front().id, "a3");
    asks.pop_front();
    EXPECT_TRUE(asks.empty());
    EXPECT_EQ(asks.order_count(), 0u);
}

TEST(SideBookTest, AggregateSumsLevelsAndHonoursDepth) {
    BidBook bids;
    bids.insert(buy("b1", "100", "1.0"));
    bids.insert(buy("b2", "100", "2.0"));
    bids.insert(buy("b3", "99.5", "0.25"));
    bids.insert(buy("b4", "98", "4"));

    auto all = bids.aggregate(10);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].price, fx("100"));
    EXPECT_EQ(all[0].total_amount, fx("3"));
    EXPECT_EQ(all[0].order_count, 2);
    EXPECT_EQ(all[1].price, fx("99.5"));
    EXPECT_EQ(all[1].total_amount, fx("0.25"));
    EXPECT_EQ(all[2].price, fx("98"));

    auto top = bids.aggregate(1);
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].price, fx("100"));
}

TEST(SideBookTest, AggregateSaturatesHugeLevelTotal) {
    AskBook asks;
    asks.insert(sell("a1", "100", "50000000000"));
    asks.insert(sell("a2", "100", "50000000000"));
    asks.insert(sell("a3", "101", "50000000000"));

    auto levels = asks.aggregate(10);
    ASSERT_EQ(levels.size(), 2u);
    EXPECT_EQ(levels[0].total_amount, std::numeric_limits<Amount>::max());
    EXPECT_EQ(levels[0].order_count, 2);
    EXPECT_EQ(levels[1].total_amount, fx("50000000000"));
}
