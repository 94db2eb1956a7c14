#include <gtest/gtest.h>
#include "lob/json_codec.hpp"
#include "test_helpers.hpp"

#include <string>

using namespace lob;
using lob_test::fx;

TEST(JsonCodecTest, DecodesEscapedId) {
    Order o;
    std::string err;
    ASSERT_TRUE(decode_order(R"({"id":"A\u00e9\"x","price":1,"amount":1,"side":"SELL"})", o, err)) << err;
    EXPECT_EQ(o.id, "A\xC3\xA9\"x");
}

TEST(JsonCodecTest, DecodesOrderWithNumbersOrStrings) {
    Order o;
    std::string err;
    ASSERT_TRUE(decode_order(R"({"id":"b1","price":100.25,"amount":"2","side":"BUY"})", o, err)) << err;
    EXPECT_EQ(o.id, "b1");
    EXPECT_EQ(o.price, fx("100.25"));
    EXPECT_EQ(o.amount, fx("2"));
    EXPECT_EQ(o.side, Side::Buy);

    ASSERT_TRUE(decode_order(R"({"price":"64.83","amount":0.1,"side":"sell"})", o, err)) << err;
    EXPECT_TRUE(o.id.empty());
    EXPECT_EQ(o.price, fx("64.83"));
    EXPECT_EQ(o.amount, fx("0.1"));
    EXPECT_EQ(o.side, Side::Sell);
}

TEST(JsonCodecTest, DecodesExponentNumbersExactly) {
    Order o;
    std::string err;
    ASSERT_TRUE(decode_order(R"({"price":1e2,"amount":2.5E-1,"side":"BUY"})", o, err)) << err;
    EXPECT_EQ(o.price, fx("100"));
    EXPECT_EQ(o.amount, fx("0.25"));

    ASSERT_TRUE(decode_order(R"({"price":6483e-2,"amount":"1E+1","side":"BUY"})", o, err)) << err;
    EXPECT_EQ(o.price, fx("64.83"));
    EXPECT_EQ(o.amount, fx("10"));

    // needs nine decimals
    EXPECT_FALSE(decode_order(R"({"price":1e-9,"amount":1,"side":"BUY"})", o, err));
    EXPECT_EQ(err, "Price is Not a Number");
}

TEST(JsonCodecTest, NumberTextConversion) {
    int64_t v = 0;
    ASSERT_TRUE(json_number_to_fixed("-1.5e1", v));
    EXPECT_EQ(v, -fx("15"));
    ASSERT_TRUE(json_number_to_fixed("100e-2", v));
    EXPECT_EQ(v, fx("1"));
    ASSERT_TRUE(json_number_to_fixed("1e-8", v));
    EXPECT_EQ(v, 1);
    EXPECT_FALSE(json_number_to_fixed("1e20", v));
    EXPECT_FALSE(json_number_to_fixed("e5", v));
    EXPECT_FALSE(json_number_to_fixed("1e", v));
    EXPECT_FALSE(json_number_to_fixed("1.2.3e1", v));
}

TEST(JsonCodecTest, DecodeLeavesNegativesToTheBook) {
    Order o;
    std::string err;
    ASSERT_TRUE(decode_order(R"({"price":-1,"amount":1,"side":"BUY"})", o, err)) << err;
    EXPECT_EQ(o.price, -fx("1"));
}

TEST(JsonCodecTest, DecodeReportsFieldErrors) {
    Order o;
    std::string err;

    for (const char* bad : {"not json", "", "[]", R"({"price":1,)", R"({"a":1} trailing)"}) {
        err.clear();
        EXPECT_FALSE(decode_order(bad, o, err)) << bad;
        EXPECT_EQ(err, "Invalid Request Body") << bad;
    }

    EXPECT_FALSE(decode_order(R"({"price":1,"amount":1,"side":"HOLD"})", o, err));
    EXPECT_EQ(err, "side must be \"BUY\" or \"SELL\"");

    EXPECT_FALSE(decode_order(R"({"price":1,"amount":1})", o, err));
    EXPECT_EQ(err, "side must be \"BUY\" or \"SELL\"");

    EXPECT_FALSE(decode_order(R"({"price":"abc","amount":1,"side":"BUY"})", o, err));
    EXPECT_EQ(err, "Price is Not a Number");

    EXPECT_FALSE(decode_order(R"({"price":1,"side":"BUY"})", o, err));
    EXPECT_EQ(err, "Amount is Not a Number");

    EXPECT_FALSE(decode_order(R"({"id":true,"price":1,"amount":1,"side":"BUY"})", o, err));
    EXPECT_EQ(err, "id must be a string");

    EXPECT_FALSE(decode_order(R"({"price":{"v":1},"amount":1,"side":"BUY"})", o, err));
    EXPECT_EQ(err, "Price is Not a Number");
}

TEST(JsonCodecTest, NumericIdKeepsItsText) {
    Order o;
    std::string err;
    ASSERT_TRUE(decode_order(R"({"id":7,"price":1,"amount":1,"side":"BUY"})", o, err)) << err;
    EXPECT_EQ(o.id, "7");
}

TEST(JsonCodecTest, EscapesControlCharacters) {
    EXPECT_EQ(json_escape("a\"b\\c"), "a\\\"b\\\\c");
    EXPECT_EQ(json_escape("x\ny\tz"), "x\\ny\\tz");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\\u0001");
}

TEST(JsonCodecTest, EncodesOrderAndTrades) {
    Order o = lob_test::buy("b\"1", "100.5", "2");
    EXPECT_EQ(order_to_json(o),
              R"({"id":"b\"1","price":100.5,"amount":2,"side":"BUY"})");

    Trade t{"b1", "s1", fx("101"), fx("0.25")};
    EXPECT_EQ(trade_to_json(t),
              R"({"buy_order_id":"b1","sell_order_id":"s1","price":101,"amount":0.25})");

    EXPECT_EQ(trades_to_json({}), "[]");
    EXPECT_EQ(trades_to_json({t, t}), "[" + trade_to_json(t) + "," + trade_to_json(t) + "]");
}

TEST(JsonCodecTest, EncodesProcessResult) {
    ProcessResult r;
    r.order_id = "b1";
    r.remaining = fx("1.5");
    EXPECT_EQ(process_result_to_json(r), R"({"order_id":"b1","remaining":1.5,"trades":[]})");
}

TEST(JsonCodecTest, EncodesSnapshot) {
    OrderBookSnapshot snap;
    snap.ts_us = 42;
    snap.asks.push_back(OrderBookLevel{fx("100"), fx("3"), 2});
    snap.bids.push_back(OrderBookLevel{fx("99.5"), fx("0.5"), 1});

    EXPECT_EQ(snapshot_to_json(snap, "MAIN", "book-1"),
              R"({"tag":"MAIN","book_id":"book-1","ts_us":42,)"
              R"("asks":[{"price":100,"total_amount":3,"order_count":2}],)"
              R"("bids":[{"price":99.5,"total_amount":0.5,"order_count":1}]})");

    EXPECT_EQ(snapshot_to_json(OrderBookSnapshot{}, "", ""),
              R"({"ts_us":0,"asks":[],"bids":[]})");
}

TEST(JsonCodecTest, EncodesError) {
    EXPECT_EQ(error_to_json("Order not found"), R"({"error":"Order not found"})");
}
