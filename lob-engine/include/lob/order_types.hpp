#pragma once
#include "lob/fixed_point.hpp"

#include <cstdint>
#include <list>
#include <string>
#include <vector>

namespace lob {

enum class Side : uint8_t {
    Buy,
    Sell
};

const char* to_string(Side side);

// Accepts "BUY"/"SELL" (any case). Returns false for anything else.
bool parse_side(const std::string& s, Side& out);

// A resting or incoming limit order. Price and amount are fixed-point.
struct Order {
    std::string id;
    Price price = 0;
    Amount amount = 0;
    Side side = Side::Buy;
};

// Emitted by matching; the book never stores it.
struct Trade {
    std::string buy_order_id;
    std::string sell_order_id;
    Price price = 0;
    Amount amount = 0;
};

struct ProcessResult {
    std::string order_id;
    std::vector<Trade> trades;
    Amount remaining = 0;   // amount that was left resting on the book
};

// One aggregated price level
struct OrderBookLevel {
    Price price = 0;
    Amount total_amount = 0;
    int64_t order_count = 0;
};

/**
 * Aggregated view of the book at one instant.
 * asks ascending, bids descending.
 */
struct OrderBookSnapshot {
    std::vector<OrderBookLevel> asks;
    std::vector<OrderBookLevel> bids;
    int64_t ts_us = 0;  // UNIX epoch microseconds
};

using OrderQueue = std::list<Order>;

// Reference to an order's exact position inside the book
// Used for O(1) cancel / modify.
struct OrderRef {
    Side side;
    Price price;                // price level where the order resides
    OrderQueue::iterator it;
};

} // namespace lob
