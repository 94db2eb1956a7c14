#pragma once
#include "lob/errors.hpp"
#include "lob/id_generator.hpp"
#include "lob/order_types.hpp"
#include "lob/side_book.hpp"

#include <cstddef>
#include <limits>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace lob {

/**
 * Price-time priority limit order book for one instrument tag.
 *
 * All operations are thread-safe: one std::shared_mutex guards bids and asks
 * together. Mutations take it exclusively, queries take it shared.
 * Failures throw BookError and leave the book unchanged.
 */
class OrderBook {
public:
    explicit OrderBook(std::string tag,
                       IdGenerator ids = make_uuid_generator(),
                       Clock clock = now_wall_us);

    OrderBook(const OrderBook&) = delete;
    OrderBook& operator=(const OrderBook&) = delete;

    const std::string& tag() const { return tag_; }
    const std::string& id() const { return id_; }

    // Rest an order without matching. Returns the id used
    // (generated when order.id is empty).
    std::string place(Order order);

    void cancel(const std::string& order_id);

    // Same price: amount updated in place, priority kept.
    // New price: moved to the tail of the new level.
    void modify(const std::string& order_id, Price new_price, Amount new_amount);

    // Match against the opposite side, then rest any remainder,
    // all under one exclusive lock.
    ProcessResult process(Order order);

    Order best_bid() const;
    Order best_ask() const;

    OrderBookSnapshot snapshot(std::size_t depth = std::numeric_limits<std::size_t>::max()) const;

    std::optional<Order> find(const std::string& order_id) const;
    std::size_t size() const;

    // Priority-ordered copies, for inspection and tests.
    std::vector<Order> bids() const;
    std::vector<Order> asks() const;

private:
    void validate_new_(Order& order);
    void insert_(Order order);
    bool remove_by_id_(const std::string& order_id);
    bool reposition_(const std::string& order_id, Price new_price, Amount new_amount);

    template <typename Book>
    void match_(Order& incoming, Book& opposite, std::vector<Trade>& trades);

    std::string tag_;
    IdGenerator ids_;
    Clock clock_;
    std::string id_;

    mutable std::shared_mutex mtx_;
    BidBook bids_;
    AskBook asks_;
    std::unordered_map<std::string, OrderRef> index_;
};

} // namespace lob
