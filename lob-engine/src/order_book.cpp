#include "lob/order_book.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace lob {

OrderBook::OrderBook(std::string tag, IdGenerator ids, Clock clock)
    : tag_(std::move(tag))
    , ids_(std::move(ids))
    , clock_(std::move(clock)) {
    id_ = ids_ ? ids_() : std::string{};
}

// Runs before the lock is taken: id generation is an external call.
void OrderBook::validate_new_(Order& order) {
    if (order.price <= 0 || order.amount <= 0) {
        throw BookError(ErrorKind::InvalidOrder);
    }
    if (order.side != Side::Buy && order.side != Side::Sell) {
        throw BookError(ErrorKind::InvalidOrder, "unknown side");
    }
    if (order.id.empty() && ids_) {
        order.id = ids_();
    }
    if (order.id.empty()) {
        throw BookError(ErrorKind::InvalidOrder, "missing id");
    }
}

void OrderBook::insert_(Order order) {
    const std::string key = order.id;
    const Side side = order.side;
    const Price px = order.price;

    switch (side) {
        case Side::Buy: {
            auto it = bids_.insert(std::move(order));
            index_.emplace(key, OrderRef{side, px, it});
            break;
        }
        case Side::Sell: {
            auto it = asks_.insert(std::move(order));
            index_.emplace(key, OrderRef{side, px, it});
            break;
        }
        default:
            throw BookError(ErrorKind::InvalidOrder, "unknown side");
    }
}

bool OrderBook::remove_by_id_(const std::string& order_id) {
    auto itRef = index_.find(order_id);
    if (itRef == index_.end()) return false;

    const OrderRef& ref = itRef->second;
    if (ref.side == Side::Buy) bids_.erase(ref.price, ref.it);
    else asks_.erase(ref.price, ref.it);

    index_.erase(itRef);
    return true;
}

bool OrderBook::reposition_(const std::string& order_id, Price new_price, Amount new_amount) {
    auto itRef = index_.find(order_id);
    if (itRef == index_.end()) return false;

    OrderRef& ref = itRef->second;

    // Amount only => keep priority, update in place
    if (ref.price == new_price) {
        ref.it->amount = new_amount;
        return true;
    }

    // Price change => lose priority, move to new level tail
    Order moved = *ref.it;
    moved.price = new_price;
    moved.amount = new_amount;

    if (ref.side == Side::Buy) {
        bids_.erase(ref.price, ref.it);
        ref.it = bids_.insert(std::move(moved));
    } else {
        asks_.erase(ref.price, ref.it);
        ref.it = asks_.insert(std::move(moved));
    }
    ref.price = new_price;
    return true;
}

std::string OrderBook::place(Order order) {
    validate_new_(order);

    std::unique_lock lock(mtx_);
    if (index_.count(order.id)) {
        throw BookError(ErrorKind::DuplicateOrderId, order.id);
    }

    std::string placed_id = order.id;
    insert_(std::move(order));
    return placed_id;
}

void OrderBook::cancel(const std::string& order_id) {
    std::unique_lock lock(mtx_);
    if (!remove_by_id_(order_id)) {
        throw BookError(ErrorKind::OrderNotFound, order_id);
    }
}

void OrderBook::modify(const std::string& order_id, Price new_price, Amount new_amount) {
    // Input validation, before the book is touched
    if (new_price <= 0 || new_amount <= 0) {
        throw BookError(ErrorKind::InvalidModification);
    }

    std::unique_lock lock(mtx_);
    if (!reposition_(order_id, new_price, new_amount)) {
        throw BookError(ErrorKind::OrderNotFound, order_id);
    }
}

template <typename Book>
void OrderBook::match_(Order& incoming, Book& opposite, std::vector<Trade>& trades) {
    const bool is_buy = (incoming.side == Side::Buy);

    while (!opposite.empty() && incoming.amount > 0) {
        Order& resting = opposite.front();

        // Head is the best opposite price; if it does not cross, nothing will.
        const bool crosses = is_buy ? (resting.price <= incoming.price)
                                    : (resting.price >= incoming.price);
        if (!crosses) break;

        const Amount executed = std::min(incoming.amount, resting.amount);

        Trade t;
        t.price = resting.price;
        t.amount = executed;
        if (is_buy) {
            t.buy_order_id = incoming.id;
            t.sell_order_id = resting.id;
        } else {
            t.buy_order_id = resting.id;
            t.sell_order_id = incoming.id;
        }
        trades.push_back(std::move(t));

        incoming.amount -= executed;
        resting.amount -= executed;

        if (resting.amount == 0) {
            index_.erase(resting.id);
            opposite.pop_front();
        }
    }
}

ProcessResult OrderBook::process(Order order) {
    validate_new_(order);

    ProcessResult result;
    result.order_id = order.id;

    std::unique_lock lock(mtx_);
    if (index_.count(order.id)) {
        throw BookError(ErrorKind::DuplicateOrderId, order.id);
    }

    if (order.side == Side::Buy) match_(order, asks_, result.trades);
    else match_(order, bids_, result.trades);

    // Remainder rests under its own id and limit price, still under the same lock.
    if (order.amount > 0) {
        result.remaining = order.amount;
        insert_(std::move(order));
    }
    return result;
}

Order OrderBook::best_bid() const {
    std::shared_lock lock(mtx_);
    if (bids_.empty()) throw BookError(ErrorKind::NoOrders);
    return bids_.front();
}

Order OrderBook::best_ask() const {
    std::shared_lock lock(mtx_);
    if (asks_.empty()) throw BookError(ErrorKind::NoOrders);
    return asks_.front();
}

OrderBookSnapshot OrderBook::snapshot(std::size_t depth) const {
    OrderBookSnapshot snap;
    snap.ts_us = clock_ ? clock_() : 0;

    std::shared_lock lock(mtx_);
    snap.asks = asks_.aggregate(depth);
    snap.bids = bids_.aggregate(depth);
    return snap;
}

std::optional<Order> OrderBook::find(const std::string& order_id) const {
    std::shared_lock lock(mtx_);
    auto itRef = index_.find(order_id);
    if (itRef == index_.end()) return std::nullopt;
    return *itRef->second.it;
}

std::size_t OrderBook::size() const {
    std::shared_lock lock(mtx_);
    return index_.size();
}

std::vector<Order> OrderBook::bids() const {
    std::shared_lock lock(mtx_);
    return bids_.orders();
}

std::vector<Order> OrderBook::asks() const {
    std::shared_lock lock(mtx_);
    return asks_.orders();
}

} // namespace lob
