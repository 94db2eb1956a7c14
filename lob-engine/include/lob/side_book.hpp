#pragma once
#include "lob/order_types.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <limits>
#include <map>
#include <vector>

namespace lob {

/**
 * One side of the book: price -> FIFO queue of orders.
 * Compare = std::greater<Price> for bids (best = highest),
 *           std::less<Price>    for asks (best = lowest).
 *
 * Iterating levels_ front to back, and each queue front to back, yields the
 * exact price-time priority sequence. Not synchronized; OrderBook locks.
 */
template <typename Compare>
class SideBook {
public:
    using Levels = std::map<Price, OrderQueue, Compare>;

    bool empty() const { return levels_.empty(); }
    std::size_t order_count() const { return count_; }
    std::size_t level_count() const { return levels_.size(); }

    // Append at the tail of the order's price level.
    OrderQueue::iterator insert(Order o) {
        auto& q = levels_[o.price];
        q.push_back(std::move(o));
        ++count_;
        return std::prev(q.end());
    }

    // Erase one order by position. Drops the level when it empties.
    void erase(Price price, OrderQueue::iterator it) {
        auto lvlIt = levels_.find(price);
        if (lvlIt == levels_.end()) return;

        lvlIt->second.erase(it);
        --count_;
        if (lvlIt->second.empty()) levels_.erase(lvlIt);
    }

    // Best price, earliest time. Caller checks empty() first.
    Order& front() { return levels_.begin()->second.front(); }
    const Order& front() const { return levels_.begin()->second.front(); }

    void pop_front() {
        auto lvlIt = levels_.begin();
        lvlIt->second.pop_front();
        --count_;
        if (lvlIt->second.empty()) levels_.erase(lvlIt);
    }

    // Level totals saturate at the largest representable amount.
    std::vector<OrderBookLevel> aggregate(std::size_t depth) const {
        std::vector<OrderBookLevel> out;
        out.reserve(std::min(depth, levels_.size()));

        for (auto it = levels_.begin(); it != levels_.end() && out.size() < depth; ++it) {
            OrderBookLevel lvl;
            lvl.price = it->first;
            for (const auto& o : it->second) {
                lvl.total_amount = add_saturating(lvl.total_amount, o.amount);
                ++lvl.order_count;
            }
            out.push_back(lvl);
        }
        return out;
    }

    // Flattened priority order (copies).
    std::vector<Order> orders() const {
        std::vector<Order> out;
        out.reserve(count_);
        for (const auto& [px, q] : levels_) {
            (void)px;
            out.insert(out.end(), q.begin(), q.end());
        }
        return out;
    }

    void clear() {
        levels_.clear();
        count_ = 0;
    }

private:
    // Both operands are positive resting amounts.
    static Amount add_saturating(Amount a, Amount b) {
        constexpr Amount kMax = std::numeric_limits<Amount>::max();
        return (b > kMax - a) ? kMax : a + b;
    }

    Levels levels_;
    std::size_t count_ = 0;
};

using BidBook = SideBook<std::greater<Price>>;
using AskBook = SideBook<std::less<Price>>;

} // namespace lob
