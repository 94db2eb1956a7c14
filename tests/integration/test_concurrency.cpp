#include <gtest/gtest.h>
#include "lob/order_book.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace lob;

namespace {

bool asks_ordered(const OrderBookSnapshot& s) {
    for (size_t i = 1; i < s.asks.size(); ++i) {
        if (!(s.asks[i - 1].price < s.asks[i].price)) return false;
    }
    return true;
}

bool bids_ordered(const OrderBookSnapshot& s) {
    for (size_t i = 1; i < s.bids.size(); ++i) {
        if (!(s.bids[i - 1].price > s.bids[i].price)) return false;
    }
    return true;
}

bool levels_positive(const std::vector<OrderBookLevel>& levels) {
    for (const auto& l : levels) {
        if (l.total_amount <= 0 || l.order_count <= 0) return false;
    }
    return true;
}

} // namespace

TEST(ConcurrencyTest, ParallelProcessConservesAmounts) {
    OrderBook book("CONC", lob_test::sequential_ids());

    constexpr int kThreads = 8;
    constexpr int kPerThread = 2000;

    std::vector<Amount> submitted(kThreads, 0);
    std::vector<Amount> rested(kThreads, 0);
    std::vector<Amount> traded(kThreads, 0);

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t] {
            std::mt19937 rng(1234 + t);
            std::uniform_int_distribution<int> px(95, 105);
            std::uniform_int_distribution<int> qty(1, 20);

            for (int i = 0; i < kPerThread; ++i) {
                Order o;
                o.id = "t" + std::to_string(t) + "-" + std::to_string(i);
                o.side = (i % 2 == 0) ? Side::Buy : Side::Sell;
                o.price = px(rng) * kFixedScale;
                o.amount = qty(rng) * (kFixedScale / 10);

                ProcessResult r = book.process(o);
                submitted[t] += o.amount;
                rested[t] += r.remaining;
                for (const auto& tr : r.trades) traded[t] += tr.amount;
            }
        });
    }
    for (auto& w : workers) w.join();

    Amount total_submitted = 0, total_rested = 0, total_traded = 0;
    for (int t = 0; t < kThreads; ++t) {
        total_submitted += submitted[t];
        total_rested += rested[t];
        total_traded += traded[t];
    }

    Amount on_book = 0;
    for (const auto& o : book.bids()) on_book += o.amount;
    for (const auto& o : book.asks()) on_book += o.amount;

    // Every trade removes its amount from one resting order and one incoming order.
    EXPECT_EQ(total_submitted, on_book + 2 * total_traded);
    EXPECT_LE(on_book, total_rested);

    // Matching runs to exhaustion, so the final book is never crossed.
    if (!book.bids().empty() && !book.asks().empty()) {
        EXPECT_LT(book.best_bid().price, book.best_ask().price);
    }

    const auto snap = book.snapshot();
    EXPECT_TRUE(asks_ordered(snap));
    EXPECT_TRUE(bids_ordered(snap));
}

TEST(ConcurrencyTest, ReadersSeeConsistentSnapshotsDuringWrites) {
    OrderBook book("CONC", lob_test::sequential_ids());

    std::atomic<bool> stop{false};
    std::atomic<int> bad{0};
    std::atomic<int> reads{0};

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&, t] {
            std::mt19937 rng(99 + t);
            std::uniform_int_distribution<int> px(90, 110);
            std::uniform_int_distribution<int> action(0, 9);
            std::vector<std::string> mine;

            for (int i = 0; i < 3000; ++i) {
                const int a = action(rng);
                if (a < 6) {
                    Order o;
                    o.id = "w" + std::to_string(t) + "-" + std::to_string(i);
                    o.side = (a % 2 == 0) ? Side::Buy : Side::Sell;
                    o.price = px(rng) * kFixedScale;
                    o.amount = kFixedScale;
                    if (book.process(o).remaining > 0) mine.push_back(o.id);
                } else if (!mine.empty()) {
                    const std::string id = mine.back();
                    mine.pop_back();
                    try {
                        if (a < 8) book.cancel(id);
                        else book.modify(id, px(rng) * kFixedScale, 2 * kFixedScale);
                    } catch (const BookError& e) {
                        // filled by another thread in the meantime
                        if (e.kind() != ErrorKind::OrderNotFound) bad.fetch_add(1);
                    }
                }
            }
        });
    }

    std::vector<std::thread> readers;
    for (int r = 0; r < 2; ++r) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                const auto snap = book.snapshot();
                if (!asks_ordered(snap) || !bids_ordered(snap) ||
                    !levels_positive(snap.asks) || !levels_positive(snap.bids)) {
                    bad.fetch_add(1);
                }
                reads.fetch_add(1);
            }
        });
    }

    for (auto& w : writers) w.join();
    stop.store(true);
    for (auto& r : readers) r.join();

    EXPECT_EQ(bad.load(), 0);
    EXPECT_GT(reads.load(), 0);
}

TEST(ConcurrencyTest, ConcurrentCancelRemovesExactlyOnce) {
    OrderBook book("CONC", lob_test::sequential_ids());
    for (int i = 0; i < 500; ++i) {
        book.place(lob_test::sell("a" + std::to_string(i), "100", "1"));
    }

    std::atomic<int> removed{0};
    std::atomic<int> missing{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 500; ++i) {
                try {
                    book.cancel("a" + std::to_string(i));
                    removed.fetch_add(1);
                } catch (const BookError& e) {
                    if (e.kind() == ErrorKind::OrderNotFound) missing.fetch_add(1);
                }
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(removed.load(), 500);
    EXPECT_EQ(missing.load(), 1500);
    EXPECT_EQ(book.size(), 0u);
    EXPECT_TRUE(book.snapshot().asks.empty());
}
