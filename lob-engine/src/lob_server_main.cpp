#include "lob/app_config.hpp"
#include "lob/file_output.hpp"
#include "lob/http_server.hpp"
#include "lob/id_generator.hpp"
#include "lob/json_codec.hpp"
#include "lob/jsonl_writer.hpp"
#include "lob/order_book.hpp"
#include "lob/pg_writer.hpp"
#include "lob/router.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <deque>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace lob;

// ----------------------- DB Writer Queue -----------------------
static void enqueue_trade_writes(
    std::mutex& q_mtx,
    std::condition_variable& q_cv,
    std::deque<TradeRecord>& q,
    size_t max_q,
    int64_t ts_us,
    const std::vector<Trade>& trades
) {
    {
        std::lock_guard<std::mutex> lk(q_mtx);
        for (const auto& t : trades) {
            // bounded: drop the oldest under sustained DB slowness
            while (q.size() >= max_q) q.pop_front();
            q.push_back(TradeRecord{ts_us, t});
        }
    }
    q_cv.notify_one();
}

static void log_stats(ServerStats& stats) {
    std::lock_guard<std::mutex> lk(stats.mtx);
    auto ns_to_us = [](uint64_t ns) -> double { return (double)ns / 1000.0; };

    std::cerr << "=== lob_server stats ===\n";
    std::cerr << "requests: " << stats.requests << "\n";
    std::cerr << "client_errors: " << stats.client_errors << "\n";
    std::cerr << "server_errors: " << stats.server_errors << "\n";
    std::cerr << "handle_latency_est_p50: " << ns_to_us(stats.handle_latency.percentile(0.50)) << " us\n";
    std::cerr << "handle_latency_est_p95: " << ns_to_us(stats.handle_latency.percentile(0.95)) << " us\n";
    std::cerr << "handle_latency_est_p99: " << ns_to_us(stats.handle_latency.percentile(0.99)) << " us\n";
    std::cerr << "handle_latency_max: " << ns_to_us(stats.handle_latency.max_ns) << " us\n";
}

int main(int argc, char** argv) {
    AppConfig cfg = parse_config(argc, argv);
    if (!cfg.ok) return 1;

    OrderBook book(cfg.tag);
    std::cerr << "[lob_server] book tag=" << book.tag() << " id=" << book.id() << "\n";

    // ---- Trade log (optional) ----
    JsonlWriter trade_log;
    JsonlWriter* trade_log_ptr = nullptr;
    if (!cfg.trade_log_path.empty()) {
        if (trade_log.open(cfg.trade_log_path, /*append=*/true)) {
            trade_log_ptr = &trade_log;
            std::cerr << "[jsonl] trade log: " << trade_log.path() << "\n";
        } else {
            std::cerr << "[jsonl] trade log disabled (open failed)\n";
        }
    } else {
        std::cerr << "[jsonl] trade log disabled (set TRADE_LOG_PATH)\n";
    }

    // ---- PG Writer init (optional) ----
    std::unique_ptr<PgWriter> pg;
    if (!cfg.pg_conninfo.empty()) {
        pg = std::make_unique<PgWriter>(cfg.pg_conninfo, cfg.tag);
        if (pg->connected()) {
            std::cerr << "[pg] enabled\n";
        } else {
            std::cerr << "[pg] disabled (connection failed)\n";
            pg.reset();
        }
    } else {
        std::cerr << "[pg] disabled (set PG_CONNINFO)\n";
    }

    // ---- Async DB writer thread ----
    std::mutex q_mtx;
    std::condition_variable q_cv;
    std::deque<TradeRecord> q;
    std::atomic<bool> stop{false};
    const size_t max_q = 20000;
    const size_t max_batch = 256;

    std::thread pg_thread;
    if (pg) {
        pg_thread = std::thread([&]{
            std::vector<TradeRecord> batch;
            batch.reserve(max_batch);
            uint64_t failed_batches = 0;

            while (true) {
                batch.clear();
                {
                    std::unique_lock<std::mutex> lk(q_mtx);
                    q_cv.wait(lk, [&]{ return stop.load() || !q.empty(); });

                    if (q.empty()) {
                        if (stop.load()) break;
                        continue;
                    }

                    while (!q.empty() && batch.size() < max_batch) {
                        batch.push_back(std::move(q.front()));
                        q.pop_front();
                    }
                }
                if (!pg->write_batch(batch)) ++failed_batches;
            }
            std::cerr << "[pg] writer thread exit, rows=" << pg->rows_written()
                      << " failed_batches=" << failed_batches << "\n";
        });
    }

    // Runs on the request thread, after the book lock is released.
    TradeSink sink = [&](const std::vector<Trade>& trades) {
        const int64_t ts = now_wall_us();
        if (trade_log_ptr) {
            trade_log_ptr->write_trades(ts, cfg.tag, trades);
        }
        if (pg) enqueue_trade_writes(q_mtx, q_cv, q, max_q, ts, trades);
    };

    Router router(book, sink);
    ServerStats stats;

    // ---- Start HTTP server ----
    boost::asio::io_context ioc(cfg.threads);
    try {
        start_http_server(ioc, cfg.bind_addr, cfg.port, router, stats);
    } catch (const std::exception& e) {
        std::cerr << "[http] failed to start: " << e.what() << "\n";
        stop.store(true);
        q_cv.notify_all();
        if (pg_thread.joinable()) pg_thread.join();
        return 1;
    }

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (ec) return;
        std::cerr << "[lob_server] signal " << sig << ", shutting down...\n";
        ioc.stop();
    });

    std::cerr << "[http] listening on " << cfg.bind_addr << ":" << cfg.port
              << " (" << cfg.threads << " thread(s))\n";

    std::vector<std::thread> workers;
    workers.reserve(cfg.threads - 1);
    for (int i = 1; i < cfg.threads; ++i) {
        workers.emplace_back([&ioc]{ ioc.run(); });
    }
    ioc.run();
    for (auto& w : workers) {
        if (w.joinable()) w.join();
    }

    // ---- Shutdown ----
    log_stats(stats);

    if (!cfg.final_snapshot_path.empty()) {
        const OrderBookSnapshot snap = book.snapshot();
        if (!write_file_atomic_like(cfg.final_snapshot_path, snapshot_to_json(snap, book.tag(), book.id()))) {
            std::cerr << "[final] snapshot not written\n";
        }
    }

    if (trade_log_ptr) {
        trade_log_ptr->flush();
        std::cerr << "[jsonl] flushed, lines=" << trade_log_ptr->lines_written() << "\n";
    }

    stop.store(true);
    q_cv.notify_all();
    if (pg_thread.joinable()) pg_thread.join();

    std::cerr << "[lob_server] bye\n";
    return 0;
}
