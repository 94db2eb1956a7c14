#include "lob/errors.hpp"
#include "lob/id_generator.hpp"
#include "lob/jsonl_writer.hpp"
#include "lob/latency_histogram.hpp"
#include "lob/order_book.hpp"
#include "lob/order_csv.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

int main(int argc, char** argv) {
    std::string path = "orders.csv";
    int warmup = 10'000;
    long long max_orders = -1;      // -1 = all
    int sample_every = 10;          // time every Nth order to keep timer overhead down
    std::string out_path;           // optional JSONL bench line

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--path" && i + 1 < argc) path = argv[++i];
        else if (a == "--warmup" && i + 1 < argc) warmup = std::stoi(argv[++i]);
        else if (a == "--max" && i + 1 < argc) max_orders = std::stoll(argv[++i]);
        else if (a == "--sample_every" && i + 1 < argc) sample_every = std::stoi(argv[++i]);
        else if (a == "--out" && i + 1 < argc) out_path = argv[++i];
        else if (a == "--help") {
            std::cout
                << "Usage: bench_process [--path orders.csv] [--warmup N] [--max N]\n"
                << "                     [--sample_every K] [--out bench.jsonl]\n";
            return 0;
        }
    }

    std::ifstream fin(path);
    if (!fin) {
        std::cerr << "[bench] Failed to open: " << path << "\n";
        return 1;
    }

    // Sequential ids are enough here and keep UUID generation out of the timing.
    uint64_t next_id = 0;
    lob::OrderBook book("BENCH", [&next_id] { return "o" + std::to_string(++next_id); });

    std::vector<lob::Order> orders;
    std::string line;
    while (std::getline(fin, line)) {
        lob::Order o;
        if (lob::parse_order_csv_line(line, o)) orders.push_back(std::move(o));
        if (max_orders >= 0 && (long long)orders.size() >= max_orders) break;
    }
    if (orders.empty()) {
        std::cerr << "[bench] no orders in " << path << "\n";
        return 1;
    }

    size_t idx = 0;
    int64_t trades = 0;
    int64_t rejected = 0;

    // --- warmup ---
    for (; idx < orders.size() && (int)idx < warmup; ++idx) {
        try {
            trades += (int64_t)book.process(orders[idx]).trades.size();
        } catch (const lob::BookError&) {
            ++rejected;
        }
    }
    const size_t warmed = idx;

    // --- measure ---
    lob::LatencyHistogram hist;
    uint64_t processed = 0;
    auto t0 = Clock::now();

    for (; idx < orders.size(); ++idx) {
        bool sample = (sample_every <= 1) || ((processed % (uint64_t)sample_every) == 0);

        Clock::time_point s;
        if (sample) s = Clock::now();

        try {
            trades += (int64_t)book.process(orders[idx]).trades.size();
        } catch (const lob::BookError&) {
            ++rejected;
        }

        if (sample) {
            hist.record((uint64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - s).count());
        }
        ++processed;
    }

    uint64_t total_ns = (uint64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - t0).count();
    double secs = (double)total_ns / 1e9;
    double ops = (secs > 0) ? (processed / secs) : 0.0;

    uint64_t p50 = hist.percentile(0.50);
    uint64_t p95 = hist.percentile(0.95);
    uint64_t p99 = hist.percentile(0.99);

    std::cout << "Warmup processed: " << warmed << "\n";
    std::cout << "Measured processed: " << processed << "\n";
    std::cout << "Rejected: " << rejected << "\n";
    std::cout << "Trades: " << trades << "\n";
    std::cout << "Resting orders: " << book.size() << "\n";
    std::cout << "Throughput: " << (uint64_t)ops << " orders/s\n";
    std::cout << "Process latency est (us): p50<=" << (p50 / 1000.0)
              << " p95<=" << (p95 / 1000.0)
              << " p99<=" << (p99 / 1000.0) << "\n";

    if (!out_path.empty()) {
        lob::JsonlWriter w;
        if (w.open(out_path, /*append=*/true)) {
            lob::BenchLine bl;
            bl.ts_wall_us = lob::now_wall_us();
            bl.input = path;
            bl.processed = (int64_t)processed;
            bl.rejected = rejected;
            bl.trades = trades;
            bl.resting = (int64_t)book.size();
            bl.elapsed_s = secs;
            bl.orders_per_s = ops;
            bl.p50_us = p50 / 1000.0;
            bl.p95_us = p95 / 1000.0;
            bl.p99_us = p99 / 1000.0;
            w.write_bench(bl);
            w.flush();
            std::cerr << "[bench] appended to " << w.path() << "\n";
        } else {
            std::cerr << "[bench] result line not written\n";
        }
    }

    return 0;
}
