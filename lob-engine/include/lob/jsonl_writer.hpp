#pragma once
#include "lob/order_types.hpp"

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace lob {

// Summary of one bench_process run
struct BenchLine {
    int64_t ts_wall_us = 0;
    std::string input;
    int64_t processed = 0;
    int64_t rejected = 0;
    int64_t trades = 0;
    int64_t resting = 0;
    double elapsed_s = 0.0;
    double orders_per_s = 0.0;

    double p50_us = 0.0;
    double p95_us = 0.0;
    double p99_us = 0.0;
};

/**
 * Append-only JSON-lines sink.
 *
 * One trade batch becomes consecutive lines
 *   {"ts_us":...,"tag":"MAIN","trade":{...}}
 * written under one lock, so batches from concurrent requests never interleave.
 */
class JsonlWriter {
public:
    JsonlWriter() = default;
    ~JsonlWriter();

    JsonlWriter(const JsonlWriter&) = delete;
    JsonlWriter& operator=(const JsonlWriter&) = delete;

    // Creates parent directories as needed.
    bool open(const std::string& path, bool append = true);
    bool is_open() const { return ofs_.is_open() && ofs_.good(); }
    const std::string& path() const { return path_; }

    void write_trades(int64_t ts_us, const std::string& tag, const std::vector<Trade>& trades);
    void write_bench(const BenchLine& line);

    uint64_t lines_written() const;
    void flush();

private:
    void put_line_(const std::string& json);

    std::string path_;
    std::ofstream ofs_;
    uint64_t lines_ = 0;
    mutable std::mutex mtx_;
};

} // namespace lob
