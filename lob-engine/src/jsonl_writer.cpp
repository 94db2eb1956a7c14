#include "lob/jsonl_writer.hpp"
#include "lob/json_codec.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>

namespace lob {

JsonlWriter::~JsonlWriter() {
    flush();
}

bool JsonlWriter::open(const std::string& path, bool append) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (ofs_.is_open()) ofs_.close();
    path_ = path;

    std::filesystem::path fp(path);
    if (fp.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(fp.parent_path(), ec);
        if (ec) {
            std::cerr << "[jsonl] cannot create " << fp.parent_path() << ": " << ec.message() << "\n";
            return false;
        }
    }

    ofs_.open(path, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
    if (!ofs_) {
        std::cerr << "[jsonl] failed to open: " << path << "\n";
        return false;
    }
    return true;
}

// caller holds mtx_
void JsonlWriter::put_line_(const std::string& json) {
    ofs_ << json << '\n';
    ++lines_;
}

void JsonlWriter::write_trades(int64_t ts_us, const std::string& tag, const std::vector<Trade>& trades) {
    if (trades.empty()) return;

    const std::string prefix =
        "{\"ts_us\":" + std::to_string(ts_us) + ",\"tag\":\"" + json_escape(tag) + "\",\"trade\":";

    std::lock_guard<std::mutex> lk(mtx_);
    if (!is_open()) return;
    for (const auto& t : trades) {
        put_line_(prefix + trade_to_json(t) + "}");
    }
}

void JsonlWriter::write_bench(const BenchLine& b) {
    std::ostringstream oss;
    oss << "{\"ts_wall_us\":" << b.ts_wall_us
        << ",\"input\":\"" << json_escape(b.input) << "\""
        << ",\"processed\":" << b.processed
        << ",\"rejected\":" << b.rejected
        << ",\"trades\":" << b.trades
        << ",\"resting\":" << b.resting
        << ",\"elapsed_s\":" << b.elapsed_s
        << ",\"orders_per_s\":" << b.orders_per_s
        << ",\"latency_us\":{\"p50\":" << b.p50_us
        << ",\"p95\":" << b.p95_us
        << ",\"p99\":" << b.p99_us << "}}";

    std::lock_guard<std::mutex> lk(mtx_);
    if (!is_open()) return;
    put_line_(oss.str());
}

uint64_t JsonlWriter::lines_written() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return lines_;
}

void JsonlWriter::flush() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (ofs_.is_open()) ofs_.flush();
}

} // namespace lob
