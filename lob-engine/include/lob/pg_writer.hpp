#pragma once
#include "lob/order_types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace lob {

// One executed trade as persisted: wall-clock time and book tag attached.
struct TradeRecord {
    int64_t ts_us = 0;
    Trade trade;
};

/**
 * PostgreSQL sink for executed trades.
 *
 * Creates the table on connect if missing:
 *   lob_trades (ts timestamptz, tag text, buy_order_id text,
 *               sell_order_id text, price numeric, amount numeric)
 *
 * Not thread-safe; drive it from a single writer thread.
 */
class PgWriter {
public:
    // conninfo e.g. "host=127.0.0.1 port=5432 dbname=lob user=postgres"
    PgWriter(const std::string& conninfo, std::string tag);
    ~PgWriter();

    PgWriter(const PgWriter&) = delete;
    PgWriter& operator=(const PgWriter&) = delete;

    bool connected() const;

    // Inserts the whole batch in one transaction; rolls back on the first failure.
    bool write_batch(const std::vector<TradeRecord>& batch);

    uint64_t rows_written() const { return rows_; }

private:
    struct Impl;
    Impl* impl_;
    std::string tag_;
    uint64_t rows_ = 0;
};

} // namespace lob
