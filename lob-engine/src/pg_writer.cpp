#include "lob/pg_writer.hpp"

#include <postgresql/libpq-fe.h>

#include <iostream>
#include <utility>

namespace lob {

namespace {

const char* kCreateTable =
    "CREATE TABLE IF NOT EXISTS lob_trades ("
    " ts timestamptz NOT NULL,"
    " tag text NOT NULL,"
    " buy_order_id text NOT NULL,"
    " sell_order_id text NOT NULL,"
    " price numeric NOT NULL,"
    " amount numeric NOT NULL)";

// numeric columns take the canonical decimal text from format_fixed
const char* kInsertTrade =
    "INSERT INTO lob_trades (ts, tag, buy_order_id, sell_order_id, price, amount) "
    "VALUES (to_timestamp($1::bigint / 1e6), $2, $3, $4, $5::numeric, $6::numeric)";

bool exec_command(PGconn* conn, const char* sql, const char* what) {
    PGresult* res = PQexec(conn, sql);
    const bool ok = (PQresultStatus(res) == PGRES_COMMAND_OK);
    if (!ok) {
        std::cerr << "[pg] " << what << " failed: " << PQerrorMessage(conn) << "\n";
    }
    PQclear(res);
    return ok;
}

} // namespace

struct PgWriter::Impl {
    PGconn* conn = nullptr;
};

PgWriter::PgWriter(const std::string& conninfo, std::string tag)
    : impl_(new Impl), tag_(std::move(tag)) {
    impl_->conn = PQconnectdb(conninfo.c_str());

    if (PQstatus(impl_->conn) != CONNECTION_OK) {
        std::cerr << "[pg] connection failed: " << PQerrorMessage(impl_->conn) << "\n";
        PQfinish(impl_->conn);
        impl_->conn = nullptr;
        return;
    }

    bool ready = exec_command(impl_->conn, kCreateTable, "create table");
    if (ready) {
        PGresult* prep = PQprepare(impl_->conn, "insert_trade", kInsertTrade, 6, nullptr);
        ready = (PQresultStatus(prep) == PGRES_COMMAND_OK);
        if (!ready) {
            std::cerr << "[pg] prepare failed: " << PQerrorMessage(impl_->conn) << "\n";
        }
        PQclear(prep);
    }

    // a connection we cannot insert through counts as not connected
    if (!ready) {
        PQfinish(impl_->conn);
        impl_->conn = nullptr;
    }
}

PgWriter::~PgWriter() {
    if (impl_->conn) PQfinish(impl_->conn);
    delete impl_;
}

bool PgWriter::connected() const {
    return impl_->conn != nullptr;
}

bool PgWriter::write_batch(const std::vector<TradeRecord>& batch) {
    if (!connected()) return false;
    if (batch.empty()) return true;

    if (!exec_command(impl_->conn, "BEGIN", "begin")) return false;

    for (const auto& rec : batch) {
        const std::string ts = std::to_string(rec.ts_us);
        const std::string px = format_fixed(rec.trade.price);
        const std::string amt = format_fixed(rec.trade.amount);

        const char* values[6] = {
            ts.c_str(),
            tag_.c_str(),
            rec.trade.buy_order_id.c_str(),
            rec.trade.sell_order_id.c_str(),
            px.c_str(),
            amt.c_str(),
        };

        PGresult* res = PQexecPrepared(impl_->conn, "insert_trade", 6, values, nullptr, nullptr, 0);
        const bool ok = (PQresultStatus(res) == PGRES_COMMAND_OK);
        if (!ok) {
            std::cerr << "[pg] insert failed: " << PQerrorMessage(impl_->conn) << "\n";
        }
        PQclear(res);

        if (!ok) {
            exec_command(impl_->conn, "ROLLBACK", "rollback");
            return false;
        }
    }

    if (!exec_command(impl_->conn, "COMMIT", "commit")) return false;
    rows_ += batch.size();
    return true;
}

} // namespace lob
