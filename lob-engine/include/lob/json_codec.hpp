#pragma once
#include "lob/order_types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lob {

// ---------------- Decoding (RapidJSON) ----------------
// Order requests are JSON objects, e.g.
//   {"id":"b1","price":100.25,"amount":"2","side":"BUY"}
// price/amount may be JSON numbers (exponents allowed) or decimal strings;
// either way the conversion to fixed point is exact or fails.
// id is optional (left empty). Returns false and sets err on failure.
bool decode_order(const std::string& body, Order& out, std::string& err);

// Text of a JSON number or decimal string -> fixed point, e.g. "1e2", "-0.5", "2.5E-1".
bool json_number_to_fixed(std::string_view text, int64_t& out);

// ---------------- Encoding ----------------
std::string json_escape(const std::string& s);

std::string order_to_json(const Order& o);
std::string trade_to_json(const Trade& t);
std::string trades_to_json(const std::vector<Trade>& trades);
std::string process_result_to_json(const ProcessResult& r);
std::string snapshot_to_json(const OrderBookSnapshot& snap,
                             const std::string& tag,
                             const std::string& book_id);
std::string error_to_json(const std::string& message);

} // namespace lob
