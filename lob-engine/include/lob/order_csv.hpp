#pragma once
#include "lob/order_types.hpp"

#include <string>

namespace lob {

// Parse one order line: side,price,amount[,id]
//   BUY,100.5,2,b1
//   sell,101,0.25
// Returns false for the header line, blank lines and malformed input.
bool parse_order_csv_line(const std::string& line, Order& out);

} // namespace lob
