#include "lob/order_types.hpp"

#include <cctype>

namespace lob {

const char* to_string(Side side) {
    return side == Side::Buy ? "BUY" : "SELL";
}

bool parse_side(const std::string& s, Side& out) {
    std::string up(s);
    for (auto& c : up) c = (char)std::toupper((unsigned char)c);

    if (up == "BUY") { out = Side::Buy; return true; }
    if (up == "SELL") { out = Side::Sell; return true; }
    return false;
}

} // namespace lob
