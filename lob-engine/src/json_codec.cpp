#include "lob/json_codec.hpp"

#include <rapidjson/document.h>

#include <charconv>
#include <cstdio>
#include <sstream>
#include <system_error>

namespace lob {

bool json_number_to_fixed(std::string_view s, int64_t& out) {
    const size_t e = s.find_first_of("eE");
    if (e == std::string_view::npos) return parse_signed_fixed(s, out);

    std::string_view mant = s.substr(0, e);
    std::string_view exp_s = s.substr(e + 1);
    if (!exp_s.empty() && exp_s.front() == '+') exp_s.remove_prefix(1);

    int exp = 0;
    auto res = std::from_chars(exp_s.data(), exp_s.data() + exp_s.size(), exp);
    if (res.ec != std::errc{} || res.ptr != exp_s.data() + exp_s.size()) return false;
    if (exp > 64 || exp < -64) return false;

    bool neg = false;
    if (!mant.empty() && mant.front() == '-') {
        neg = true;
        mant.remove_prefix(1);
    }

    // Shift the decimal point by exp, then reuse the exact decimal parser.
    const size_t dot = mant.find('.');
    std::string digits(mant.substr(0, dot));
    const long point = (long)digits.size() + exp;
    if (dot != std::string_view::npos) digits += mant.substr(dot + 1);
    if (digits.empty()) return false;

    std::string text = neg ? "-" : "";
    if (point <= 0) {
        text += "0.";
        text.append((size_t)-point, '0');
        text += digits;
    } else if ((size_t)point >= digits.size()) {
        text += digits;
        text.append((size_t)point - digits.size(), '0');
    } else {
        text += digits.substr(0, (size_t)point);
        text += '.';
        text += digits.substr((size_t)point);
    }

    // "100e-2" -> "1.00": zeros past the last significant digit are exact
    if (text.find('.') != std::string::npos) {
        while (text.back() == '0') text.pop_back();
    }
    return parse_signed_fixed(text, out);
}

static bool fixed_member(const rapidjson::Document& doc, const char* key, int64_t& out) {
    auto it = doc.FindMember(key);
    if (it == doc.MemberEnd() || !it->value.IsString()) return false;
    return json_number_to_fixed(std::string_view(it->value.GetString(), it->value.GetStringLength()), out);
}

bool decode_order(const std::string& body, Order& out, std::string& err) {
    // Numbers arrive as their source text so price/amount never pass through double.
    rapidjson::Document doc;
    doc.Parse<rapidjson::kParseNumbersAsStringsFlag>(body.c_str(), body.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        err = "Invalid Request Body";
        return false;
    }

    Order o;

    auto idIt = doc.FindMember("id");
    if (idIt != doc.MemberEnd()) {
        if (!idIt->value.IsString()) { err = "id must be a string"; return false; }
        o.id.assign(idIt->value.GetString(), idIt->value.GetStringLength());
    }

    auto sideIt = doc.FindMember("side");
    if (sideIt == doc.MemberEnd() || !sideIt->value.IsString() ||
        !parse_side(std::string(sideIt->value.GetString(), sideIt->value.GetStringLength()), o.side)) {
        err = "side must be \"BUY\" or \"SELL\"";
        return false;
    }

    // Malformed values fail here; zero and negatives are the book's to reject.
    if (!fixed_member(doc, "price", o.price)) { err = "Price is Not a Number"; return false; }
    if (!fixed_member(doc, "amount", o.amount)) { err = "Amount is Not a Number"; return false; }

    out = std::move(o);
    return true;
}

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

std::string order_to_json(const Order& o) {
    std::ostringstream oss;
    oss << "{"
        << "\"id\":\"" << json_escape(o.id) << "\","
        << "\"price\":" << format_fixed(o.price) << ","
        << "\"amount\":" << format_fixed(o.amount) << ","
        << "\"side\":\"" << to_string(o.side) << "\""
        << "}";
    return oss.str();
}

std::string trade_to_json(const Trade& t) {
    std::ostringstream oss;
    oss << "{"
        << "\"buy_order_id\":\"" << json_escape(t.buy_order_id) << "\","
        << "\"sell_order_id\":\"" << json_escape(t.sell_order_id) << "\","
        << "\"price\":" << format_fixed(t.price) << ","
        << "\"amount\":" << format_fixed(t.amount)
        << "}";
    return oss.str();
}

std::string trades_to_json(const std::vector<Trade>& trades) {
    std::string out = "[";
    bool first = true;
    for (const auto& t : trades) {
        if (!first) out += ",";
        first = false;
        out += trade_to_json(t);
    }
    out += "]";
    return out;
}

std::string process_result_to_json(const ProcessResult& r) {
    std::ostringstream oss;
    oss << "{"
        << "\"order_id\":\"" << json_escape(r.order_id) << "\","
        << "\"remaining\":" << format_fixed(r.remaining) << ","
        << "\"trades\":" << trades_to_json(r.trades)
        << "}";
    return oss.str();
}

static void levels_to_json(std::ostringstream& oss, const std::vector<OrderBookLevel>& levels) {
    oss << "[";
    bool first = true;
    for (const auto& l : levels) {
        if (!first) oss << ",";
        first = false;
        oss << "{"
            << "\"price\":" << format_fixed(l.price) << ","
            << "\"total_amount\":" << format_fixed(l.total_amount) << ","
            << "\"order_count\":" << l.order_count
            << "}";
    }
    oss << "]";
}

std::string snapshot_to_json(const OrderBookSnapshot& snap,
                             const std::string& tag,
                             const std::string& book_id) {
    std::ostringstream oss;
    oss << "{";
    if (!tag.empty()) oss << "\"tag\":\"" << json_escape(tag) << "\",";
    if (!book_id.empty()) oss << "\"book_id\":\"" << json_escape(book_id) << "\",";
    oss << "\"ts_us\":" << snap.ts_us << ",";

    oss << "\"asks\":";
    levels_to_json(oss, snap.asks);
    oss << ",\"bids\":";
    levels_to_json(oss, snap.bids);

    oss << "}";
    return oss.str();
}

std::string error_to_json(const std::string& message) {
    return std::string("{\"error\":\"") + json_escape(message) + "\"}";
}

} // namespace lob
