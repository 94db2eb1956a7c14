#include "lob/router.hpp"
#include "lob/errors.hpp"
#include "lob/json_codec.hpp"

#include <charconv>
#include <limits>
#include <string_view>
#include <utility>

namespace lob {

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static std::string percent_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out.push_back(' ');
        } else if (s[i] == '%' && i + 2 < s.size() && hex_digit(s[i + 1]) >= 0 && hex_digit(s[i + 2]) >= 0) {
            out.push_back((char)(hex_digit(s[i + 1]) * 16 + hex_digit(s[i + 2])));
            i += 2;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

Target split_target(const std::string& target) {
    Target t;
    auto q = target.find('?');
    t.path = target.substr(0, q);
    if (q == std::string::npos) return t;

    std::string_view rest(target);
    rest.remove_prefix(q + 1);

    while (!rest.empty()) {
        auto amp = rest.find('&');
        std::string_view pair = rest.substr(0, amp);
        rest = (amp == std::string_view::npos) ? std::string_view{} : rest.substr(amp + 1);
        if (pair.empty()) continue;

        auto eq = pair.find('=');
        std::string key = percent_decode(pair.substr(0, eq));
        std::string val = (eq == std::string_view::npos) ? std::string{} : percent_decode(pair.substr(eq + 1));
        t.query.emplace(std::move(key), std::move(val));
    }
    return t;
}

static HttpResponse make_response(const HttpRequest& req, http::status st, std::string body) {
    HttpResponse res{st, req.version()};
    res.set(http::field::server, "lob_server");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

static HttpResponse make_error(const HttpRequest& req, http::status st, const std::string& msg) {
    return make_response(req, st, error_to_json(msg));
}

static http::status status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NoOrders:         return http::status::not_found;
        case ErrorKind::DuplicateOrderId: return http::status::conflict;
        case ErrorKind::InvalidOrder:
        case ErrorKind::InvalidModification:
        case ErrorKind::OrderNotFound:
            break;
    }
    return http::status::bad_request;
}

static const std::string* query_param(const Target& t, const char* key) {
    auto it = t.query.find(key);
    if (it == t.query.end()) return nullptr;
    return &it->second;
}

Router::Router(OrderBook& book, TradeSink on_trades)
    : book_(book), on_trades_(std::move(on_trades)) {}

HttpResponse Router::handle(const HttpRequest& req) const {
    const Target t = split_target(std::string(req.target()));

    try {
        if (t.path == "/orders/place") {
            if (req.method() != http::verb::post) return make_error(req, http::status::method_not_allowed, "Method Not Allowed");
            return place_(req);
        }
        if (t.path == "/orders/cancel") {
            if (req.method() != http::verb::delete_) return make_error(req, http::status::method_not_allowed, "Method Not Allowed");
            return cancel_(req, t);
        }
        if (t.path == "/orders/modify") {
            if (req.method() != http::verb::patch) return make_error(req, http::status::method_not_allowed, "Method Not Allowed");
            return modify_(req, t);
        }
        if (t.path == "/orders/process") {
            if (req.method() != http::verb::post) return make_error(req, http::status::method_not_allowed, "Method Not Allowed");
            return process_(req);
        }
        if (t.path == "/orderbook/best-bid") {
            if (req.method() != http::verb::get) return make_error(req, http::status::method_not_allowed, "Method Not Allowed");
            return best_(req, Side::Buy);
        }
        if (t.path == "/orderbook/best-ask") {
            if (req.method() != http::verb::get) return make_error(req, http::status::method_not_allowed, "Method Not Allowed");
            return best_(req, Side::Sell);
        }
        if (t.path == "/orderbook/snapshot") {
            if (req.method() != http::verb::get) return make_error(req, http::status::method_not_allowed, "Method Not Allowed");
            return snapshot_(req, t);
        }
    } catch (const BookError& e) {
        return make_error(req, status_for(e.kind()), to_string(e.kind()));
    }

    return make_error(req, http::status::not_found, "Not Found");
}

HttpResponse Router::place_(const HttpRequest& req) const {
    Order o;
    std::string err;
    if (!decode_order(req.body(), o, err)) {
        return make_error(req, http::status::bad_request, err);
    }

    const std::string id = book_.place(std::move(o));
    return make_response(req, http::status::created, "{\"id\":\"" + json_escape(id) + "\"}");
}

HttpResponse Router::cancel_(const HttpRequest& req, const Target& t) const {
    const std::string* id = query_param(t, "id");
    if (!id || id->empty()) {
        return make_error(req, http::status::bad_request, "Order ID is Required");
    }

    book_.cancel(*id);
    return make_response(req, http::status::ok, "{\"status\":\"ok\"}");
}

HttpResponse Router::modify_(const HttpRequest& req, const Target& t) const {
    const std::string* id = query_param(t, "id");
    if (!id || id->empty()) {
        return make_error(req, http::status::bad_request, "Order ID is Required");
    }

    const std::string* price_s = query_param(t, "price");
    const std::string* amount_s = query_param(t, "amount");

    Price price = 0;
    Amount amount = 0;
    if (!price_s || !parse_signed_fixed(*price_s, price)) {
        return make_error(req, http::status::bad_request, "Price is Not a Number");
    }
    if (!amount_s || !parse_signed_fixed(*amount_s, amount)) {
        return make_error(req, http::status::bad_request, "Amount is Not a Number");
    }

    book_.modify(*id, price, amount);
    return make_response(req, http::status::ok, "{\"status\":\"ok\"}");
}

HttpResponse Router::process_(const HttpRequest& req) const {
    Order o;
    std::string err;
    if (!decode_order(req.body(), o, err)) {
        return make_error(req, http::status::bad_request, err);
    }

    ProcessResult r = book_.process(std::move(o));
    if (on_trades_ && !r.trades.empty()) on_trades_(r.trades);

    return make_response(req, http::status::ok, process_result_to_json(r));
}

HttpResponse Router::best_(const HttpRequest& req, Side side) const {
    const Order o = (side == Side::Buy) ? book_.best_bid() : book_.best_ask();
    return make_response(req, http::status::ok, order_to_json(o));
}

HttpResponse Router::snapshot_(const HttpRequest& req, const Target& t) const {
    std::size_t depth = std::numeric_limits<std::size_t>::max();

    if (const std::string* d = query_param(t, "depth")) {
        std::size_t v = 0;
        auto res = std::from_chars(d->data(), d->data() + d->size(), v);
        if (res.ec != std::errc{} || res.ptr != d->data() + d->size() || v == 0) {
            return make_error(req, http::status::bad_request, "depth must be a positive integer");
        }
        depth = v;
    }

    const OrderBookSnapshot snap = book_.snapshot(depth);
    return make_response(req, http::status::ok, snapshot_to_json(snap, book_.tag(), book_.id()));
}

} // namespace lob
