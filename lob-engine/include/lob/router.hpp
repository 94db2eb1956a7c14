#pragma once
#include "lob/order_book.hpp"
#include "lob/order_types.hpp"

#include <boost/beast/http.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace lob {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// Called with every non-empty trade batch, after the book lock is released.
using TradeSink = std::function<void(const std::vector<Trade>&)>;

struct Target {
    std::string path;
    std::map<std::string, std::string> query;   // percent-decoded
};

// "/orders/cancel?id=a%20b" -> {"/orders/cancel", {id: "a b"}}
Target split_target(const std::string& target);

/**
 * Maps HTTP requests onto OrderBook operations.
 * Pure request -> response; no sockets, so it is driven directly in tests.
 */
class Router {
public:
    explicit Router(OrderBook& book, TradeSink on_trades = nullptr);

    HttpResponse handle(const HttpRequest& req) const;

private:
    HttpResponse place_(const HttpRequest& req) const;
    HttpResponse cancel_(const HttpRequest& req, const Target& t) const;
    HttpResponse modify_(const HttpRequest& req, const Target& t) const;
    HttpResponse process_(const HttpRequest& req) const;
    HttpResponse best_(const HttpRequest& req, Side side) const;
    HttpResponse snapshot_(const HttpRequest& req, const Target& t) const;

    OrderBook& book_;
    TradeSink on_trades_;
};

} // namespace lob
