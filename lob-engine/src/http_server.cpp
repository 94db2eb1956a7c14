#include "lob/http_server.hpp"
#include "lob/json_codec.hpp"

#include <boost/beast.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace lob {

using boost::asio::ip::tcp;
namespace beast = boost::beast;

using SteadyClock = std::chrono::steady_clock;

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, const Router& router, ServerStats& stats)
        : stream_(std::move(socket))
        , router_(router)
        , stats_(stats) {}

    void run() {
        // start on the session strand
        boost::asio::dispatch(
            stream_.get_executor(),
            beast::bind_front_handler(&HttpSession::do_read, shared_from_this())
        );
    }

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    HttpRequest req_;
    std::shared_ptr<HttpResponse> res_;

    const Router& router_;
    ServerStats& stats_;

    void do_read() {
        req_ = {};
        stream_.expires_after(std::chrono::seconds(30));

        http::async_read(
            stream_, buffer_, req_,
            beast::bind_front_handler(&HttpSession::on_read, shared_from_this())
        );
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            do_close();
            return;
        }
        if (ec) {
            if (ec != beast::error::timeout) {
                std::cerr << "[http] read: " << ec.message() << "\n";
            }
            return;
        }

        auto t0 = SteadyClock::now();
        auto res = std::make_shared<HttpResponse>(handle_safely());
        auto t1 = SteadyClock::now();
        record(*res, t1 - t0);

        res_ = res;
        http::async_write(
            stream_, *res_,
            beast::bind_front_handler(&HttpSession::on_write, shared_from_this(), res_->need_eof())
        );
    }

    // The router maps book errors itself; anything else is a 500.
    HttpResponse handle_safely() {
        try {
            return router_.handle(req_);
        } catch (const std::exception& e) {
            std::cerr << "[http] handler failed: " << e.what() << "\n";
            HttpResponse res{http::status::internal_server_error, req_.version()};
            res.set(http::field::server, "lob_server");
            res.set(http::field::content_type, "application/json");
            res.keep_alive(false);
            res.body() = error_to_json("Internal Server Error");
            res.prepare_payload();
            return res;
        }
    }

    void record(const HttpResponse& res, SteadyClock::duration d) {
        const uint64_t ns =
            (uint64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(d).count();
        const unsigned code = res.result_int();

        std::lock_guard<std::mutex> lk(stats_.mtx);
        stats_.handle_latency.record(ns);
        stats_.requests++;
        if (code >= 500) stats_.server_errors++;
        else if (code >= 400) stats_.client_errors++;
    }

    void on_write(bool close, beast::error_code ec, std::size_t) {
        if (ec) {
            std::cerr << "[http] write: " << ec.message() << "\n";
            return;
        }
        if (close) {
            do_close();
            return;
        }
        res_.reset();
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
};

class HttpListener : public std::enable_shared_from_this<HttpListener> {
public:
    HttpListener(boost::asio::io_context& ioc, tcp::endpoint ep,
                 const Router& router, ServerStats& stats)
        : ioc_(ioc), acceptor_(ioc), router_(router), stats_(stats) {
        beast::error_code ec;

        acceptor_.open(ep.protocol(), ec);
        if (ec) throw std::runtime_error("acceptor.open: " + ec.message());

        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (ec) throw std::runtime_error("acceptor.set_option: " + ec.message());

        acceptor_.bind(ep, ec);
        if (ec) throw std::runtime_error("acceptor.bind: " + ec.message());

        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec) throw std::runtime_error("acceptor.listen: " + ec.message());
    }

    void run() { do_accept(); }

private:
    boost::asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    const Router& router_;
    ServerStats& stats_;

    void do_accept() {
        acceptor_.async_accept(
            boost::asio::make_strand(ioc_),
            beast::bind_front_handler(&HttpListener::on_accept, shared_from_this())
        );
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == boost::asio::error::operation_aborted) return;   // stopped
        if (ec) {
            std::cerr << "[http] accept: " << ec.message() << "\n";
        } else {
            std::make_shared<HttpSession>(std::move(socket), router_, stats_)->run();
        }
        do_accept();
    }
};

void start_http_server(boost::asio::io_context& ioc,
                       const std::string& bind_addr,
                       int port,
                       const Router& router,
                       ServerStats& stats) {
    beast::error_code ec;
    auto addr = boost::asio::ip::make_address(bind_addr, ec);
    if (ec) throw std::runtime_error("bad bind address '" + bind_addr + "': " + ec.message());

    auto listener = std::make_shared<HttpListener>(
        ioc, tcp::endpoint(addr, static_cast<unsigned short>(port)), router, stats
    );
    listener->run();
}

} // namespace lob
