#include "lob/json_codec.hpp"
#include "lob/order_csv.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <chrono>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

using boost::asio::ip::tcp;
namespace beast = boost::beast;
namespace http = beast::http;
using SteadyClock = std::chrono::steady_clock;

static std::string order_body(const lob::Order& o) {
    std::string body = "{";
    if (!o.id.empty()) body += "\"id\":\"" + lob::json_escape(o.id) + "\",";
    body += "\"price\":\"" + lob::format_fixed(o.price) + "\",";
    body += "\"amount\":\"" + lob::format_fixed(o.amount) + "\",";
    body += std::string("\"side\":\"") + lob::to_string(o.side) + "\"}";
    return body;
}

int main(int argc, char* argv[]) {
    // 1. Parameter check
    if (argc < 4) {
        std::cerr
            << "Usage: order_replay <csv_path> <host> <port> [rate_orders_per_sec=1000] [max_orders=-1]\n"
            << "Example: order_replay orders.csv 127.0.0.1 8080 500\n";
        return 1;
    }

    const std::string csv_path = argv[1];
    const std::string host = argv[2];
    const std::string port = argv[3];
    const int rate = (argc >= 5) ? std::stoi(argv[4]) : 1000;
    const long long max_orders = (argc >= 6) ? std::stoll(argv[5]) : -1;

    if (rate <= 0) {
        std::cerr << "[replay] rate must be positive\n";
        return 1;
    }

    // 2. Open file
    std::ifstream fin(csv_path);
    if (!fin) {
        std::cerr << "[replay] Failed to open: " << csv_path << "\n";
        return 1;
    }

    long long sent_total = 0;
    long long trades_total = 0;
    long long rejected = 0;

    try {
        // 3. Connect (one keep-alive connection for the whole replay)
        boost::asio::io_context io;
        tcp::resolver resolver(io);
        beast::tcp_stream stream(io);
        stream.connect(resolver.resolve(host, port));
        stream.socket().set_option(tcp::no_delay(true));
        std::cout << "[replay] connected to " << host << ":" << port << "\n";

        beast::flat_buffer buffer;
        std::string line;
        auto last_log = SteadyClock::now();

        // 4. Main loop: up to `rate` orders per one-second window
        bool done = false;
        while (!done) {
            auto sec_start = SteadyClock::now();
            int sent_this_sec = 0;

            while (sent_this_sec < rate) {
                if (max_orders >= 0 && sent_total >= max_orders) { done = true; break; }
                if (!std::getline(fin, line)) { done = true; break; }

                lob::Order o;
                if (!lob::parse_order_csv_line(line, o)) continue;

                http::request<http::string_body> req{http::verb::post, "/orders/process", 11};
                req.set(http::field::host, host);
                req.set(http::field::content_type, "application/json");
                req.keep_alive(true);
                req.body() = order_body(o);
                req.prepare_payload();

                http::write(stream, req);

                http::response<http::string_body> res;
                http::read(stream, buffer, res);

                if (res.result() != http::status::ok) {
                    ++rejected;
                    std::cerr << "[replay] " << res.result_int() << " " << res.body() << "\n";
                } else {
                    // count trade objects without a full JSON parser
                    const std::string& b = res.body();
                    for (auto pos = b.find("\"buy_order_id\""); pos != std::string::npos;
                         pos = b.find("\"buy_order_id\"", pos + 1)) {
                        ++trades_total;
                    }
                }

                ++sent_this_sec;
                ++sent_total;
            }

            if (done) break;

            // Rate control: sleep out the rest of the 1-second window
            auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                SteadyClock::now() - sec_start).count();
            if (elapsed_ms < 1000) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1000 - elapsed_ms));
            }

            auto now = SteadyClock::now();
            if (std::chrono::duration_cast<std::chrono::milliseconds>(now - last_log).count() >= 1000) {
                std::cout << "[replay] sent_total=" << sent_total
                          << " (target " << rate << " orders/s)\n";
                last_log = now;
            }
        }

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected) {
            std::cerr << "[replay] shutdown error: " << ec.message() << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[replay] Exception: " << e.what() << "\n";
        return 1;
    }

    std::cout << "[replay] done. sent=" << sent_total
              << " trades=" << trades_total
              << " rejected=" << rejected << "\n";
    return 0;
}
