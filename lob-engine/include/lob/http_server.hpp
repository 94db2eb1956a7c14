#pragma once
#include "lob/latency_histogram.hpp"
#include "lob/router.hpp"

#include <boost/asio.hpp>

#include <cstdint>
#include <mutex>
#include <string>

namespace lob {

// Shared by all sessions; handlers run on several io_context threads.
struct ServerStats {
    std::mutex mtx;
    LatencyHistogram handle_latency;
    uint64_t requests = 0;
    uint64_t client_errors = 0;   // 4xx
    uint64_t server_errors = 0;   // 5xx
};

// Start accepting HTTP/1.1 connections on bind_addr:port.
// Throws std::runtime_error if the listener cannot be set up.
// router and stats must outlive ioc.run().
void start_http_server(boost::asio::io_context& ioc,
                       const std::string& bind_addr,
                       int port,
                       const Router& router,
                       ServerStats& stats);

} // namespace lob
