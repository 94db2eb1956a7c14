#include "lob/app_config.hpp"

#include <cstdlib>
#include <iostream>

namespace lob {

static std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string{};
}

void usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <port> [tag=MAIN] [threads=1]\n"
        << "Example: " << prog << " 8080 BTC-USD 4\n"
        << "Env: LOB_BIND=0.0.0.0 (optional)\n"
        << "Env: TRADE_LOG_PATH=trades.jsonl (optional)\n"
        << "Env: PG_CONNINFO=\"host=127.0.0.1 port=5432 dbname=lob user=postgres password=postgres\" (optional)\n"
        << "Env: FINAL_SNAPSHOT_PATH=final_book.json (optional)\n";
}

AppConfig parse_config(int argc, char** argv) {
    AppConfig cfg;

    if (argc < 2) {
        usage(argv[0]);
        return cfg;
    }

    cfg.port = std::atoi(argv[1]);
    if (argc >= 3 && argv[2][0] != '\0') cfg.tag = argv[2];
    cfg.threads = (argc >= 4) ? std::atoi(argv[3]) : 1;

    if (cfg.port <= 0 || cfg.port > 65535) {
        std::cerr << "[config] invalid port: " << argv[1] << "\n";
        usage(argv[0]);
        return cfg;
    }
    if (cfg.threads < 1) cfg.threads = 1;

    if (auto b = env_or_empty("LOB_BIND"); !b.empty()) cfg.bind_addr = b;
    cfg.trade_log_path = env_or_empty("TRADE_LOG_PATH");
    cfg.pg_conninfo = env_or_empty("PG_CONNINFO");
    cfg.final_snapshot_path = env_or_empty("FINAL_SNAPSHOT_PATH");

    cfg.ok = true;
    return cfg;
}

} // namespace lob
