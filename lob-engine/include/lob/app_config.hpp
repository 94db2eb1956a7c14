#pragma once
#include <string>

namespace lob {

struct AppConfig {
    // CLI
    int port = 0;
    std::string tag = "MAIN";
    int threads = 1;

    // env
    std::string bind_addr = "0.0.0.0";
    std::string trade_log_path;       // empty => disabled
    std::string pg_conninfo;          // empty => disabled
    std::string final_snapshot_path;  // empty => disabled

    bool ok = false;                  // false => usage was printed, caller exits
};

// prints usage
void usage(const char* prog);

// parse CLI + env
AppConfig parse_config(int argc, char** argv);

} // namespace lob
