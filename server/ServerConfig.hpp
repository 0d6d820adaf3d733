#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace port_watch::server
{
    // Process options for portwatchd. Runtime settings (interval, task status)
    // live in the database, not here.
    struct ServerConfig
    {
        std::string db_path = "portwatch.db";
        int port = 8443;
        std::string cert_path = "certs/server.crt";
        std::string key_path = "certs/server.key";
        std::chrono::milliseconds probe_timeout{3000};
        int max_concurrency = 50;
        int retention_days = 31;
        std::chrono::milliseconds tick{1000};
        bool listen = true;
        bool verbose = false;
        bool show_help = false;
    };

    // Throws std::invalid_argument for unknown flags, missing values and
    // out-of-range numbers.
    ServerConfig ParseServerArgs(const std::vector<std::string> &args);

    std::string ServerUsage(const std::string &program);
}
