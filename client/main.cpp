#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <csignal>

#include "ControlClient.hpp"
#include "../common/Messages.hpp"
#include "../common/protocol.hpp"

namespace
{
    using port_watch::protocol::MessageType;

    void PrintUsage(const char *program)
    {
        std::cout << "Usage: " << program << " [--host h] [--port n] [--ca file] <command> [args]\n"
                  << "Commands:\n"
                  << "  ping                                 check the daemon is alive\n"
                  << "  settings                             show probe interval and task status\n"
                  << "  set-interval <seconds>               10..86400\n"
                  << "  start | stop                         switch the probing task\n"
                  << "  stats [range] [region]               per-target statistics (range 1d 7d 1M 3M 6M 1Y)\n"
                  << "  export [range] [region] [--out f]    CSV export\n"
                  << "  summary                              24h overview\n";
    }

    bool ParseInt(const std::string &text, int &out)
    {
        errno = 0;
        char *end = nullptr;
        long v = std::strtol(text.c_str(), &end, 10);
        if (errno != 0 || end == text.c_str() || *end != '\0' || v < INT32_MIN || v > INT32_MAX)
            return false;
        out = static_cast<int>(v);
        return true;
    }

    // Prints an ErrorResp (or an unexpected reply type) and returns the exit code.
    int ReportFailure(const port_watch::client::Response &resp, MessageType expected)
    {
        if (resp.type == MessageType::ErrorResp)
        {
            port_watch::protocol::ErrorReply err;
            if (port_watch::protocol::DecodeError(resp.data, err))
            {
                std::cerr << "Error (" << static_cast<int>(err.code) << "): " << err.message << "\n";
                return 2;
            }
            std::cerr << "Error: malformed error reply\n";
            return 2;
        }
        std::cerr << "Unexpected reply " << port_watch::protocol::MessageTypeName(resp.type) << ", wanted "
                  << port_watch::protocol::MessageTypeName(expected) << "\n";
        return 3;
    }

    void PrintSettings(const port_watch::common::Settings &s)
    {
        std::cout << "probe_interval_seconds: " << s.probe_interval_seconds << "\n"
                  << "task_status:            " << port_watch::common::TaskStatusName(s.task_status) << "\n";
    }

    void PrintStats(const std::vector<port_watch::common::TargetStats> &stats)
    {
        std::cout << std::left << std::setw(12) << "REGION" << std::setw(18) << "HOST" << std::setw(7) << "PORT"
                  << std::setw(20) << "SYSTEM" << std::right << std::setw(10) << "AVG(ms)" << std::setw(9)
                  << "LOSS%" << std::setw(8) << "TOTAL" << std::setw(8) << "OK" << "\n";

        std::cout << std::fixed << std::setprecision(2);
        for (const auto &s : stats)
        {
            std::cout << std::left << std::setw(12) << s.region << std::setw(18) << s.host << std::setw(7) << s.port
                      << std::setw(20) << s.business_system << std::right << std::setw(10);
            if (s.avg_latency_ms)
                std::cout << *s.avg_latency_ms;
            else
                std::cout << "-";
            std::cout << std::setw(9) << s.packet_loss_rate << std::setw(8) << s.total_probes << std::setw(8)
                      << s.successful_probes << "\n";
        }
        std::cout << stats.size() << " target(s)\n";
    }

    void PrintSummary(const port_watch::common::SummaryStats &s)
    {
        std::cout << "active targets:     " << s.total_targets << "\n"
                  << "probes (24h):       " << s.recent_probes_24h << "\n"
                  << "success rate (24h): " << std::fixed << std::setprecision(2) << s.success_rate_24h << "%\n";
        if (!s.regions.empty())
        {
            std::cout << "targets by region:\n";
            for (const auto &r : s.regions)
                std::cout << "  " << std::left << std::setw(16) << r.region << r.count << "\n";
        }
    }
}

int main(int argc, char *argv[])
{
    std::string host = "127.0.0.1";
    int port = 8443;
    std::string ca_path;
    std::vector<std::string> positional;
    std::string out_path;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--host" && has_value)
            host = argv[++i];
        else if (arg == "--port" && has_value)
        {
            if (!ParseInt(argv[++i], port) || port <= 0 || port > 65535)
            {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 1;
            }
        }
        else if (arg == "--ca" && has_value)
            ca_path = argv[++i];
        else if (arg == "--out" && has_value)
            out_path = argv[++i];
        else if (arg == "--help" || arg == "-h")
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (arg.rfind("--", 0) == 0)
        {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            PrintUsage(argv[0]);
            return 1;
        }
        else
            positional.push_back(arg);
    }

    if (positional.empty())
    {
        PrintUsage(argv[0]);
        return 1;
    }

    const std::string command = positional[0];
    MessageType req_type;
    MessageType resp_type;
    std::vector<uint8_t> payload;

    if (command == "ping")
    {
        req_type = MessageType::HeartbeatReq;
        resp_type = MessageType::HeartbeatResp;
    }
    else if (command == "settings")
    {
        req_type = MessageType::SettingsGetReq;
        resp_type = MessageType::SettingsGetResp;
    }
    else if (command == "set-interval")
    {
        int seconds = 0;
        if (positional.size() != 2 || !ParseInt(positional[1], seconds))
        {
            std::cerr << "set-interval expects a number of seconds\n";
            return 1;
        }
        req_type = MessageType::ProbeIntervalSetReq;
        resp_type = MessageType::ProbeIntervalSetResp;
        payload = port_watch::protocol::EncodeProbeInterval(seconds);
    }
    else if (command == "start" || command == "stop")
    {
        req_type = MessageType::TaskStatusSetReq;
        resp_type = MessageType::TaskStatusSetResp;
        payload = port_watch::protocol::EncodeText(command == "start" ? "running" : "stopped");
    }
    else if (command == "stats" || command == "export")
    {
        port_watch::protocol::StatsQuery query;
        query.time_range = positional.size() > 1 ? positional[1] : "1d";
        query.region = positional.size() > 2 ? positional[2] : "";
        payload = port_watch::protocol::EncodeStatsQuery(query);
        if (command == "stats")
        {
            req_type = MessageType::StatsQueryReq;
            resp_type = MessageType::StatsQueryResp;
        }
        else
        {
            req_type = MessageType::StatsExportReq;
            resp_type = MessageType::StatsExportResp;
        }
    }
    else if (command == "summary")
    {
        req_type = MessageType::SummaryReq;
        resp_type = MessageType::SummaryResp;
    }
    else
    {
        std::cerr << "Unknown command: " << command << "\n";
        PrintUsage(argv[0]);
        return 1;
    }

    std::signal(SIGPIPE, SIG_IGN);

    try
    {
        port_watch::client::ControlClient client(host, port, ca_path);
        if (!client.Connect())
        {
            std::cerr << "Could not connect to " << host << ":" << port << "\n";
            return 4;
        }

        auto resp = client.Request(req_type, payload);
        if (!resp)
        {
            std::cerr << "No reply from server\n";
            return 4;
        }
        if (resp->type != resp_type)
            return ReportFailure(*resp, resp_type);

        switch (resp_type)
        {
        case MessageType::HeartbeatResp:
            std::cout << "pong\n";
            break;
        case MessageType::SettingsGetResp:
        case MessageType::ProbeIntervalSetResp:
        case MessageType::TaskStatusSetResp:
        {
            port_watch::common::Settings settings;
            if (!port_watch::protocol::DecodeSettings(resp->data, settings))
            {
                std::cerr << "Malformed settings reply\n";
                return 3;
            }
            PrintSettings(settings);
            break;
        }
        case MessageType::StatsQueryResp:
        {
            std::vector<port_watch::common::TargetStats> stats;
            if (!port_watch::protocol::DecodeTargetStats(resp->data, stats))
            {
                std::cerr << "Malformed stats reply\n";
                return 3;
            }
            PrintStats(stats);
            break;
        }
        case MessageType::StatsExportResp:
        {
            std::string csv;
            if (!port_watch::protocol::DecodeText(resp->data, csv))
            {
                std::cerr << "Malformed export reply\n";
                return 3;
            }
            if (out_path.empty())
            {
                std::cout << csv;
                break;
            }
            std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
            out << csv;
            if (!out)
            {
                std::cerr << "Cannot write " << out_path << "\n";
                return 5;
            }
            std::cout << "Wrote " << csv.size() << " bytes to " << out_path << "\n";
            break;
        }
        case MessageType::SummaryResp:
        {
            port_watch::common::SummaryStats summary;
            if (!port_watch::protocol::DecodeSummary(resp->data, summary))
            {
                std::cerr << "Malformed summary reply\n";
                return 3;
            }
            PrintSummary(summary);
            break;
        }
        default:
            break;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Client error: " << e.what() << "\n";
        return 4;
    }

    return 0;
}
