#include "ServerConfig.hpp"

#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace port_watch::server
{
    namespace
    {
        long ParseNumber(const std::string &flag, const std::string &text, long min, long max)
        {
            if (text.empty())
                throw std::invalid_argument(flag + " expects a number");

            errno = 0;
            char *end = nullptr;
            long value = std::strtol(text.c_str(), &end, 10);
            if (errno != 0 || end == text.c_str() || *end != '\0')
                throw std::invalid_argument(flag + ": '" + text + "' is not a number");
            if (value < min || value > max)
            {
                throw std::invalid_argument(flag + " must be between " + std::to_string(min) + " and " +
                                            std::to_string(max));
            }
            return value;
        }
    }

    ServerConfig ParseServerArgs(const std::vector<std::string> &args)
    {
        ServerConfig cfg;

        for (size_t i = 0; i < args.size(); ++i)
        {
            const std::string &arg = args[i];

            auto value = [&]() -> const std::string &
            {
                if (i + 1 >= args.size())
                    throw std::invalid_argument(arg + " requires a value");
                return args[++i];
            };

            if (arg == "--db")
                cfg.db_path = value();
            else if (arg == "--port")
                cfg.port = static_cast<int>(ParseNumber(arg, value(), 0, 65535));
            else if (arg == "--cert")
                cfg.cert_path = value();
            else if (arg == "--key")
                cfg.key_path = value();
            else if (arg == "--timeout-ms")
                cfg.probe_timeout = std::chrono::milliseconds(ParseNumber(arg, value(), 1, 600000));
            else if (arg == "--max-concurrency")
                cfg.max_concurrency = static_cast<int>(ParseNumber(arg, value(), 1, 10000));
            else if (arg == "--retention-days")
                cfg.retention_days = static_cast<int>(ParseNumber(arg, value(), 1, 3650));
            else if (arg == "--tick-ms")
                cfg.tick = std::chrono::milliseconds(ParseNumber(arg, value(), 1, 60000));
            else if (arg == "--no-listen")
                cfg.listen = false;
            else if (arg == "--verbose" || arg == "-v")
                cfg.verbose = true;
            else if (arg == "--help" || arg == "-h")
                cfg.show_help = true;
            else
                throw std::invalid_argument("Unknown option: " + arg);
        }

        if (cfg.db_path.empty())
            throw std::invalid_argument("--db must not be empty");

        return cfg;
    }

    std::string ServerUsage(const std::string &program)
    {
        std::ostringstream out;
        out << "Usage: " << program << " [options]\n"
            << "  --db <path>              SQLite database (default portwatch.db)\n"
            << "  --port <n>               control server port (default 8443)\n"
            << "  --cert <path>            TLS certificate (default certs/server.crt)\n"
            << "  --key <path>             TLS private key (default certs/server.key)\n"
            << "  --timeout-ms <n>         per-connection probe timeout (default 3000)\n"
            << "  --max-concurrency <n>    simultaneous probes (default 50)\n"
            << "  --retention-days <n>     probe history kept (default 31)\n"
            << "  --tick-ms <n>            scheduler tick (default 1000)\n"
            << "  --no-listen              probe only, no control server\n"
            << "  --verbose                log every failed attempt\n";
        return out.str();
    }
}
