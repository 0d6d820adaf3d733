#include "ConfigStore.hpp"
#include "DatabaseManager.hpp"
#include "Aggregator.hpp"
#include "NetworkCore.hpp"
#include "Prober.hpp"
#include "RequestHandler.hpp"
#include "Scheduler.hpp"
#include "ServerConfig.hpp"
#include "Worker.hpp"

#include <atomic>
#include <csignal>
#include <ctime>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>

namespace
{
    // Waits for SIGINT/SIGTERM on a dedicated thread (the signals are blocked
    // everywhere else) and runs on_signal once.
    class SignalWatcher
    {
    public:
        explicit SignalWatcher(std::function<void()> on_signal)
            : m_on_signal(std::move(on_signal)), m_done(false), m_thread(&SignalWatcher::Loop, this)
        {
        }

        ~SignalWatcher()
        {
            m_done = true;
            if (m_thread.joinable())
                m_thread.join();
        }

    private:
        void Loop()
        {
            sigset_t set;
            sigemptyset(&set);
            sigaddset(&set, SIGINT);
            sigaddset(&set, SIGTERM);

            timespec wait{0, 200 * 1000 * 1000};
            while (!m_done)
            {
                int sig = sigtimedwait(&set, nullptr, &wait);
                if (sig == SIGINT || sig == SIGTERM)
                {
                    std::cout << "[Server] Caught signal " << sig << ", shutting down..." << std::endl;
                    m_on_signal();
                    return;
                }
            }
        }

        std::function<void()> m_on_signal;
        std::atomic<bool> m_done;
        std::thread m_thread;
    };

    void BlockShutdownSignals()
    {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &set, nullptr);

        // Peers that vanish mid-write must not kill the daemon.
        std::signal(SIGPIPE, SIG_IGN);
    }
}

int main(int argc, char *argv[])
{
    using namespace port_watch::server;

    ServerConfig cfg;
    try
    {
        cfg = ParseServerArgs(std::vector<std::string>(argv + 1, argv + argc));
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << e.what() << "\n\n" << ServerUsage(argv[0]);
        return 1;
    }

    if (cfg.show_help)
    {
        std::cout << ServerUsage(argv[0]);
        return 0;
    }

    BlockShutdownSignals();

    // Probing path and query path each get their own connection.
    DatabaseManager probe_db;
    DatabaseManager query_db;
    if (!probe_db.Initialize(cfg.db_path) || !query_db.Initialize(cfg.db_path))
    {
        std::cerr << "Fatal Server Error: cannot open database '" << cfg.db_path << "'\n";
        return 1;
    }

    try
    {
        ConfigStore scheduler_config(probe_db);
        ConfigStore control_config(query_db);

        TcpProber prober;
        prober.SetVerbose(cfg.verbose);

        SchedulerOptions options;
        options.tick = cfg.tick;
        options.probe_timeout = cfg.probe_timeout;
        options.max_concurrency = cfg.max_concurrency;
        options.retention = std::chrono::hours(24 * cfg.retention_days);

        Scheduler scheduler(scheduler_config, probe_db, probe_db, prober, options);

        Aggregator aggregator(query_db);
        RequestHandler handler(control_config, aggregator);
        Worker worker(handler);

        auto settings = scheduler_config.Read();
        std::cout << "[Server] PortWatch starting: db=" << cfg.db_path
                  << " interval=" << settings.probe_interval_seconds << "s"
                  << " status=" << port_watch::common::TaskStatusName(settings.task_status)
                  << " timeout=" << cfg.probe_timeout.count() << "ms"
                  << " concurrency=" << cfg.max_concurrency
                  << " retention=" << cfg.retention_days << "d" << std::endl;

        scheduler.Start();

        if (cfg.listen)
        {
            NetworkCore server(cfg.port, cfg.cert_path, cfg.key_path, worker);
            worker.SetNetworkCore(&server);
            server.Init();
            worker.Start();

            {
                SignalWatcher watcher([&server]
                                      { server.Stop(); });
                server.Run();
            }

            worker.Stop();
            worker.SetNetworkCore(nullptr);
        }
        else
        {
            std::atomic<bool> stop{false};
            {
                SignalWatcher watcher([&stop]
                                      { stop = true; });
                while (!stop)
                    std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        }

        scheduler.Stop();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Server Error: " << e.what() << '\n';
        query_db.Shutdown();
        probe_db.Shutdown();
        return 1;
    }

    query_db.Shutdown();
    probe_db.Shutdown();
    std::cout << "[Server] Shutdown complete." << std::endl;
    return 0;
}
