#include "Scheduler.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace port_watch::server
{
    using port_watch::common::TaskStatus;

    Scheduler::Scheduler(ConfigStore &config, TargetSource &targets, ResultStore &results, Prober &prober,
                         SchedulerOptions options)
        : m_config(config), m_targets(targets), m_results(results), m_prober(prober),
          m_options(options), m_sweeper(results, options.retention),
          m_elapsed_ticks(0), m_current_interval(0),
          m_running(false), m_round_in_flight(false),
          m_rounds_started(0), m_rounds_completed(0)
    {
        if (m_options.tick.count() <= 0)
            throw std::invalid_argument("scheduler tick must be positive");
        if (m_options.probe_timeout.count() <= 0)
            throw std::invalid_argument("probe timeout must be positive");
        if (m_options.max_concurrency < 1)
            throw std::invalid_argument("max_concurrency must be at least 1");
    }

    Scheduler::~Scheduler()
    {
        Stop();
    }

    void Scheduler::Start()
    {
        if (m_running)
            return;
        m_running = true;
        m_loop_thread = std::thread(&Scheduler::RunLoop, this);
    }

    void Scheduler::Stop()
    {
        {
            std::lock_guard<std::mutex> lock(m_sleep_mutex);
            m_running = false;
        }
        m_sleep_cv.notify_all();

        if (m_loop_thread.joinable())
            m_loop_thread.join();

        WaitForRound();
        if (m_round_thread.joinable())
            m_round_thread.join();
    }

    void Scheduler::RunLoop()
    {
        std::cout << "[Scheduler] Started, tick " << m_options.tick.count() << " ms" << std::endl;

        auto next = std::chrono::steady_clock::now();
        while (m_running)
        {
            try
            {
                Tick();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Scheduler] Tick failed: " << e.what() << std::endl;
            }

            next += m_options.tick;
            auto now = std::chrono::steady_clock::now();
            if (next < now)
                next = now;

            std::unique_lock<std::mutex> lock(m_sleep_mutex);
            m_sleep_cv.wait_until(lock, next, [this]
                                  { return !m_running; });
        }

        std::cout << "[Scheduler] Stopped." << std::endl;
    }

    void Scheduler::Tick()
    {
        port_watch::common::Settings settings;
        try
        {
            settings = m_config.Read();
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Scheduler] Reading settings failed, retrying next tick: " << e.what() << std::endl;
            return;
        }

        if (settings.probe_interval_seconds != m_current_interval)
        {
            if (m_current_interval != 0)
            {
                std::cout << "[Scheduler] Probe interval changed " << m_current_interval << "s -> "
                          << settings.probe_interval_seconds << "s, countdown reset" << std::endl;
            }
            m_current_interval = settings.probe_interval_seconds;
            m_elapsed_ticks = 0;
        }

        if (!m_last_status || *m_last_status != settings.task_status)
        {
            std::cout << "[Scheduler] Task status: " << port_watch::common::TaskStatusName(settings.task_status)
                      << std::endl;
            m_last_status = settings.task_status;
        }

        if (settings.task_status == TaskStatus::Stopped)
        {
            m_elapsed_ticks = 0;
            return;
        }

        if (RoundInFlight())
            return;
        ReapRound();

        if (m_elapsed_ticks == 0)
            LaunchRound();

        m_elapsed_ticks = (m_elapsed_ticks + 1) % m_current_interval;
    }

    bool Scheduler::RoundInFlight() const
    {
        std::lock_guard<std::mutex> lock(m_round_mutex);
        return m_round_in_flight;
    }

    void Scheduler::WaitForRound()
    {
        std::unique_lock<std::mutex> lock(m_round_mutex);
        m_round_cv.wait(lock, [this]
                        { return !m_round_in_flight; });
    }

    void Scheduler::ReapRound()
    {
        if (m_round_thread.joinable())
            m_round_thread.join();
    }

    void Scheduler::LaunchRound()
    {
        {
            std::lock_guard<std::mutex> lock(m_round_mutex);
            m_round_in_flight = true;
        }
        ++m_rounds_started;

        try
        {
            m_round_thread = std::thread(&Scheduler::RunRound, this);
        }
        catch (const std::system_error &e)
        {
            std::cerr << "[Scheduler] Could not start probing round: " << e.what() << std::endl;
            {
                std::lock_guard<std::mutex> lock(m_round_mutex);
                m_round_in_flight = false;
                ++m_rounds_completed;
            }
            m_round_cv.notify_all();
        }
    }

    void Scheduler::RunRound()
    {
        const auto started = std::chrono::steady_clock::now();

        try
        {
            try
            {
                m_sweeper.Purge();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Scheduler] Retention sweep failed: " << e.what() << std::endl;
            }

            auto targets = m_targets.ListActiveTargets();
            if (targets.empty())
            {
                std::cout << "[Scheduler] No active targets, round skipped." << std::endl;
            }
            else
            {
                auto results = m_prober.Probe(targets, m_options.probe_timeout, m_options.max_concurrency);

                m_results.Append(results);

                const auto ok = std::count_if(results.begin(), results.end(),
                                              [](const port_watch::common::ProbeResult &r)
                                              { return r.success; });
                const double rate = results.empty() ? 0.0 : 100.0 * ok / static_cast<double>(results.size());
                const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

                std::cout << "[Scheduler] Round complete: " << results.size() << " targets, " << ok << " reachable ("
                          << std::fixed << std::setprecision(1) << rate << "%), " << std::setprecision(2) << secs
                          << "s" << std::defaultfloat << std::endl;
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Scheduler] Round failed: " << e.what() << std::endl;
        }

        {
            std::lock_guard<std::mutex> lock(m_round_mutex);
            m_round_in_flight = false;
            ++m_rounds_completed;
        }
        m_round_cv.notify_all();
    }
}
