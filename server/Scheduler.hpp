#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

#include "ConfigStore.hpp"
#include "Prober.hpp"
#include "RetentionSweeper.hpp"
#include "Storage.hpp"

namespace port_watch::server
{
    struct SchedulerOptions
    {
        std::chrono::milliseconds tick{1000};
        std::chrono::milliseconds probe_timeout{3000};
        int max_concurrency = 50;
        std::chrono::hours retention = kDefaultRetention;
    };

    // Tick-driven probing loop. Each tick samples the settings; when the task is
    // running and the countdown is at zero a round (sweep, snapshot, probe, append)
    // starts on a dedicated round thread. Rounds never overlap and the countdown is
    // held while a round is in flight, so the interval is measured from completion.
    //
    // Tick() is public so tests can drive the state machine without the loop thread;
    // it must only ever be called from one thread at a time.
    class Scheduler
    {
    public:
        Scheduler(ConfigStore &config, TargetSource &targets, ResultStore &results, Prober &prober,
                  SchedulerOptions options = SchedulerOptions());
        ~Scheduler();

        Scheduler(const Scheduler &) = delete;
        Scheduler &operator=(const Scheduler &) = delete;

        void Start();
        // Stops ticking; an in-flight round runs to completion first.
        void Stop();

        void Tick();

        bool RoundInFlight() const;
        void WaitForRound();

        int ElapsedTicks() const { return m_elapsed_ticks; }
        int CurrentInterval() const { return m_current_interval; }
        uint64_t RoundsStarted() const { return m_rounds_started.load(); }
        uint64_t RoundsCompleted() const { return m_rounds_completed.load(); }

    private:
        void RunLoop();
        void LaunchRound();
        void RunRound();
        void ReapRound();

        ConfigStore &m_config;
        TargetSource &m_targets;
        ResultStore &m_results;
        Prober &m_prober;
        SchedulerOptions m_options;
        RetentionSweeper m_sweeper;

        int m_elapsed_ticks;
        int m_current_interval;
        std::optional<port_watch::common::TaskStatus> m_last_status;

        std::atomic<bool> m_running;
        std::thread m_loop_thread;
        std::mutex m_sleep_mutex;
        std::condition_variable m_sleep_cv;

        std::thread m_round_thread;
        mutable std::mutex m_round_mutex;
        std::condition_variable m_round_cv;
        bool m_round_in_flight;

        std::atomic<uint64_t> m_rounds_started;
        std::atomic<uint64_t> m_rounds_completed;
    };
}
