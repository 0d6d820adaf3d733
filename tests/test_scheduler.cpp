#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "../server/Scheduler.hpp"
#include "../common/Errors.hpp"

using namespace port_watch::server;
using port_watch::common::Clock;
using port_watch::common::ProbeResult;
using port_watch::common::Target;
using port_watch::common::TaskStatus;

namespace
{
    class FakeSettings : public SettingsBackend
    {
    public:
        std::optional<std::string> GetSetting(const std::string &key) override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (fail_reads)
                throw port_watch::common::PersistenceError("settings unavailable");
            auto it = m_values.find(key);
            if (it == m_values.end())
                return std::nullopt;
            return it->second;
        }

        void PutSetting(const std::string &key, const std::string &value) override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_values[key] = value;
        }

        bool fail_reads = false;

    private:
        std::mutex m_mutex;
        std::map<std::string, std::string> m_values;
    };

    class FakeTargets : public TargetSource
    {
    public:
        std::vector<Target> ListActiveTargets() override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return targets;
        }

        void Set(std::vector<Target> t)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            targets = std::move(t);
        }

    private:
        std::mutex m_mutex;
        std::vector<Target> targets;
    };

    class FakeStore : public ResultStore
    {
    public:
        void Append(const std::vector<ProbeResult> &results) override
        {
            if (fail_appends)
                throw port_watch::common::PersistenceError("disk full");
            std::lock_guard<std::mutex> lock(m_mutex);
            batches.push_back(results);
        }

        std::size_t PurgeOlderThan(Clock::time_point cutoff) override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            cutoffs.push_back(cutoff);
            return 0;
        }

        size_t BatchCount()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return batches.size();
        }

        std::atomic<bool> fail_appends{false};
        std::mutex m_mutex;
        std::vector<std::vector<ProbeResult>> batches;
        std::vector<Clock::time_point> cutoffs;
    };

    // Succeeds for every target. While gated, Probe() blocks until Release().
    class FakeProber : public Prober
    {
    public:
        std::vector<ProbeResult> Probe(const std::vector<Target> &targets, std::chrono::milliseconds,
                                       int max_concurrency) override
        {
            ++calls;
            last_concurrency = max_concurrency;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait(lock, [this]
                          { return !m_gated; });
            }

            std::vector<ProbeResult> results;
            for (const auto &t : targets)
            {
                ProbeResult r;
                r.target_id = t.id;
                r.region = t.region;
                r.host = t.host;
                r.port = t.port;
                r.success = true;
                r.latency_ms = 1.0;
                r.timestamp = Clock::now();
                results.push_back(r);
            }
            return results;
        }

        void Gate()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_gated = true;
        }

        void Release()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_gated = false;
            }
            m_cv.notify_all();
        }

        std::atomic<int> calls{0};
        std::atomic<int> last_concurrency{0};

    private:
        std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_gated = false;
    };

    struct Rig
    {
        FakeSettings settings;
        ConfigStore config{settings};
        FakeTargets targets;
        FakeStore store;
        FakeProber prober;

        Rig()
        {
            Target t;
            t.id = 1;
            t.region = "east";
            t.host = "192.0.2.10";
            t.port = 443;
            targets.Set({t});
        }
    };

    // Ticks once and, if that started a round, waits for it to finish.
    void TickAndSettle(Scheduler &s)
    {
        s.Tick();
        s.WaitForRound();
    }
}

static int test_stopped_never_probes()
{
    Rig rig;
    Scheduler s(rig.config, rig.targets, rig.store, rig.prober);
    for (int i = 0; i < 50; ++i)
        TickAndSettle(s);
    if (s.RoundsStarted() != 0 || rig.prober.calls != 0)
        return 1;
    if (s.ElapsedTicks() != 0)
        return 2;
    return 0;
}

static int test_rounds_follow_interval()
{
    Rig rig;
    rig.config.SetProbeInterval(10);
    rig.config.SetTaskStatus(TaskStatus::Running);

    SchedulerOptions opts;
    opts.max_concurrency = 7;
    Scheduler s(rig.config, rig.targets, rig.store, rig.prober, opts);

    // Ticks 1, 11, 21 start rounds.
    for (int tick = 1; tick <= 25; ++tick)
    {
        TickAndSettle(s);
        uint64_t expected = tick >= 21 ? 3 : tick >= 11 ? 2 : 1;
        if (s.RoundsStarted() != expected)
            return 10;
    }
    if (s.RoundsCompleted() != 3)
        return 11;
    if (rig.store.BatchCount() != 3)
        return 12;
    if (rig.prober.last_concurrency != 7)
        return 13;
    if (s.CurrentInterval() != 10)
        return 14;
    return 0;
}

static int test_interval_change_resets_countdown()
{
    Rig rig;
    rig.config.SetProbeInterval(100);
    rig.config.SetTaskStatus(TaskStatus::Running);
    Scheduler s(rig.config, rig.targets, rig.store, rig.prober);

    TickAndSettle(s);
    for (int i = 0; i < 40; ++i)
        TickAndSettle(s);
    if (s.RoundsStarted() != 1)
        return 20;

    // Without the reset the next round would be 59 ticks away.
    rig.config.SetProbeInterval(20);
    int waited = 0;
    while (s.RoundsStarted() == 1 && waited < 20)
    {
        TickAndSettle(s);
        ++waited;
    }
    if (s.RoundsStarted() != 2)
        return 21;
    if (s.CurrentInterval() != 20)
        return 22;

    for (int i = 0; i < 19; ++i)
        TickAndSettle(s);
    if (s.RoundsStarted() != 2)
        return 23;
    TickAndSettle(s);
    if (s.RoundsStarted() != 3)
        return 24;
    return 0;
}

static int test_stop_mid_countdown_suppresses_round()
{
    Rig rig;
    rig.config.SetProbeInterval(10);
    rig.config.SetTaskStatus(TaskStatus::Running);
    Scheduler s(rig.config, rig.targets, rig.store, rig.prober);

    TickAndSettle(s);
    for (int i = 0; i < 4; ++i)
        TickAndSettle(s);
    if (s.ElapsedTicks() != 5)
        return 30;

    rig.config.SetTaskStatus("stopped");
    for (int i = 0; i < 60; ++i)
        TickAndSettle(s);
    if (s.RoundsStarted() != 1)
        return 31;
    if (s.ElapsedTicks() != 0)
        return 32;

    rig.config.SetTaskStatus("running");
    TickAndSettle(s);
    if (s.RoundsStarted() != 2)
        return 33;
    return 0;
}

static int test_countdown_held_while_round_in_flight()
{
    Rig rig;
    rig.config.SetProbeInterval(10);
    rig.config.SetTaskStatus(TaskStatus::Running);
    Scheduler s(rig.config, rig.targets, rig.store, rig.prober);

    rig.prober.Gate();
    s.Tick();
    if (!s.RoundInFlight())
    {
        rig.prober.Release();
        return 40;
    }

    for (int i = 0; i < 30; ++i)
        s.Tick();
    bool overlapped = s.RoundsStarted() != 1;
    int held = s.ElapsedTicks();

    rig.prober.Release();
    s.WaitForRound();
    if (overlapped)
        return 41;
    if (held != 1)
        return 42;

    // Interval measured from completion: nine more ticks, then the next round.
    for (int i = 0; i < 9; ++i)
        TickAndSettle(s);
    if (s.RoundsStarted() != 1)
        return 43;
    TickAndSettle(s);
    if (s.RoundsStarted() != 2)
        return 44;
    return 0;
}

static int test_round_failures_are_contained()
{
    Rig rig;
    rig.config.SetProbeInterval(10);
    rig.config.SetTaskStatus(TaskStatus::Running);
    Scheduler s(rig.config, rig.targets, rig.store, rig.prober);

    std::ostringstream log;
    std::streambuf *saved = std::cout.rdbuf(log.rdbuf());
    rig.store.fail_appends = true;
    TickAndSettle(s);
    std::cout.rdbuf(saved);
    if (s.RoundsCompleted() != 1 || rig.store.BatchCount() != 0)
        return 50;
    // A round whose results were not stored is not reported as complete.
    if (log.str().find("Round complete") != std::string::npos)
        return 53;

    log.str("");
    saved = std::cout.rdbuf(log.rdbuf());
    rig.store.fail_appends = false;
    for (int i = 0; i < 10; ++i)
        TickAndSettle(s);
    std::cout.rdbuf(saved);
    if (s.RoundsCompleted() != 2 || rig.store.BatchCount() != 1)
        return 51;
    if (log.str().find("Round complete") == std::string::npos)
        return 54;

    // Unreadable settings skip the tick without touching the countdown.
    int before = s.ElapsedTicks();
    rig.settings.fail_reads = true;
    for (int i = 0; i < 5; ++i)
        TickAndSettle(s);
    rig.settings.fail_reads = false;
    if (s.ElapsedTicks() != before || s.RoundsStarted() != 2)
        return 52;
    return 0;
}

static int test_empty_registry_and_retention_cutoff()
{
    Rig rig;
    rig.targets.Set({});
    rig.config.SetProbeInterval(10);
    rig.config.SetTaskStatus(TaskStatus::Running);
    Scheduler s(rig.config, rig.targets, rig.store, rig.prober);

    auto before = Clock::now();
    TickAndSettle(s);
    auto after = Clock::now();

    if (s.RoundsCompleted() != 1)
        return 60;
    if (rig.prober.calls != 0 || rig.store.BatchCount() != 0)
        return 61;
    if (rig.store.cutoffs.size() != 1)
        return 62;
    auto cutoff = rig.store.cutoffs[0];
    if (cutoff < before - kDefaultRetention || cutoff > after - kDefaultRetention)
        return 63;
    return 0;
}

static int test_loop_thread_and_options()
{
    Rig rig;
    rig.config.SetProbeInterval(10);
    rig.config.SetTaskStatus(TaskStatus::Running);

    SchedulerOptions bad;
    bad.max_concurrency = 0;
    try
    {
        Scheduler broken(rig.config, rig.targets, rig.store, rig.prober, bad);
        return 70;
    }
    catch (const std::invalid_argument &)
    {
    }

    SchedulerOptions fast;
    fast.tick = std::chrono::milliseconds(5);
    Scheduler s(rig.config, rig.targets, rig.store, rig.prober, fast);
    s.Start();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (s.RoundsCompleted() < 2 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    s.Stop();

    if (s.RoundsCompleted() < 2)
        return 71;
    if (s.RoundsStarted() != s.RoundsCompleted())
        return 72;
    return 0;
}

int main()
{
    if (int rc = test_stopped_never_probes())
        return rc;
    if (int rc = test_rounds_follow_interval())
        return rc;
    if (int rc = test_interval_change_resets_countdown())
        return rc;
    if (int rc = test_stop_mid_countdown_suppresses_round())
        return rc;
    if (int rc = test_countdown_held_while_round_in_flight())
        return rc;
    if (int rc = test_round_failures_are_contained())
        return rc;
    if (int rc = test_empty_registry_and_retention_cutoff())
        return rc;
    if (int rc = test_loop_thread_and_options())
        return rc;
    return 0;
}
