#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "../server/Prober.hpp"

using namespace port_watch::server;
using port_watch::common::ProbeFailure;
using port_watch::common::Target;

namespace
{
    std::vector<Target> MakeTargets(int n)
    {
        std::vector<Target> targets;
        for (int i = 0; i < n; ++i)
        {
            Target t;
            t.id = i + 1;
            t.region = "r";
            t.host = "10.0.0." + std::to_string(i + 1);
            t.port = 1000 + i;
            targets.push_back(t);
        }
        return targets;
    }

    // Listening socket on 127.0.0.1 with a kernel-chosen port.
    int ListenLoopback(int &port_out)
    {
        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0)
            return -1;
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 || listen(fd, 16) != 0)
        {
            close(fd);
            return -1;
        }
        socklen_t len = sizeof(addr);
        getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len);
        port_out = ntohs(addr.sin_port);
        return fd;
    }
}

static int test_concurrency_bound()
{
    for (int limit : {1, 3, 8})
    {
        std::atomic<int> outstanding{0};
        std::atomic<int> peak{0};

        TcpProber prober([&](const std::string &, int port, std::chrono::milliseconds)
                         {
                             int now = ++outstanding;
                             int prev = peak.load();
                             while (now > prev && !peak.compare_exchange_weak(prev, now))
                             {
                             }
                             std::this_thread::sleep_for(std::chrono::milliseconds(5));
                             --outstanding;
                             ConnectOutcome out;
                             out.connected = port % 2 == 0;
                             out.failure = out.connected ? ProbeFailure::None : ProbeFailure::Refused;
                             return out; });

        auto targets = MakeTargets(25);
        auto results = prober.Probe(targets, std::chrono::milliseconds(1000), limit);

        if (results.size() != targets.size())
            return 1;
        if (peak.load() > limit)
            return 2;
        for (size_t i = 0; i < results.size(); ++i)
        {
            if (results[i].target_id != targets[i].id || results[i].port != targets[i].port)
                return 3;
            bool expect_ok = targets[i].port % 2 == 0;
            if (results[i].success != expect_ok)
                return 4;
            if (!expect_ok && results[i].latency_ms != port_watch::common::kLatencyNotMeasured)
                return 5;
            if (expect_ok && results[i].latency_ms < 0.0)
                return 6;
        }
    }
    return 0;
}

static int test_empty_and_invalid_arguments()
{
    int calls = 0;
    TcpProber prober([&](const std::string &, int, std::chrono::milliseconds)
                     {
                         ++calls;
                         return ConnectOutcome{true, ProbeFailure::None, 0}; });

    if (!prober.Probe({}, std::chrono::milliseconds(100), 4).empty())
        return 10;
    if (calls != 0)
        return 11;

    try
    {
        prober.Probe(MakeTargets(2), std::chrono::milliseconds(100), 0);
        return 12;
    }
    catch (const std::invalid_argument &)
    {
    }

    try
    {
        prober.Probe(MakeTargets(2), std::chrono::milliseconds(0), 2);
        return 13;
    }
    catch (const std::invalid_argument &)
    {
    }

    try
    {
        TcpProber broken{TcpProber::Connector()};
        return 14;
    }
    catch (const std::invalid_argument &)
    {
    }
    return 0;
}

static int test_connector_exception_is_a_failed_attempt()
{
    TcpProber prober([](const std::string &host, int, std::chrono::milliseconds) -> ConnectOutcome
                     {
                         if (host == "10.0.0.2")
                             throw std::runtime_error("boom");
                         return ConnectOutcome{true, ProbeFailure::None, 0}; });

    auto results = prober.Probe(MakeTargets(3), std::chrono::milliseconds(100), 2);
    if (results.size() != 3)
        return 20;
    if (!results[0].success || results[1].success || !results[2].success)
        return 21;
    if (results[1].latency_ms != port_watch::common::kLatencyNotMeasured)
        return 22;
    if (results[1].failure != ProbeFailure::Other)
        return 23;
    return 0;
}

static int test_loopback_open_and_closed()
{
    int port = 0;
    int listener = ListenLoopback(port);
    if (listener < 0)
        return 30;

    auto open = TcpConnect("127.0.0.1", port, std::chrono::milliseconds(1000));
    if (!open.connected)
    {
        close(listener);
        return 31;
    }

    Target t;
    t.id = 7;
    t.region = "local";
    t.host = "127.0.0.1";
    t.port = port;

    TcpProber prober;
    auto ok = prober.Probe({t}, std::chrono::milliseconds(1000), 1);
    close(listener);
    if (ok.size() != 1 || !ok[0].success || ok[0].latency_ms < 0.0)
        return 32;

    // Nothing listens on the port once the listener is closed.
    auto start = std::chrono::steady_clock::now();
    auto failed = prober.Probe({t}, std::chrono::milliseconds(1000), 1);
    auto took = std::chrono::steady_clock::now() - start;
    if (failed.size() != 1 || failed[0].success)
        return 33;
    if (failed[0].latency_ms != -1.0)
        return 34;
    if (failed[0].failure != ProbeFailure::Refused)
        return 35;
    if (took > std::chrono::milliseconds(1500))
        return 36;
    return 0;
}

namespace
{
    std::atomic<int> g_slow_lookups_finished{0};
    int g_refusing_port = 0;

    // Answers correctly, but only long after the attempt timeout.
    int SlowResolve(const char *, const char *service, const addrinfo *hints, addrinfo **res)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        int rc = getaddrinfo("127.0.0.1", service, hints, res);
        ++g_slow_lookups_finished;
        return rc;
    }

    int NoSuchName(const char *, const char *, const addrinfo *, addrinfo **res)
    {
        *res = nullptr;
        return EAI_NONAME;
    }

    // A refusing address first, then the requested port, as a dual-stack name
    // with a dead first answer would resolve.
    int DeadFirstAnswer(const char *, const char *service, const addrinfo *hints, addrinfo **res)
    {
        addrinfo v4 = *hints;
        v4.ai_family = AF_INET;

        addrinfo *dead = nullptr;
        addrinfo *live = nullptr;
        std::string dead_service = std::to_string(g_refusing_port);
        if (getaddrinfo("127.0.0.1", dead_service.c_str(), &v4, &dead) != 0)
            return EAI_FAIL;
        if (getaddrinfo("127.0.0.1", service, &v4, &live) != 0)
        {
            freeaddrinfo(dead);
            return EAI_FAIL;
        }
        addrinfo *tail = dead;
        while (tail->ai_next)
            tail = tail->ai_next;
        tail->ai_next = live;
        *res = dead;
        return 0;
    }
}

static int test_lookup_bounded_by_timeout()
{
    auto start = std::chrono::steady_clock::now();
    auto outcome = TcpConnect("slow-lookup.test", 80, std::chrono::milliseconds(300), &SlowResolve);
    auto took = std::chrono::steady_clock::now() - start;
    if (outcome.connected || outcome.failure != ProbeFailure::Timeout)
        return 40;
    if (took > std::chrono::milliseconds(1000))
        return 41;

    TcpProber prober([](const std::string &host, int port, std::chrono::milliseconds timeout)
                     { return TcpConnect(host, port, timeout, &SlowResolve); });
    Target t;
    t.id = 1;
    t.region = "r";
    t.host = "slow-lookup.test";
    t.port = 80;
    start = std::chrono::steady_clock::now();
    auto results = prober.Probe({t}, std::chrono::milliseconds(300), 1);
    took = std::chrono::steady_clock::now() - start;
    if (results.size() != 1 || results[0].success || results[0].latency_ms != -1.0)
        return 42;
    if (took > std::chrono::milliseconds(1000))
        return 43;

    // Let the abandoned lookups finish before the process exits.
    for (int i = 0; i < 50 && g_slow_lookups_finished < 2; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    if (g_slow_lookups_finished != 2)
        return 44;
    return 0;
}

static int test_unresolvable_host()
{
    auto outcome = TcpConnect("nowhere.test", 443, std::chrono::milliseconds(500), &NoSuchName);
    if (outcome.connected || outcome.failure != ProbeFailure::Resolve)
        return 50;

    TcpProber prober([](const std::string &host, int port, std::chrono::milliseconds timeout)
                     { return TcpConnect(host, port, timeout, &NoSuchName); });
    Target t;
    t.id = 2;
    t.region = "r";
    t.host = "nowhere.test";
    t.port = 443;
    auto results = prober.Probe({t}, std::chrono::milliseconds(500), 1);
    if (results.size() != 1 || results[0].success || results[0].latency_ms != -1.0 ||
        results[0].failure != ProbeFailure::Resolve)
        return 51;

    // The reserved .invalid TLD never resolves; with or without a reachable
    // resolver the attempt fails within its timeout.
    Target invalid;
    invalid.id = 3;
    invalid.region = "r";
    invalid.host = "portwatch.invalid";
    invalid.port = 443;
    auto start = std::chrono::steady_clock::now();
    auto real = TcpProber().Probe({invalid}, std::chrono::milliseconds(1000), 1);
    auto took = std::chrono::steady_clock::now() - start;
    if (real.size() != 1 || real[0].success || real[0].latency_ms != -1.0)
        return 52;
    if (took > std::chrono::milliseconds(1500))
        return 53;
    return 0;
}

static int test_later_address_tried_after_refusal()
{
    int refusing = 0;
    int closer = ListenLoopback(refusing);
    if (closer < 0)
        return 60;
    close(closer);
    g_refusing_port = refusing;

    int port = 0;
    int listener = ListenLoopback(port);
    if (listener < 0)
        return 61;

    auto outcome = TcpConnect("dual.test", port, std::chrono::milliseconds(1000), &DeadFirstAnswer);
    close(listener);
    if (!outcome.connected)
        return 62;
    return 0;
}

int main()
{
    if (int rc = test_concurrency_bound())
        return rc;
    if (int rc = test_empty_and_invalid_arguments())
        return rc;
    if (int rc = test_connector_exception_is_a_failed_attempt())
        return rc;
    if (int rc = test_loopback_open_and_closed())
        return rc;
    if (int rc = test_unresolvable_host())
        return rc;
    if (int rc = test_later_address_tried_after_refusal())
        return rc;
    if (int rc = test_lookup_bounded_by_timeout())
        return rc;
    return 0;
}
