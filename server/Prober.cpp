#include "Prober.hpp"
#include "CountingSemaphore.hpp"
#include "ThreadSafeQueue.hpp"

#include <algorithm>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace port_watch::server
{
    using port_watch::common::ProbeFailure;
    using port_watch::common::ProbeResult;
    using port_watch::common::Target;

    namespace
    {
        struct SocketGuard
        {
            int fd;
            ~SocketGuard()
            {
                if (fd >= 0)
                    close(fd);
            }
        };

        ProbeFailure ClassifyErrno(int err)
        {
            switch (err)
            {
            case ECONNREFUSED:
                return ProbeFailure::Refused;
            case ENETUNREACH:
            case EHOSTUNREACH:
            case ENETDOWN:
            case EHOSTDOWN:
                return ProbeFailure::Unreachable;
            case ETIMEDOUT:
                return ProbeFailure::Timeout;
            default:
                return ProbeFailure::Other;
            }
        }
    }

    namespace
    {
        using AddrList = std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>;

        // Shared with the resolver thread, which outlives the attempt when the
        // lookup misses the deadline and frees its own answer in that case.
        struct PendingLookup
        {
            std::mutex mutex;
            std::condition_variable cv;
            bool done = false;
            bool abandoned = false;
            int gai = 0;
            addrinfo *res = nullptr;
        };

        // Sets timed_out when the deadline passes before the resolver answers.
        int ResolveBefore(const std::string &host, const std::string &service, Resolver resolve,
                          std::chrono::steady_clock::time_point deadline, AddrList &out, bool &timed_out)
        {
            timed_out = false;

            addrinfo hints{};
            hints.ai_socktype = SOCK_STREAM;
            hints.ai_family = AF_UNSPEC;
            hints.ai_flags = AI_NUMERICSERV | AI_NUMERICHOST;

            // Literal addresses never touch DNS.
            addrinfo *res = nullptr;
            int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
            if (gai == 0)
            {
                out.reset(res);
                return 0;
            }
            if (res)
                freeaddrinfo(res);
            if (gai != EAI_NONAME)
                return gai;

            hints.ai_flags = AI_NUMERICSERV;
            auto lookup = std::make_shared<PendingLookup>();
            std::thread([lookup, host, service, hints, resolve]()
                        {
                            addrinfo *found = nullptr;
                            int code = resolve(host.c_str(), service.c_str(), &hints, &found);

                            std::lock_guard<std::mutex> lock(lookup->mutex);
                            if (lookup->abandoned)
                            {
                                if (found)
                                    freeaddrinfo(found);
                                return;
                            }
                            lookup->gai = code;
                            lookup->res = found;
                            lookup->done = true;
                            lookup->cv.notify_one();
                        })
                .detach();

            std::unique_lock<std::mutex> lock(lookup->mutex);
            if (!lookup->cv.wait_until(lock, deadline, [&lookup]
                                       { return lookup->done; }))
            {
                lookup->abandoned = true;
                timed_out = true;
                return EAI_AGAIN;
            }

            if (lookup->gai != 0)
            {
                if (lookup->res)
                    freeaddrinfo(lookup->res);
                return lookup->gai;
            }
            out.reset(lookup->res);
            return out ? 0 : EAI_NONAME;
        }

        ConnectOutcome ConnectAddress(const addrinfo *ai, std::chrono::steady_clock::time_point deadline)
        {
            using std::chrono::steady_clock;

            SocketGuard sock{socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol)};
            if (sock.fd < 0)
                return {false, ProbeFailure::Socket, errno};

            if (connect(sock.fd, ai->ai_addr, ai->ai_addrlen) == 0)
                return {true, ProbeFailure::None, 0};

            if (errno != EINPROGRESS)
            {
                int err = errno;
                return {false, ClassifyErrno(err), err};
            }

            pollfd pfd{};
            pfd.fd = sock.fd;
            pfd.events = POLLOUT;

            int n = 0;
            while (true)
            {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - steady_clock::now());
                if (remaining.count() <= 0)
                    return {false, ProbeFailure::Timeout, ETIMEDOUT};

                n = poll(&pfd, 1, static_cast<int>(remaining.count()));
                if (n < 0 && errno == EINTR)
                    continue;
                break;
            }

            if (n == 0)
                return {false, ProbeFailure::Timeout, ETIMEDOUT};
            if (n < 0)
            {
                int err = errno;
                return {false, ProbeFailure::Other, err};
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0)
            {
                int err = errno;
                return {false, ProbeFailure::Other, err};
            }
            if (so_error != 0)
                return {false, ClassifyErrno(so_error), so_error};

            return {true, ProbeFailure::None, 0};
        }
    }

    ConnectOutcome TcpConnect(const std::string &host, int port, std::chrono::milliseconds timeout, Resolver resolve)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;

        AddrList addresses(nullptr, &freeaddrinfo);
        bool timed_out = false;
        int gai = ResolveBefore(host, std::to_string(port), resolve, deadline, addresses, timed_out);
        if (timed_out)
            return {false, ProbeFailure::Timeout, ETIMEDOUT};
        if (gai != 0)
            return {false, ProbeFailure::Resolve, gai};

        // Every address the name resolves to, in resolver order, until one
        // answers or the deadline passes.
        ConnectOutcome outcome;
        for (const addrinfo *ai = addresses.get(); ai != nullptr; ai = ai->ai_next)
        {
            outcome = ConnectAddress(ai, deadline);
            if (outcome.connected || outcome.failure == ProbeFailure::Timeout)
                break;
        }
        return outcome;
    }

    TcpProber::TcpProber()
        : TcpProber([](const std::string &host, int port, std::chrono::milliseconds timeout)
                    { return TcpConnect(host, port, timeout); })
    {
    }

    TcpProber::TcpProber(Connector connector) : m_connector(std::move(connector)), m_verbose(false)
    {
        if (!m_connector)
            throw std::invalid_argument("TcpProber requires a connector");
    }

    ProbeResult TcpProber::Attempt(const Target &target, std::chrono::milliseconds timeout)
    {
        ProbeResult result;
        result.target_id = target.id;
        result.region = target.region;
        result.host = target.host;
        result.port = target.port;
        result.timestamp = port_watch::common::Clock::now();

        ConnectOutcome outcome;
        const auto start = std::chrono::steady_clock::now();
        try
        {
            outcome = m_connector(target.host, target.port, timeout);
        }
        catch (const std::exception &e)
        {
            outcome.connected = false;
            outcome.failure = ProbeFailure::Other;
            std::cerr << "[Prober] Attempt " << target.host << ":" << target.port << " raised: " << e.what() << std::endl;
        }
        const auto elapsed = std::chrono::steady_clock::now() - start;

        if (outcome.connected)
        {
            result.success = true;
            result.latency_ms = std::chrono::duration<double, std::milli>(elapsed).count();
            result.failure = ProbeFailure::None;
        }
        else
        {
            result.success = false;
            result.latency_ms = port_watch::common::kLatencyNotMeasured;
            result.failure = outcome.failure;
            if (m_verbose)
            {
                std::cerr << "[Prober] " << target.host << ":" << target.port << " failed ("
                          << port_watch::common::ProbeFailureName(outcome.failure);
                if (outcome.failure == ProbeFailure::Resolve)
                    std::cerr << ": " << gai_strerror(outcome.error);
                else if (outcome.error != 0)
                    std::cerr << ": " << std::strerror(outcome.error);
                std::cerr << ")" << std::endl;
            }
        }
        return result;
    }

    std::vector<ProbeResult> TcpProber::Probe(const std::vector<Target> &targets,
                                              std::chrono::milliseconds timeout,
                                              int max_concurrency)
    {
        if (timeout.count() <= 0)
            throw std::invalid_argument("probe timeout must be positive");
        if (max_concurrency < 1)
            throw std::invalid_argument("max_concurrency must be at least 1");

        std::vector<ProbeResult> results(targets.size());
        if (targets.empty())
            return results;

        ThreadSafeQueue<std::size_t> pending;
        for (std::size_t i = 0; i < targets.size(); ++i)
            pending.Push(i);
        pending.Shutdown();

        CountingSemaphore gate(static_cast<std::size_t>(max_concurrency));

        auto work = [&]()
        {
            while (auto index = pending.Pop())
            {
                SemaphoreGuard slot(gate);
                results[*index] = Attempt(targets[*index], timeout);
            }
        };

        const std::size_t pool_size = std::min(static_cast<std::size_t>(max_concurrency), targets.size());
        std::vector<std::thread> pool;
        pool.reserve(pool_size);
        for (std::size_t i = 0; i < pool_size; ++i)
        {
            try
            {
                pool.emplace_back(work);
            }
            catch (const std::system_error &e)
            {
                if (pool.empty())
                    throw;
                std::cerr << "[Prober] Could only start " << pool.size() << " of " << pool_size
                          << " workers: " << e.what() << std::endl;
                break;
            }
        }

        for (auto &t : pool)
            t.join();

        return results;
    }
}
