#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include <netdb.h>

#include "../common/Models.hpp"

namespace port_watch::server
{
    class Prober
    {
    public:
        virtual ~Prober() = default;

        // One attempt per target, results in input order. Throws std::invalid_argument
        // for a non-positive timeout or max_concurrency < 1.
        virtual std::vector<port_watch::common::ProbeResult> Probe(const std::vector<port_watch::common::Target> &targets,
                                                                   std::chrono::milliseconds timeout,
                                                                   int max_concurrency) = 0;
    };

    struct ConnectOutcome
    {
        bool connected = false;
        port_watch::common::ProbeFailure failure = port_watch::common::ProbeFailure::Other;
        int error = 0; // errno or getaddrinfo code, for logging
    };

    // Same contract as getaddrinfo.
    using Resolver = int (*)(const char *node, const char *service, const addrinfo *hints, addrinfo **res);

    // Resolve plus non-blocking TCP handshake, the whole attempt bounded by timeout.
    // A lookup that has not answered by the deadline is a Timeout. Each resolved
    // address is tried in turn. Sockets are closed before returning.
    ConnectOutcome TcpConnect(const std::string &host, int port, std::chrono::milliseconds timeout,
                              Resolver resolve = &getaddrinfo);

    class TcpProber : public Prober
    {
    public:
        using Connector = std::function<ConnectOutcome(const std::string &host, int port, std::chrono::milliseconds timeout)>;

        TcpProber();
        explicit TcpProber(Connector connector);

        void SetVerbose(bool verbose) { m_verbose = verbose; }

        std::vector<port_watch::common::ProbeResult> Probe(const std::vector<port_watch::common::Target> &targets,
                                                           std::chrono::milliseconds timeout,
                                                           int max_concurrency) override;

    private:
        port_watch::common::ProbeResult Attempt(const port_watch::common::Target &target, std::chrono::milliseconds timeout);

        Connector m_connector;
        bool m_verbose;
    };
}
