#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "Aggregator.hpp"
#include "ConfigStore.hpp"
#include "../common/protocol.hpp"

namespace port_watch::server
{
    struct Reply
    {
        port_watch::protocol::MessageType type;
        std::vector<uint8_t> payload;
    };

    // Maps one control request to ConfigStore / Aggregator calls. Never throws for
    // request-level failures: they come back as an ErrorResp reply.
    class RequestHandler
    {
    public:
        RequestHandler(ConfigStore &config, Aggregator &aggregator);

        Reply Handle(port_watch::protocol::MessageType type, const std::vector<uint8_t> &payload);

    private:
        Reply HandleSettingsGet();
        Reply HandleProbeIntervalSet(const std::vector<uint8_t> &payload);
        Reply HandleTaskStatusSet(const std::vector<uint8_t> &payload);
        Reply HandleStatsQuery(const std::vector<uint8_t> &payload);
        Reply HandleStatsExport(const std::vector<uint8_t> &payload);
        Reply HandleSummary();

        static Reply Error(port_watch::protocol::ErrorCode code, const std::string &message);

        ConfigStore &m_config;
        Aggregator &m_aggregator;
    };
}
