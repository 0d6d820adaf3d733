#include "RequestHandler.hpp"

#include <iostream>

#include "../common/Errors.hpp"
#include "../common/Messages.hpp"

namespace port_watch::server
{
    using port_watch::protocol::ErrorCode;
    using port_watch::protocol::MessageType;

    namespace
    {
        std::optional<std::string> RegionFilter(const std::string &region)
        {
            if (region.empty())
                return std::nullopt;
            return region;
        }
    }

    RequestHandler::RequestHandler(ConfigStore &config, Aggregator &aggregator)
        : m_config(config), m_aggregator(aggregator)
    {
    }

    Reply RequestHandler::Error(ErrorCode code, const std::string &message)
    {
        port_watch::protocol::ErrorReply err;
        err.code = code;
        err.message = message;
        return {MessageType::ErrorResp, port_watch::protocol::EncodeError(err)};
    }

    Reply RequestHandler::Handle(MessageType type, const std::vector<uint8_t> &payload)
    {
        try
        {
            switch (type)
            {
            case MessageType::HeartbeatReq:
                return {MessageType::HeartbeatResp, {}};
            case MessageType::SettingsGetReq:
                return HandleSettingsGet();
            case MessageType::ProbeIntervalSetReq:
                return HandleProbeIntervalSet(payload);
            case MessageType::TaskStatusSetReq:
                return HandleTaskStatusSet(payload);
            case MessageType::StatsQueryReq:
                return HandleStatsQuery(payload);
            case MessageType::StatsExportReq:
                return HandleStatsExport(payload);
            case MessageType::SummaryReq:
                return HandleSummary();
            default:
                return Error(ErrorCode::Unsupported,
                             std::string("Unsupported request: ") + port_watch::protocol::MessageTypeName(type));
            }
        }
        catch (const port_watch::common::ConfigValidationError &e)
        {
            return Error(ErrorCode::ConfigValidation, e.what());
        }
        catch (const port_watch::common::AggregationInputError &e)
        {
            return Error(ErrorCode::AggregationInput, e.what());
        }
        catch (const port_watch::common::PersistenceError &e)
        {
            std::cerr << "[Worker] Persistence failure while handling "
                      << port_watch::protocol::MessageTypeName(type) << ": " << e.what() << std::endl;
            return Error(ErrorCode::Persistence, e.what());
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Worker] Internal error while handling "
                      << port_watch::protocol::MessageTypeName(type) << ": " << e.what() << std::endl;
            return Error(ErrorCode::Persistence, std::string("Internal server error: ") + e.what());
        }
    }

    Reply RequestHandler::HandleSettingsGet()
    {
        return {MessageType::SettingsGetResp, port_watch::protocol::EncodeSettings(m_config.Read())};
    }

    Reply RequestHandler::HandleProbeIntervalSet(const std::vector<uint8_t> &payload)
    {
        int seconds = 0;
        if (!port_watch::protocol::DecodeProbeInterval(payload, seconds))
            return Error(ErrorCode::BadRequest, "Malformed probe interval payload");

        m_config.SetProbeInterval(seconds);
        std::cout << "[Worker] Probe interval set to " << seconds << "s" << std::endl;
        return {MessageType::ProbeIntervalSetResp, port_watch::protocol::EncodeSettings(m_config.Read())};
    }

    Reply RequestHandler::HandleTaskStatusSet(const std::vector<uint8_t> &payload)
    {
        std::string status;
        if (!port_watch::protocol::DecodeText(payload, status))
            return Error(ErrorCode::BadRequest, "Malformed task status payload");

        m_config.SetTaskStatus(status);
        std::cout << "[Worker] Task status set to " << status << std::endl;
        return {MessageType::TaskStatusSetResp, port_watch::protocol::EncodeSettings(m_config.Read())};
    }

    Reply RequestHandler::HandleStatsQuery(const std::vector<uint8_t> &payload)
    {
        port_watch::protocol::StatsQuery query;
        if (!port_watch::protocol::DecodeStatsQuery(payload, query))
            return Error(ErrorCode::BadRequest, "Malformed stats query payload");

        auto stats = m_aggregator.Aggregate(query.time_range, RegionFilter(query.region));
        return {MessageType::StatsQueryResp, port_watch::protocol::EncodeTargetStats(stats)};
    }

    Reply RequestHandler::HandleStatsExport(const std::vector<uint8_t> &payload)
    {
        port_watch::protocol::StatsQuery query;
        if (!port_watch::protocol::DecodeStatsQuery(payload, query))
            return Error(ErrorCode::BadRequest, "Malformed export payload");

        std::string csv = m_aggregator.ExportCsv(query.time_range, RegionFilter(query.region));
        return {MessageType::StatsExportResp, port_watch::protocol::EncodeText(csv)};
    }

    Reply RequestHandler::HandleSummary()
    {
        return {MessageType::SummaryResp, port_watch::protocol::EncodeSummary(m_aggregator.Summary())};
    }
}
