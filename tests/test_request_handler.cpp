#include <chrono>
#include <new>
#include <stdexcept>

#include "TestSupport.hpp"
#include "../common/Messages.hpp"
#include "../server/Aggregator.hpp"
#include "../server/ConfigStore.hpp"
#include "../server/DatabaseManager.hpp"
#include "../server/RequestHandler.hpp"

using namespace port_watch::server;
using port_watch::common::Clock;
using port_watch::common::Target;
using port_watch::protocol::ErrorCode;
using port_watch::protocol::MessageType;

namespace
{
    // Settings table that fails with errors outside the storage taxonomy.
    class BrokenSettings : public SettingsBackend
    {
    public:
        std::optional<std::string> GetSetting(const std::string &) override { throw std::bad_alloc(); }
        void PutSetting(const std::string &, const std::string &) override
        {
            throw std::runtime_error("settings backend unavailable");
        }
    };

    bool IsError(const Reply &reply, ErrorCode code)
    {
        if (reply.type != MessageType::ErrorResp)
            return false;
        port_watch::protocol::ErrorReply err;
        return port_watch::protocol::DecodeError(reply.payload, err) && err.code == code && !err.message.empty();
    }
}

int main()
{
    const std::string path = port_watch::test::FreshDbPath("handler");
    DatabaseManager db;
    if (!db.Initialize(path))
        return 1;

    Target t;
    t.id = port_watch::test::InsertTarget(path, "east", "192.0.2.1", 443, "portal");
    t.region = "east";
    t.host = "192.0.2.1";
    t.port = 443;
    db.Append({port_watch::test::MakeResult(t, true, 8.0, Clock::now() - std::chrono::minutes(5)),
               port_watch::test::MakeResult(t, false, 0.0, Clock::now() - std::chrono::minutes(4))});

    ConfigStore config(db);
    Aggregator aggregator(db);
    RequestHandler handler(config, aggregator);

    auto pong = handler.Handle(MessageType::HeartbeatReq, {});
    if (pong.type != MessageType::HeartbeatResp || !pong.payload.empty())
        return 2;

    port_watch::common::Settings settings;
    auto got = handler.Handle(MessageType::SettingsGetReq, {});
    if (got.type != MessageType::SettingsGetResp || !port_watch::protocol::DecodeSettings(got.payload, settings) ||
        settings.probe_interval_seconds != 300)
        return 3;

    auto set = handler.Handle(MessageType::ProbeIntervalSetReq, port_watch::protocol::EncodeProbeInterval(60));
    if (set.type != MessageType::ProbeIntervalSetResp || !port_watch::protocol::DecodeSettings(set.payload, settings) ||
        settings.probe_interval_seconds != 60)
        return 4;

    if (!IsError(handler.Handle(MessageType::ProbeIntervalSetReq, port_watch::protocol::EncodeProbeInterval(5)),
                 ErrorCode::ConfigValidation))
        return 5;
    if (config.GetProbeInterval() != 60)
        return 6;

    if (!IsError(handler.Handle(MessageType::ProbeIntervalSetReq, {0x01}), ErrorCode::BadRequest))
        return 7;

    auto start = handler.Handle(MessageType::TaskStatusSetReq, port_watch::protocol::EncodeText("running"));
    if (start.type != MessageType::TaskStatusSetResp || !port_watch::protocol::DecodeSettings(start.payload, settings) ||
        settings.task_status != port_watch::common::TaskStatus::Running)
        return 8;
    if (!IsError(handler.Handle(MessageType::TaskStatusSetReq, port_watch::protocol::EncodeText("paused")),
                 ErrorCode::ConfigValidation))
        return 9;

    std::vector<port_watch::common::TargetStats> stats;
    auto query = handler.Handle(MessageType::StatsQueryReq, port_watch::protocol::EncodeStatsQuery({"1d", ""}));
    if (query.type != MessageType::StatsQueryResp || !port_watch::protocol::DecodeTargetStats(query.payload, stats))
        return 10;
    if (stats.size() != 1 || stats[0].total_probes != 2 || stats[0].packet_loss_rate != 50.0 ||
        !stats[0].avg_latency_ms || *stats[0].avg_latency_ms != 8.0)
        return 11;

    auto west = handler.Handle(MessageType::StatsQueryReq, port_watch::protocol::EncodeStatsQuery({"1d", "west"}));
    if (!port_watch::protocol::DecodeTargetStats(west.payload, stats) || !stats.empty())
        return 12;

    if (!IsError(handler.Handle(MessageType::StatsQueryReq, port_watch::protocol::EncodeStatsQuery({"5d", ""})),
                 ErrorCode::AggregationInput))
        return 13;

    std::string csv;
    auto exported = handler.Handle(MessageType::StatsExportReq, port_watch::protocol::EncodeStatsQuery({"7d", "east"}));
    if (exported.type != MessageType::StatsExportResp || !port_watch::protocol::DecodeText(exported.payload, csv))
        return 14;
    if (csv.rfind("region,public_ip,port,", 0) != 0 || csv.find("east,192.0.2.1,443,portal,8.00,50.00,2,1\n") ==
                                                              std::string::npos)
        return 15;

    port_watch::common::SummaryStats summary;
    auto sum = handler.Handle(MessageType::SummaryReq, {});
    if (sum.type != MessageType::SummaryResp || !port_watch::protocol::DecodeSummary(sum.payload, summary) ||
        summary.total_targets != 1 || summary.recent_probes_24h != 2)
        return 16;

    if (!IsError(handler.Handle(static_cast<MessageType>(0x7E), {}), ErrorCode::Unsupported))
        return 17;
    if (!IsError(handler.Handle(MessageType::SettingsGetResp, {}), ErrorCode::Unsupported))
        return 18;

    // Storage failures come back as Persistence errors instead of escaping.
    db.Shutdown();
    if (!IsError(handler.Handle(MessageType::SummaryReq, {}), ErrorCode::Persistence))
        return 19;

    // Any other failure still produces a reply, so the client is never left waiting.
    BrokenSettings broken;
    ConfigStore broken_config(broken);
    RequestHandler broken_handler(broken_config, aggregator);
    if (!IsError(broken_handler.Handle(MessageType::SettingsGetReq, {}), ErrorCode::Persistence))
        return 20;
    if (!IsError(broken_handler.Handle(MessageType::TaskStatusSetReq, port_watch::protocol::EncodeText("running")),
                 ErrorCode::Persistence))
        return 21;

    return 0;
}
