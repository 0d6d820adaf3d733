#include "./protocol.hpp"

#include <algorithm>

namespace port_watch::protocol
{

    std::vector<std::uint8_t> BuildFrame(MessageType type, const std::vector<std::uint8_t>& payload)
    {
        Header hdr;
        hdr.magic = EXPECTED_MAGIC;
        hdr.msg_type = static_cast<uint8_t>(type);
        hdr.payload_length = static_cast<uint32_t>(payload.size());
        hdr.reserved = 0;

        std::vector<std::uint8_t> frame(HEADER_SIZE + payload.size());
        SerializeHeader(hdr, frame.data());
        std::copy(payload.begin(), payload.end(), frame.begin() + HEADER_SIZE);
        return frame;
    }

    const char* MessageTypeName(MessageType type)
    {
        switch (type)
        {
        case MessageType::HeartbeatReq: return "HeartbeatReq";
        case MessageType::HeartbeatResp: return "HeartbeatResp";
        case MessageType::SettingsGetReq: return "SettingsGetReq";
        case MessageType::SettingsGetResp: return "SettingsGetResp";
        case MessageType::ProbeIntervalSetReq: return "ProbeIntervalSetReq";
        case MessageType::ProbeIntervalSetResp: return "ProbeIntervalSetResp";
        case MessageType::TaskStatusSetReq: return "TaskStatusSetReq";
        case MessageType::TaskStatusSetResp: return "TaskStatusSetResp";
        case MessageType::StatsQueryReq: return "StatsQueryReq";
        case MessageType::StatsQueryResp: return "StatsQueryResp";
        case MessageType::StatsExportReq: return "StatsExportReq";
        case MessageType::StatsExportResp: return "StatsExportResp";
        case MessageType::SummaryReq: return "SummaryReq";
        case MessageType::SummaryResp: return "SummaryResp";
        case MessageType::ErrorResp: return "ErrorResp";
        }
        return "Unknown";
    }

}
