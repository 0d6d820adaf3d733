#pragma once

#include <cstdint>
#include <vector>
#include <cstddef>

namespace port_watch::protocol
{

    inline constexpr uint16_t EXPECTED_MAGIC = 0xBBBB;
    inline constexpr uint32_t MAX_PAYLOAD_LENGTH = 10 * 1024 * 1024; // 10MB
    inline constexpr size_t HEADER_SIZE = 8;

    struct Header
    {
        uint16_t magic;
        uint8_t msg_type;
        uint32_t payload_length;
        uint8_t reserved;
    };

    enum class MessageType : std::uint8_t
    {
        HeartbeatReq = 0x05,
        HeartbeatResp = 0x06,

        SettingsGetReq = 0x40,
        SettingsGetResp = 0x41,
        ProbeIntervalSetReq = 0x42,
        ProbeIntervalSetResp = 0x43,
        TaskStatusSetReq = 0x44,
        TaskStatusSetResp = 0x45,

        StatsQueryReq = 0x50,
        StatsQueryResp = 0x51,
        StatsExportReq = 0x52,
        StatsExportResp = 0x53,
        SummaryReq = 0x54,
        SummaryResp = 0x55,

        ErrorResp = 0xFF
    };

    enum class ErrorCode : std::uint8_t
    {
        BadRequest = 0x01,
        ConfigValidation = 0x02,
        AggregationInput = 0x03,
        Persistence = 0x04,
        Unsupported = 0x05
    };

    inline void SerializeHeader(const Header& hdr, std::uint8_t* buffer)
    {
        buffer[0] = static_cast<uint8_t>((hdr.magic >> 8) & 0xFF);
        buffer[1] = static_cast<uint8_t>(hdr.magic & 0xFF);

        buffer[2] = hdr.msg_type;

        buffer[3] = static_cast<uint8_t>((hdr.payload_length >> 24) & 0xFF);
        buffer[4] = static_cast<uint8_t>((hdr.payload_length >> 16) & 0xFF);
        buffer[5] = static_cast<uint8_t>((hdr.payload_length >> 8) & 0xFF);
        buffer[6] = static_cast<uint8_t>(hdr.payload_length & 0xFF);

        buffer[7] = hdr.reserved;
    }

    inline Header DeserializeHeader(const std::uint8_t* buffer)
    {
        Header hdr;

        hdr.magic = (static_cast<uint16_t>(buffer[0]) << 8) |
                     static_cast<uint16_t>(buffer[1]);

        hdr.msg_type = buffer[2];

        hdr.payload_length = (static_cast<uint32_t>(buffer[3]) << 24) |
                             (static_cast<uint32_t>(buffer[4]) << 16) |
                             (static_cast<uint32_t>(buffer[5]) << 8)  |
                             static_cast<uint32_t>(buffer[6]);

        hdr.reserved = buffer[7];

        return hdr;
    }

    // Header followed by payload, ready for a single write.
    std::vector<std::uint8_t> BuildFrame(MessageType type, const std::vector<std::uint8_t>& payload);

    const char* MessageTypeName(MessageType type);

}
