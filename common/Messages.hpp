#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "Models.hpp"
#include "protocol.hpp"

namespace port_watch::protocol
{
    // Payload codecs for the control protocol. Decoders return false on truncated,
    // trailing or semantically invalid input and leave partial output unspecified.

    struct StatsQuery
    {
        std::string time_range;
        std::string region; // empty means no filter
    };

    struct ErrorReply
    {
        ErrorCode code = ErrorCode::BadRequest;
        std::string message;
    };

    std::vector<std::uint8_t> EncodeSettings(const port_watch::common::Settings &settings);
    bool DecodeSettings(const std::vector<std::uint8_t> &in, port_watch::common::Settings &out);

    std::vector<std::uint8_t> EncodeProbeInterval(int seconds);
    bool DecodeProbeInterval(const std::vector<std::uint8_t> &in, int &out);

    std::vector<std::uint8_t> EncodeText(const std::string &text);
    bool DecodeText(const std::vector<std::uint8_t> &in, std::string &out);

    std::vector<std::uint8_t> EncodeStatsQuery(const StatsQuery &query);
    bool DecodeStatsQuery(const std::vector<std::uint8_t> &in, StatsQuery &out);

    std::vector<std::uint8_t> EncodeTargetStats(const std::vector<port_watch::common::TargetStats> &stats);
    bool DecodeTargetStats(const std::vector<std::uint8_t> &in, std::vector<port_watch::common::TargetStats> &out);

    std::vector<std::uint8_t> EncodeSummary(const port_watch::common::SummaryStats &summary);
    bool DecodeSummary(const std::vector<std::uint8_t> &in, port_watch::common::SummaryStats &out);

    std::vector<std::uint8_t> EncodeError(const ErrorReply &error);
    bool DecodeError(const std::vector<std::uint8_t> &in, ErrorReply &out);
}
