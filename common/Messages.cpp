#include "Messages.hpp"
#include "Codec.hpp"

namespace port_watch::protocol
{
    namespace wire = port_watch::common::wire;
    using port_watch::common::RegionCount;
    using port_watch::common::Settings;
    using port_watch::common::SummaryStats;
    using port_watch::common::TargetStats;

    std::vector<std::uint8_t> EncodeSettings(const Settings &settings)
    {
        std::vector<std::uint8_t> out;
        wire::append_u32_be(out, static_cast<std::uint32_t>(settings.probe_interval_seconds));
        wire::append_string(out, port_watch::common::TaskStatusName(settings.task_status));
        return out;
    }

    bool DecodeSettings(const std::vector<std::uint8_t> &in, Settings &out)
    {
        std::size_t offset = 0;
        std::uint32_t interval = 0;
        std::string status;
        if (!wire::read_u32_be(in, offset, interval) || !wire::read_string(in, offset, status))
            return false;

        auto parsed = port_watch::common::ParseTaskStatus(status);
        if (!parsed)
            return false;

        out.probe_interval_seconds = static_cast<int>(interval);
        out.task_status = *parsed;
        return offset == in.size();
    }

    std::vector<std::uint8_t> EncodeProbeInterval(int seconds)
    {
        std::vector<std::uint8_t> out;
        wire::append_u32_be(out, static_cast<std::uint32_t>(seconds));
        return out;
    }

    bool DecodeProbeInterval(const std::vector<std::uint8_t> &in, int &out)
    {
        std::size_t offset = 0;
        std::uint32_t value = 0;
        if (!wire::read_u32_be(in, offset, value))
            return false;
        // Values beyond INT_MAX arrive negative and are rejected by ConfigStore.
        out = static_cast<int>(value);
        return offset == in.size();
    }

    std::vector<std::uint8_t> EncodeText(const std::string &text)
    {
        std::vector<std::uint8_t> out;
        wire::append_string(out, text);
        return out;
    }

    bool DecodeText(const std::vector<std::uint8_t> &in, std::string &out)
    {
        std::size_t offset = 0;
        if (!wire::read_string(in, offset, out))
            return false;
        return offset == in.size();
    }

    std::vector<std::uint8_t> EncodeStatsQuery(const StatsQuery &query)
    {
        std::vector<std::uint8_t> out;
        wire::append_string(out, query.time_range);
        wire::append_string(out, query.region);
        return out;
    }

    bool DecodeStatsQuery(const std::vector<std::uint8_t> &in, StatsQuery &out)
    {
        std::size_t offset = 0;
        if (!wire::read_string(in, offset, out.time_range) || !wire::read_string(in, offset, out.region))
            return false;
        return offset == in.size();
    }

    std::vector<std::uint8_t> EncodeTargetStats(const std::vector<TargetStats> &stats)
    {
        std::vector<std::uint8_t> out;
        wire::append_u32_be(out, static_cast<std::uint32_t>(stats.size()));
        for (const auto &s : stats)
        {
            wire::append_i64_be(out, s.target_id);
            wire::append_string(out, s.region);
            wire::append_string(out, s.host);
            wire::append_u32_be(out, static_cast<std::uint32_t>(s.port));
            wire::append_string(out, s.business_system);
            wire::append_u8(out, s.avg_latency_ms.has_value() ? 1 : 0);
            wire::append_f64_be(out, s.avg_latency_ms.value_or(0.0));
            wire::append_f64_be(out, s.packet_loss_rate);
            wire::append_u64_be(out, s.total_probes);
            wire::append_u64_be(out, s.successful_probes);
        }
        return out;
    }

    bool DecodeTargetStats(const std::vector<std::uint8_t> &in, std::vector<TargetStats> &out)
    {
        std::size_t offset = 0;
        std::uint32_t count = 0;
        if (!wire::read_u32_be(in, offset, count))
            return false;

        out.clear();
        for (std::uint32_t i = 0; i < count; ++i)
        {
            TargetStats s;
            std::uint32_t port = 0;
            std::uint8_t has_avg = 0;
            double avg = 0.0;
            if (!wire::read_i64_be(in, offset, s.target_id) ||
                !wire::read_string(in, offset, s.region) ||
                !wire::read_string(in, offset, s.host) ||
                !wire::read_u32_be(in, offset, port) ||
                !wire::read_string(in, offset, s.business_system) ||
                !wire::read_u8(in, offset, has_avg) ||
                !wire::read_f64_be(in, offset, avg) ||
                !wire::read_f64_be(in, offset, s.packet_loss_rate) ||
                !wire::read_u64_be(in, offset, s.total_probes) ||
                !wire::read_u64_be(in, offset, s.successful_probes))
                return false;

            s.port = static_cast<int>(port);
            if (has_avg)
                s.avg_latency_ms = avg;
            out.push_back(std::move(s));
        }
        return offset == in.size();
    }

    std::vector<std::uint8_t> EncodeSummary(const SummaryStats &summary)
    {
        std::vector<std::uint8_t> out;
        wire::append_u64_be(out, summary.total_targets);
        wire::append_u64_be(out, summary.recent_probes_24h);
        wire::append_f64_be(out, summary.success_rate_24h);
        wire::append_u32_be(out, static_cast<std::uint32_t>(summary.regions.size()));
        for (const auto &r : summary.regions)
        {
            wire::append_string(out, r.region);
            wire::append_u64_be(out, r.count);
        }
        return out;
    }

    bool DecodeSummary(const std::vector<std::uint8_t> &in, SummaryStats &out)
    {
        std::size_t offset = 0;
        std::uint32_t count = 0;
        if (!wire::read_u64_be(in, offset, out.total_targets) ||
            !wire::read_u64_be(in, offset, out.recent_probes_24h) ||
            !wire::read_f64_be(in, offset, out.success_rate_24h) ||
            !wire::read_u32_be(in, offset, count))
            return false;

        out.regions.clear();
        for (std::uint32_t i = 0; i < count; ++i)
        {
            RegionCount r;
            if (!wire::read_string(in, offset, r.region) || !wire::read_u64_be(in, offset, r.count))
                return false;
            out.regions.push_back(std::move(r));
        }
        return offset == in.size();
    }

    std::vector<std::uint8_t> EncodeError(const ErrorReply &error)
    {
        std::vector<std::uint8_t> out;
        wire::append_u8(out, static_cast<std::uint8_t>(error.code));
        wire::append_string(out, error.message);
        return out;
    }

    bool DecodeError(const std::vector<std::uint8_t> &in, ErrorReply &out)
    {
        std::size_t offset = 0;
        std::uint8_t code = 0;
        if (!wire::read_u8(in, offset, code) || !wire::read_string(in, offset, out.message))
            return false;
        out.code = static_cast<ErrorCode>(code);
        return offset == in.size();
    }
}
