#include "Aggregator.hpp"
#include "../common/Errors.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace port_watch::server
{
    using port_watch::common::Clock;
    using port_watch::common::SummaryStats;
    using port_watch::common::TargetStats;

    namespace
    {
        struct TimeRangeEntry
        {
            const char *token;
            int days;
        };

        constexpr TimeRangeEntry kTimeRanges[] = {
            {"1d", 1},
            {"7d", 7},
            {"1M", 30},
            {"3M", 90},
            {"6M", 180},
            {"1Y", 365},
        };

        double Round2(double value)
        {
            return std::round(value * 100.0) / 100.0;
        }

        std::optional<std::string> EffectiveRegion(const std::optional<std::string> &region)
        {
            if (!region || region->empty() || *region == "all")
                return std::nullopt;
            return region;
        }

        std::string CsvField(const std::string &value)
        {
            if (value.find_first_of(",\"\r\n") == std::string::npos)
                return value;

            std::string quoted = "\"";
            for (char c : value)
            {
                if (c == '"')
                    quoted += "\"\"";
                else
                    quoted += c;
            }
            quoted += "\"";
            return quoted;
        }
    }

    int ParseTimeRange(const std::string &token)
    {
        for (const auto &entry : kTimeRanges)
        {
            if (token == entry.token)
                return entry.days;
        }

        std::string supported;
        for (const auto &entry : kTimeRanges)
        {
            if (!supported.empty())
                supported += ", ";
            supported += entry.token;
        }
        throw port_watch::common::AggregationInputError("invalid time range '" + token + "', supported: " + supported);
    }

    Aggregator::Aggregator(DatabaseManager &db) : m_db(db) {}

    TargetStats Aggregator::BuildStats(const TargetWindowRow &row)
    {
        TargetStats stats;
        stats.target_id = row.target_id;
        stats.region = row.region;
        stats.host = row.host;
        stats.port = row.port;
        stats.business_system = row.business_system;
        stats.total_probes = row.total_probes;
        stats.successful_probes = row.successful_probes;

        if (row.successful_probes > 0)
            stats.avg_latency_ms = Round2(row.success_latency_sum / static_cast<double>(row.successful_probes));

        if (row.total_probes > 0)
        {
            const double failed = static_cast<double>(row.total_probes - row.successful_probes);
            stats.packet_loss_rate = Round2(failed / static_cast<double>(row.total_probes) * 100.0);
        }
        return stats;
    }

    std::vector<TargetStats> Aggregator::Aggregate(const std::string &time_range,
                                                   const std::optional<std::string> &region)
    {
        return Aggregate(time_range, region, Clock::now());
    }

    std::vector<TargetStats> Aggregator::Aggregate(const std::string &time_range,
                                                   const std::optional<std::string> &region,
                                                   Clock::time_point now)
    {
        const int days = ParseTimeRange(time_range);
        const auto since = now - std::chrono::hours(24 * days);

        std::vector<TargetStats> stats;
        for (const auto &row : m_db.QueryTargetWindow(since, EffectiveRegion(region)))
            stats.push_back(BuildStats(row));
        return stats;
    }

    SummaryStats Aggregator::Summary()
    {
        return Summary(Clock::now());
    }

    SummaryStats Aggregator::Summary(Clock::time_point now)
    {
        SummaryStats summary;
        summary.total_targets = m_db.CountActiveTargets();

        auto counts = m_db.CountProbesSince(now - std::chrono::hours(24));
        summary.recent_probes_24h = counts.total;
        if (counts.total > 0)
            summary.success_rate_24h = Round2(static_cast<double>(counts.successful) / counts.total * 100.0);

        summary.regions = m_db.CountActiveTargetsByRegion();
        return summary;
    }

    std::string Aggregator::ExportCsv(const std::string &time_range, const std::optional<std::string> &region)
    {
        return RenderCsv(Aggregate(time_range, region));
    }

    std::string Aggregator::RenderCsv(const std::vector<TargetStats> &stats)
    {
        std::ostringstream out;
        out << "region,public_ip,port,business_system,avg_latency_ms,packet_loss_pct,total_probes,successful_probes\n";
        out << std::fixed << std::setprecision(2);
        for (const auto &s : stats)
        {
            out << CsvField(s.region) << ','
                << CsvField(s.host) << ','
                << s.port << ','
                << CsvField(s.business_system) << ',';
            if (s.avg_latency_ms)
                out << *s.avg_latency_ms;
            out << ','
                << s.packet_loss_rate << ','
                << s.total_probes << ','
                << s.successful_probes << '\n';
        }
        return out.str();
    }
}
