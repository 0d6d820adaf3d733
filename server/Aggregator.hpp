#pragma once

#include <optional>
#include <string>
#include <vector>

#include "DatabaseManager.hpp"
#include "../common/Models.hpp"

namespace port_watch::server
{
    // Window length in days for a time-range token (1d, 7d, 1M, 3M, 6M, 1Y).
    // Throws AggregationInputError for anything else.
    int ParseTimeRange(const std::string &token);

    class Aggregator
    {
    public:
        explicit Aggregator(DatabaseManager &db);

        // A region of "all" (or empty) disables the filter.
        std::vector<port_watch::common::TargetStats> Aggregate(const std::string &time_range,
                                                               const std::optional<std::string> &region);
        std::vector<port_watch::common::TargetStats> Aggregate(const std::string &time_range,
                                                               const std::optional<std::string> &region,
                                                               port_watch::common::Clock::time_point now);

        // Trailing 24 hours, independent of any time range.
        port_watch::common::SummaryStats Summary();
        port_watch::common::SummaryStats Summary(port_watch::common::Clock::time_point now);

        std::string ExportCsv(const std::string &time_range, const std::optional<std::string> &region);

        static port_watch::common::TargetStats BuildStats(const TargetWindowRow &row);
        static std::string RenderCsv(const std::vector<port_watch::common::TargetStats> &stats);

    private:
        DatabaseManager &m_db;
    };
}
