#pragma once

#include <iostream>
#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <sqlite3.h>

#include "Storage.hpp"
#include "../common/Models.hpp"

namespace port_watch::server
{

    // One row per (target, probed address) inside an aggregation window.
    struct TargetWindowRow
    {
        int64_t target_id = 0;
        std::string region;
        std::string host;
        int port = 0;
        std::string business_system;
        double success_latency_sum = 0.0;
        uint64_t total_probes = 0;
        uint64_t successful_probes = 0;
    };

    struct ProbeCounts
    {
        uint64_t total = 0;
        uint64_t successful = 0;
    };

    // SQLite access for the registry, the probe log and the settings table.
    // Each component opens its own instance on the same file; WAL mode keeps
    // readers and the writer from blocking each other.
    class DatabaseManager : public TargetSource, public ResultStore, public SettingsBackend
    {
    private:
        sqlite3 *db_;
        std::mutex db_mutex_;
        std::string path_;

        sqlite3_stmt *stmt_insert_result_;

        sqlite3_stmt *Prepare(const char *sql);
        void Exec(const char *sql);
        void RequireOpen() const;

    public:
        DatabaseManager();
        ~DatabaseManager() override;

        DatabaseManager(const DatabaseManager &) = delete;
        DatabaseManager &operator=(const DatabaseManager &) = delete;

        bool Initialize(const std::string &db_path);
        void Shutdown();

        std::vector<port_watch::common::Target> ListActiveTargets() override;

        void Append(const std::vector<port_watch::common::ProbeResult> &results) override;
        std::size_t PurgeOlderThan(port_watch::common::Clock::time_point cutoff) override;

        std::optional<std::string> GetSetting(const std::string &key) override;
        void PutSetting(const std::string &key, const std::string &value) override;

        std::vector<TargetWindowRow> QueryTargetWindow(port_watch::common::Clock::time_point since,
                                                       const std::optional<std::string> &region);
        ProbeCounts CountProbesSince(port_watch::common::Clock::time_point since);
        uint64_t CountActiveTargets();
        std::vector<port_watch::common::RegionCount> CountActiveTargetsByRegion();
    };
}
