#include "DatabaseManager.hpp"
#include "../common/Errors.hpp"
#include <iostream>
#include <vector>
#include <mutex>
#include <optional>

namespace port_watch::server
{
    using port_watch::common::PersistenceError;

    namespace
    {
        struct StatementGuard
        {
            sqlite3_stmt *stmt;
            ~StatementGuard() { sqlite3_finalize(stmt); }
        };

        std::string ColumnText(sqlite3_stmt *stmt, int col)
        {
            const char *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, col));
            return text ? std::string(text) : std::string();
        }
    }

    DatabaseManager::DatabaseManager() : db_(nullptr), stmt_insert_result_(nullptr) {}

    DatabaseManager::~DatabaseManager()
    {
        Shutdown();
    }

    bool DatabaseManager::Initialize(const std::string &db_path)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);

        if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK)
        {
            std::cerr << "[DB] Open failed: " << sqlite3_errmsg(db_) << std::endl;
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }
        path_ = db_path;

        sqlite3_busy_timeout(db_, 5000);
        sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

        const char *sql_tables =
            "CREATE TABLE IF NOT EXISTS monitored_targets ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "region TEXT NOT NULL, "
            "public_ip TEXT NOT NULL, "
            "port INTEGER NOT NULL, "
            "business_system TEXT, "
            "internal_ip TEXT, "
            "internal_port INTEGER, "
            "is_active INTEGER DEFAULT 1, "
            "created_at DATETIME DEFAULT CURRENT_TIMESTAMP, "
            "updated_at DATETIME DEFAULT CURRENT_TIMESTAMP, "
            "UNIQUE(public_ip, port)"
            ");"

            // No foreign key to monitored_targets: history outlives deleted targets.
            "CREATE TABLE IF NOT EXISTS tcp_probe_results ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "target_id INTEGER NOT NULL, "
            "region TEXT NOT NULL, "
            "public_ip TEXT NOT NULL, "
            "port INTEGER NOT NULL, "
            "latency_ms REAL, "
            "is_successful INTEGER NOT NULL, "
            "probe_time INTEGER NOT NULL"
            ");"

            "CREATE INDEX IF NOT EXISTS idx_tcp_probe_results_target_id ON tcp_probe_results(target_id);"
            "CREATE INDEX IF NOT EXISTS idx_tcp_probe_results_probe_time ON tcp_probe_results(probe_time);"
            "CREATE INDEX IF NOT EXISTS idx_tcp_probe_results_region ON tcp_probe_results(region);"
            "CREATE INDEX IF NOT EXISTS idx_tcp_probe_results_target_time ON tcp_probe_results(target_id, probe_time);"

            "CREATE TABLE IF NOT EXISTS settings ("
            "key TEXT PRIMARY KEY, "
            "value TEXT NOT NULL"
            ");";

        char *err_msg = nullptr;
        if (sqlite3_exec(db_, sql_tables, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::cerr << "[DB] Schema error: " << (err_msg ? err_msg : "unknown") << std::endl;
            sqlite3_free(err_msg);
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }
        return true;
    }

    void DatabaseManager::Shutdown()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (stmt_insert_result_)
        {
            sqlite3_finalize(stmt_insert_result_);
            stmt_insert_result_ = nullptr;
        }
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    void DatabaseManager::RequireOpen() const
    {
        if (!db_)
            throw PersistenceError("database is not open");
    }

    sqlite3_stmt *DatabaseManager::Prepare(const char *sql)
    {
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::string msg = std::string("prepare failed: ") + sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw PersistenceError(msg);
        }
        return stmt;
    }

    void DatabaseManager::Exec(const char *sql)
    {
        char *err_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::string msg = std::string(sql) + " failed: " + (err_msg ? err_msg : sqlite3_errmsg(db_));
            sqlite3_free(err_msg);
            throw PersistenceError(msg);
        }
    }

    std::vector<port_watch::common::Target> DatabaseManager::ListActiveTargets()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        RequireOpen();

        std::vector<port_watch::common::Target> targets;
        StatementGuard guard{Prepare("SELECT id, region, public_ip, port, business_system "
                                     "FROM monitored_targets WHERE is_active = 1 ORDER BY id;")};

        int rc;
        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW)
        {
            port_watch::common::Target t;
            t.id = sqlite3_column_int64(guard.stmt, 0);
            t.region = ColumnText(guard.stmt, 1);
            t.host = ColumnText(guard.stmt, 2);
            t.port = sqlite3_column_int(guard.stmt, 3);
            t.business_system = ColumnText(guard.stmt, 4);
            t.active = true;
            targets.push_back(std::move(t));
        }
        if (rc != SQLITE_DONE)
            throw PersistenceError(std::string("listing targets failed: ") + sqlite3_errmsg(db_));
        return targets;
    }

    void DatabaseManager::Append(const std::vector<port_watch::common::ProbeResult> &results)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        RequireOpen();
        if (results.empty())
            return;

        if (!stmt_insert_result_)
        {
            stmt_insert_result_ = Prepare(
                "INSERT INTO tcp_probe_results "
                "(target_id, region, public_ip, port, latency_ms, is_successful, probe_time) "
                "VALUES (?, ?, ?, ?, ?, ?, ?);");
        }

        Exec("BEGIN IMMEDIATE;");
        try
        {
            for (const auto &r : results)
            {
                sqlite3_reset(stmt_insert_result_);
                sqlite3_clear_bindings(stmt_insert_result_);

                sqlite3_bind_int64(stmt_insert_result_, 1, r.target_id);
                sqlite3_bind_text(stmt_insert_result_, 2, r.region.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(stmt_insert_result_, 3, r.host.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_int(stmt_insert_result_, 4, r.port);
                sqlite3_bind_double(stmt_insert_result_, 5,
                                    r.success ? r.latency_ms : port_watch::common::kLatencyNotMeasured);
                sqlite3_bind_int(stmt_insert_result_, 6, r.success ? 1 : 0);
                sqlite3_bind_int64(stmt_insert_result_, 7, port_watch::common::ToEpochMillis(r.timestamp));

                if (sqlite3_step(stmt_insert_result_) != SQLITE_DONE)
                    throw PersistenceError(std::string("insert failed: ") + sqlite3_errmsg(db_));
            }
            sqlite3_reset(stmt_insert_result_);
            Exec("COMMIT;");
        }
        catch (const std::exception &)
        {
            sqlite3_reset(stmt_insert_result_);
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
            throw;
        }
    }

    std::size_t DatabaseManager::PurgeOlderThan(port_watch::common::Clock::time_point cutoff)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        RequireOpen();

        StatementGuard guard{Prepare("DELETE FROM tcp_probe_results WHERE probe_time < ?;")};
        sqlite3_bind_int64(guard.stmt, 1, port_watch::common::ToEpochMillis(cutoff));
        if (sqlite3_step(guard.stmt) != SQLITE_DONE)
            throw PersistenceError(std::string("purge failed: ") + sqlite3_errmsg(db_));
        return static_cast<std::size_t>(sqlite3_changes(db_));
    }

    std::optional<std::string> DatabaseManager::GetSetting(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        RequireOpen();

        StatementGuard guard{Prepare("SELECT value FROM settings WHERE key = ?;")};
        sqlite3_bind_text(guard.stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(guard.stmt);
        if (rc == SQLITE_ROW)
            return ColumnText(guard.stmt, 0);
        if (rc != SQLITE_DONE)
            throw PersistenceError(std::string("reading setting '") + key + "' failed: " + sqlite3_errmsg(db_));
        return std::nullopt;
    }

    void DatabaseManager::PutSetting(const std::string &key, const std::string &value)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        RequireOpen();

        StatementGuard guard{Prepare("INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?);")};
        sqlite3_bind_text(guard.stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(guard.stmt) != SQLITE_DONE)
            throw PersistenceError(std::string("writing setting '") + key + "' failed: " + sqlite3_errmsg(db_));
    }

    std::vector<TargetWindowRow> DatabaseManager::QueryTargetWindow(port_watch::common::Clock::time_point since,
                                                                    const std::optional<std::string> &region)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        RequireOpen();

        const char *sql =
            "SELECT r.target_id, r.region, r.public_ip, r.port, t.business_system, "
            "COALESCE(SUM(CASE WHEN r.is_successful = 1 THEN r.latency_ms END), 0), "
            "COUNT(r.id), "
            "COALESCE(SUM(CASE WHEN r.is_successful = 1 THEN 1 ELSE 0 END), 0) "
            "FROM tcp_probe_results r "
            "LEFT JOIN monitored_targets t ON t.id = r.target_id "
            "WHERE r.probe_time >= ?1 AND (?2 IS NULL OR r.region = ?2) "
            "GROUP BY r.target_id, r.region, r.public_ip, r.port "
            "ORDER BY r.region, r.public_ip, r.port, r.target_id;";

        StatementGuard guard{Prepare(sql)};
        sqlite3_bind_int64(guard.stmt, 1, port_watch::common::ToEpochMillis(since));
        if (region)
            sqlite3_bind_text(guard.stmt, 2, region->c_str(), -1, SQLITE_TRANSIENT);
        else
            sqlite3_bind_null(guard.stmt, 2);

        std::vector<TargetWindowRow> rows;
        int rc;
        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW)
        {
            TargetWindowRow row;
            row.target_id = sqlite3_column_int64(guard.stmt, 0);
            row.region = ColumnText(guard.stmt, 1);
            row.host = ColumnText(guard.stmt, 2);
            row.port = sqlite3_column_int(guard.stmt, 3);
            row.business_system = ColumnText(guard.stmt, 4);
            row.success_latency_sum = sqlite3_column_double(guard.stmt, 5);
            row.total_probes = static_cast<uint64_t>(sqlite3_column_int64(guard.stmt, 6));
            row.successful_probes = static_cast<uint64_t>(sqlite3_column_int64(guard.stmt, 7));
            rows.push_back(std::move(row));
        }
        if (rc != SQLITE_DONE)
            throw PersistenceError(std::string("window query failed: ") + sqlite3_errmsg(db_));
        return rows;
    }

    ProbeCounts DatabaseManager::CountProbesSince(port_watch::common::Clock::time_point since)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        RequireOpen();

        StatementGuard guard{Prepare("SELECT COUNT(*), COALESCE(SUM(is_successful), 0) "
                                     "FROM tcp_probe_results WHERE probe_time >= ?;")};
        sqlite3_bind_int64(guard.stmt, 1, port_watch::common::ToEpochMillis(since));

        ProbeCounts counts;
        if (sqlite3_step(guard.stmt) != SQLITE_ROW)
            throw PersistenceError(std::string("probe count failed: ") + sqlite3_errmsg(db_));
        counts.total = static_cast<uint64_t>(sqlite3_column_int64(guard.stmt, 0));
        counts.successful = static_cast<uint64_t>(sqlite3_column_int64(guard.stmt, 1));
        return counts;
    }

    uint64_t DatabaseManager::CountActiveTargets()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        RequireOpen();

        StatementGuard guard{Prepare("SELECT COUNT(*) FROM monitored_targets WHERE is_active = 1;")};
        if (sqlite3_step(guard.stmt) != SQLITE_ROW)
            throw PersistenceError(std::string("target count failed: ") + sqlite3_errmsg(db_));
        return static_cast<uint64_t>(sqlite3_column_int64(guard.stmt, 0));
    }

    std::vector<port_watch::common::RegionCount> DatabaseManager::CountActiveTargetsByRegion()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        RequireOpen();

        StatementGuard guard{Prepare("SELECT region, COUNT(id) FROM monitored_targets "
                                     "WHERE is_active = 1 GROUP BY region ORDER BY region;")};

        std::vector<port_watch::common::RegionCount> regions;
        int rc;
        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW)
        {
            port_watch::common::RegionCount rc_row;
            rc_row.region = ColumnText(guard.stmt, 0);
            rc_row.count = static_cast<uint64_t>(sqlite3_column_int64(guard.stmt, 1));
            regions.push_back(std::move(rc_row));
        }
        if (rc != SQLITE_DONE)
            throw PersistenceError(std::string("region breakdown failed: ") + sqlite3_errmsg(db_));
        return regions;
    }
}
