#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace port_watch::common
{
    inline constexpr double kLatencyNotMeasured = -1.0;

    inline constexpr int kMinProbeIntervalSeconds = 10;
    inline constexpr int kMaxProbeIntervalSeconds = 86400;
    inline constexpr int kDefaultProbeIntervalSeconds = 300;

    using Clock = std::chrono::system_clock;

    struct Target
    {
        int64_t id = 0;
        std::string region;
        std::string host;
        int port = 0;
        std::string business_system;
        bool active = true;
    };

    // Diagnostic only. Never persisted and never consulted by aggregation.
    enum class ProbeFailure
    {
        None,
        Resolve,
        Socket,
        Refused,
        Unreachable,
        Timeout,
        Other
    };

    const char *ProbeFailureName(ProbeFailure failure);

    struct ProbeResult
    {
        int64_t target_id = 0;
        std::string region;
        std::string host;
        int port = 0;
        double latency_ms = kLatencyNotMeasured;
        bool success = false;
        Clock::time_point timestamp;
        ProbeFailure failure = ProbeFailure::None;
    };

    enum class TaskStatus
    {
        Running,
        Stopped
    };

    const char *TaskStatusName(TaskStatus status);
    std::optional<TaskStatus> ParseTaskStatus(const std::string &text);

    struct Settings
    {
        int probe_interval_seconds = kDefaultProbeIntervalSeconds;
        TaskStatus task_status = TaskStatus::Stopped;
    };

    struct TargetStats
    {
        int64_t target_id = 0;
        std::string region;
        std::string host;
        int port = 0;
        std::string business_system;
        std::optional<double> avg_latency_ms;
        double packet_loss_rate = 0.0;
        uint64_t total_probes = 0;
        uint64_t successful_probes = 0;
    };

    struct RegionCount
    {
        std::string region;
        uint64_t count = 0;
    };

    struct SummaryStats
    {
        uint64_t total_targets = 0;
        uint64_t recent_probes_24h = 0;
        double success_rate_24h = 0.0;
        std::vector<RegionCount> regions;
    };

    inline int64_t ToEpochMillis(Clock::time_point tp)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }
}
