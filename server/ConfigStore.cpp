#include "ConfigStore.hpp"
#include "../common/Errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <iostream>

namespace port_watch::server
{
    using port_watch::common::ConfigValidationError;
    using port_watch::common::TaskStatus;

    ConfigStore::ConfigStore(SettingsBackend &backend) : m_backend(backend) {}

    void ConfigStore::ValidateProbeInterval(int seconds)
    {
        if (seconds < port_watch::common::kMinProbeIntervalSeconds ||
            seconds > port_watch::common::kMaxProbeIntervalSeconds)
        {
            throw ConfigValidationError("probe interval must be between " +
                                        std::to_string(port_watch::common::kMinProbeIntervalSeconds) + " and " +
                                        std::to_string(port_watch::common::kMaxProbeIntervalSeconds) +
                                        " seconds, got " + std::to_string(seconds));
        }
    }

    int ConfigStore::GetProbeInterval()
    {
        auto raw = m_backend.GetSetting(kProbeIntervalKey);
        if (!raw)
            return port_watch::common::kDefaultProbeIntervalSeconds;

        errno = 0;
        char *end = nullptr;
        long value = std::strtol(raw->c_str(), &end, 10);
        if (!raw->empty() && *end == '\0' && errno == 0 &&
            value >= port_watch::common::kMinProbeIntervalSeconds &&
            value <= port_watch::common::kMaxProbeIntervalSeconds)
        {
            return static_cast<int>(value);
        }

        std::cerr << "[Config] Stored " << kProbeIntervalKey << " '" << *raw
                  << "' is invalid, using default " << port_watch::common::kDefaultProbeIntervalSeconds << std::endl;
        return port_watch::common::kDefaultProbeIntervalSeconds;
    }

    TaskStatus ConfigStore::GetTaskStatus()
    {
        auto raw = m_backend.GetSetting(kTaskStatusKey);
        if (!raw)
            return TaskStatus::Stopped;

        auto parsed = port_watch::common::ParseTaskStatus(*raw);
        if (!parsed)
        {
            std::cerr << "[Config] Stored " << kTaskStatusKey << " '" << *raw << "' is invalid, treating as stopped"
                      << std::endl;
            return TaskStatus::Stopped;
        }
        return *parsed;
    }

    port_watch::common::Settings ConfigStore::Read()
    {
        port_watch::common::Settings settings;
        settings.probe_interval_seconds = GetProbeInterval();
        settings.task_status = GetTaskStatus();
        return settings;
    }

    void ConfigStore::SetProbeInterval(int seconds)
    {
        ValidateProbeInterval(seconds);
        m_backend.PutSetting(kProbeIntervalKey, std::to_string(seconds));
    }

    void ConfigStore::SetTaskStatus(const std::string &status)
    {
        auto parsed = port_watch::common::ParseTaskStatus(status);
        if (!parsed)
            throw ConfigValidationError("task status must be 'running' or 'stopped', got '" + status + "'");
        SetTaskStatus(*parsed);
    }

    void ConfigStore::SetTaskStatus(TaskStatus status)
    {
        m_backend.PutSetting(kTaskStatusKey, port_watch::common::TaskStatusName(status));
    }
}
