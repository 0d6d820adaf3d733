#pragma once

#include <string>

#include "Storage.hpp"
#include "../common/Models.hpp"

namespace port_watch::server
{
    inline constexpr const char *kProbeIntervalKey = "probe_interval_seconds";
    inline constexpr const char *kTaskStatusKey = "task_status";

    // Typed access to the two operator settings. Writes are validated before they
    // reach the backend; reads fall back to defaults for missing or unreadable rows.
    class ConfigStore
    {
    public:
        explicit ConfigStore(SettingsBackend &backend);

        port_watch::common::Settings Read();

        int GetProbeInterval();
        port_watch::common::TaskStatus GetTaskStatus();

        // Throw ConfigValidationError for out-of-range or unknown values.
        void SetProbeInterval(int seconds);
        void SetTaskStatus(const std::string &status);
        void SetTaskStatus(port_watch::common::TaskStatus status);

        static void ValidateProbeInterval(int seconds);

    private:
        SettingsBackend &m_backend;
    };
}
