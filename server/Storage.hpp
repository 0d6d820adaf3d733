#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "../common/Models.hpp"

namespace port_watch::server
{
    // Read-only view of the external target registry.
    class TargetSource
    {
    public:
        virtual ~TargetSource() = default;
        virtual std::vector<port_watch::common::Target> ListActiveTargets() = 0;
    };

    // Append-only probe log. Implementations throw PersistenceError on failure.
    class ResultStore
    {
    public:
        virtual ~ResultStore() = default;

        // All-or-nothing for the whole batch.
        virtual void Append(const std::vector<port_watch::common::ProbeResult> &results) = 0;

        // Deletes results strictly older than cutoff and returns how many were removed.
        virtual std::size_t PurgeOlderThan(port_watch::common::Clock::time_point cutoff) = 0;
    };

    class SettingsBackend
    {
    public:
        virtual ~SettingsBackend() = default;
        virtual std::optional<std::string> GetSetting(const std::string &key) = 0;
        virtual void PutSetting(const std::string &key, const std::string &value) = 0;
    };
}
