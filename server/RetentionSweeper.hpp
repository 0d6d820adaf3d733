#pragma once

#include <chrono>
#include <cstddef>

#include "Storage.hpp"

namespace port_watch::server
{
    inline constexpr std::chrono::hours kDefaultRetention{31 * 24};

    class RetentionSweeper
    {
    public:
        explicit RetentionSweeper(ResultStore &store, std::chrono::hours horizon = kDefaultRetention);

        // Deletes results older than now - horizon. The cutoff is fixed when the sweep
        // starts, so rows appended during the sweep are never touched.
        std::size_t Purge();
        std::size_t Purge(std::chrono::hours horizon, port_watch::common::Clock::time_point now);

        std::chrono::hours Horizon() const { return m_horizon; }

    private:
        ResultStore &m_store;
        std::chrono::hours m_horizon;
    };
}
