#include "RetentionSweeper.hpp"

#include <iostream>
#include <stdexcept>

namespace port_watch::server
{
    RetentionSweeper::RetentionSweeper(ResultStore &store, std::chrono::hours horizon)
        : m_store(store), m_horizon(horizon)
    {
        if (horizon.count() <= 0)
            throw std::invalid_argument("retention horizon must be positive");
    }

    std::size_t RetentionSweeper::Purge()
    {
        return Purge(m_horizon, port_watch::common::Clock::now());
    }

    std::size_t RetentionSweeper::Purge(std::chrono::hours horizon, port_watch::common::Clock::time_point now)
    {
        if (horizon.count() <= 0)
            throw std::invalid_argument("retention horizon must be positive");

        const auto cutoff = now - horizon;
        std::size_t deleted = m_store.PurgeOlderThan(cutoff);
        if (deleted > 0)
        {
            std::cout << "[Retention] Purged " << deleted << " probe results older than "
                      << horizon.count() / 24 << " days" << std::endl;
        }
        return deleted;
    }
}
