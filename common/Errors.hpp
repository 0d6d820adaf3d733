#pragma once

#include <stdexcept>
#include <string>

namespace port_watch::common
{
    // Reading or writing persistent state failed (database open, statement, commit).
    class PersistenceError : public std::runtime_error
    {
    public:
        explicit PersistenceError(const std::string &what) : std::runtime_error(what) {}
    };

    // Rejected setting write. The previously stored value stays in effect.
    class ConfigValidationError : public std::runtime_error
    {
    public:
        explicit ConfigValidationError(const std::string &what) : std::runtime_error(what) {}
    };

    class AggregationInputError : public std::runtime_error
    {
    public:
        explicit AggregationInputError(const std::string &what) : std::runtime_error(what) {}
    };
}
