#include "Models.hpp"

namespace port_watch::common
{
    const char *ProbeFailureName(ProbeFailure failure)
    {
        switch (failure)
        {
        case ProbeFailure::None: return "none";
        case ProbeFailure::Resolve: return "resolve";
        case ProbeFailure::Socket: return "socket";
        case ProbeFailure::Refused: return "refused";
        case ProbeFailure::Unreachable: return "unreachable";
        case ProbeFailure::Timeout: return "timeout";
        case ProbeFailure::Other: return "other";
        }
        return "other";
    }

    const char *TaskStatusName(TaskStatus status)
    {
        return status == TaskStatus::Running ? "running" : "stopped";
    }

    std::optional<TaskStatus> ParseTaskStatus(const std::string &text)
    {
        if (text == "running")
            return TaskStatus::Running;
        if (text == "stopped")
            return TaskStatus::Stopped;
        return std::nullopt;
    }
}
