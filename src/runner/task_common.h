#pragma once
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace pipehub::core {

// task_runs.status：RUNNING 只出现在运行中，SUCCESS / FAILED 为终态
enum class RunStatus {
    Running,
    Success,
    Failed
};

inline bool isTerminal(RunStatus s) {
    return s != RunStatus::Running;
}

inline std::string runStatusToString(RunStatus s) {
    switch (s) {
        case RunStatus::Running: return "RUNNING";
        case RunStatus::Success: return "SUCCESS";
        case RunStatus::Failed:  return "FAILED";
        default:                 return "FAILED";
    }
}

inline std::optional<RunStatus> runStatusFromString(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c){ return std::toupper(c); });
    if (str == "RUNNING") return RunStatus::Running;
    if (str == "SUCCESS") return RunStatus::Success;
    if (str == "FAILED")  return RunStatus::Failed;
    return std::nullopt;
}

} // namespace pipehub::core
