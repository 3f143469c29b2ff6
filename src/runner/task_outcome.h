#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace pipehub::core {

/// 任务体一次执行的结果：成功（可带 JSON 产物）或失败（消息 + 诊断信息）
struct TaskOutcome {
    bool failed{false};

    // 成功时：非空则写入 task_runs.artifacts
    std::optional<nlohmann::json> artifacts;

    // 失败时
    std::string message;
    std::string detail;

    bool ok() const { return !failed; }

    static TaskOutcome success(nlohmann::json payload) {
        TaskOutcome o;
        o.artifacts = std::move(payload);
        return o;
    }

    static TaskOutcome empty() {
        return TaskOutcome{};
    }

    static TaskOutcome failure(std::string message, std::string detail = {}) {
        TaskOutcome o;
        o.failed  = true;
        o.message = std::move(message);
        o.detail  = std::move(detail);
        return o;
    }
};

} // namespace pipehub::core
