#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "runner/task_body.h"

namespace pipehub::runner {

/// 注册后不可变；TaskRegistry 以 shared_ptr<const TaskDefinition> 持有
struct TaskDefinition {
    std::string name;
    std::vector<std::string> dependencies;   // 按声明顺序执行
    std::optional<std::string> cadence;      // 仅透传（"daily" / "hourly" ...），不解释
    std::string description;
    std::shared_ptr<ITaskBody> body;
};

inline nlohmann::json taskDefinitionToJson(const TaskDefinition& d) {
    nlohmann::json j;
    j["name"]         = d.name;
    j["dependencies"] = d.dependencies;
    j["cadence"]      = d.cadence ? nlohmann::json(*d.cadence) : nlohmann::json(nullptr);
    j["description"]  = d.description;
    return j;
}

} // namespace pipehub::runner
