#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/config.h"
#include "runner/task_registry.h"

namespace pipehub::tasks {

struct PipelineTaskSpec {
    std::string name;
    std::vector<std::string> dependencies;
    std::optional<std::string> cadence;
    std::string description;
};

// 行情/新闻/特征/模型/交易 的每日流水线
const std::vector<PipelineTaskSpec>& pipelineTaskSpecs();

// 注册全部流水线任务；任务体执行配置项 pipeline.commands.<task> 指定的命令
void registerPipelineTasks(runner::TaskRegistry& registry, const Config& cfg);

} // namespace pipehub::tasks
