#pragma once
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "db/run_store.h"
#include "runner/task_definition.h"

namespace pipehub::runner {

/// 一次顶层 run() 内已经成功执行过的任务名，用于链内去重
using ExecutionSet = std::unordered_set<std::string>;

/// TaskRegistry：保存任务定义，按依赖顺序执行，并把每次执行写入 RunStore。
///
/// run(name) 的流程（深度优先、先序）：
///   1. name 已在 ExecutionSet 中 -> 直接返回（空 run id）
///   2. 查找定义，不存在 -> core::UnknownTaskError
///   3. 按声明顺序递归执行依赖（共享同一个 ExecutionSet）
///   4. 插入 RUNNING 记录，调用任务体
///   5. 无论任务体如何退出都会写终态（RunFinalizer）
///   6. 失败 -> core::TaskFailedError(run id)；成功 -> 加入 ExecutionSet，返回 run id
///
/// 依赖环在执行任何任务体之前由 "正在解析" 栈检出 -> core::CycleDetectedError。
/// 单线程、同步执行；不同的顶层 run() 之间不共享 ExecutionSet。
class TaskRegistry {
public:
    explicit TaskRegistry(RunStore& store);

    /// 新增或替换。注册时不校验依赖是否存在（允许前向引用）
    void registerTask(const std::string& name,
                      std::shared_ptr<ITaskBody> body,
                      std::vector<std::string> dependencies = {},
                      std::optional<std::string> cadence = std::nullopt,
                      std::string description = "");

    void registerTask(const std::string& name,
                      TaskFn fn,
                      std::vector<std::string> dependencies = {},
                      std::optional<std::string> cadence = std::nullopt,
                      std::string description = "");

    /// 字典序
    std::vector<std::string> list() const;

    bool contains(const std::string& name) const;

    /// 未注册抛 core::UnknownTaskError
    std::shared_ptr<const TaskDefinition> get(const std::string& name) const;

    std::string run(const std::string& name);
    std::string run(const std::string& name, ExecutionSet& executed);

private:
    std::string runResolving_(const std::string& name,
                              ExecutionSet& executed,
                              std::vector<std::string>& resolving);

    std::string execute_(const TaskDefinition& def, const std::vector<std::string>& chain);

    core::TaskOutcome invokeBody_(const TaskDefinition& def);

private:
    RunStore& _store;
    std::unordered_map<std::string, std::shared_ptr<const TaskDefinition>> _tasks;
};

} // namespace pipehub::runner
