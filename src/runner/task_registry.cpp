#include "task_registry.h"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <typeinfo>
#if defined(__GNUG__)
#include <cxxabi.h>
#include <cstdlib>
#endif

#include "core/errors.h"
#include "core/utils.h"
#include "log/logger.h"
#include "log/log_manager.h"
#include "runner/run_finalizer.h"

namespace pipehub::runner {

namespace {

std::string exceptionTypeName(const std::exception& ex)
{
    const char* raw = typeid(ex).name();
#if defined(__GNUG__)
    int status = 0;
    char* demangled = abi::__cxa_demangle(raw, nullptr, nullptr, &status);
    if (status == 0 && demangled) {
        std::string out(demangled);
        std::free(demangled);
        return out;
    }
    std::free(demangled);
#endif
    return raw;
}

std::string joinChain(const std::vector<std::string>& chain)
{
    std::string out;
    for (const auto& n : chain) {
        if (!out.empty()) out += " > ";
        out += n;
    }
    return out;
}

// task_runs.error：第一行是消息，后面是诊断信息
std::string formatError(const TaskDefinition& def,
                        const std::vector<std::string>& chain,
                        const core::TaskOutcome& outcome)
{
    std::string err = outcome.message.empty() ? "task failed" : outcome.message;
    err += "\ntask: " + def.name;
    err += "\nchain: " + joinChain(chain);
    if (!outcome.detail.empty()) {
        err += "\n" + outcome.detail;
    }
    return err;
}

} // namespace

TaskRegistry::TaskRegistry(RunStore& store) : _store(store) {}

void TaskRegistry::registerTask(const std::string& name,
                                std::shared_ptr<ITaskBody> body,
                                std::vector<std::string> dependencies,
                                std::optional<std::string> cadence,
                                std::string description)
{
    if (name.empty()) {
        throw std::invalid_argument("task name must not be empty");
    }
    if (!body) {
        throw std::invalid_argument("task " + name + " has no body");
    }

    auto def = std::make_shared<TaskDefinition>();
    def->name = name;
    def->dependencies = std::move(dependencies);
    def->cadence = std::move(cadence);
    def->description = std::move(description);
    def->body = std::move(body);

    if (_tasks.count(name)) {
        Logger::debug("TaskRegistry: replacing task " + name);
    }
    _tasks[name] = std::move(def);
}

void TaskRegistry::registerTask(const std::string& name,
                                TaskFn fn,
                                std::vector<std::string> dependencies,
                                std::optional<std::string> cadence,
                                std::string description)
{
    if (!fn) {
        throw std::invalid_argument("task " + name + " has no body");
    }
    registerTask(name,
                 std::make_shared<FunctionTaskBody>(std::move(fn)),
                 std::move(dependencies),
                 std::move(cadence),
                 std::move(description));
}

std::vector<std::string> TaskRegistry::list() const
{
    std::vector<std::string> names;
    names.reserve(_tasks.size());
    for (const auto& kv : _tasks) {
        names.push_back(kv.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool TaskRegistry::contains(const std::string& name) const
{
    return _tasks.find(name) != _tasks.end();
}

std::shared_ptr<const TaskDefinition> TaskRegistry::get(const std::string& name) const
{
    auto it = _tasks.find(name);
    if (it == _tasks.end()) {
        throw core::UnknownTaskError(name);
    }
    return it->second;
}

std::string TaskRegistry::run(const std::string& name)
{
    ExecutionSet executed;
    return run(name, executed);
}

std::string TaskRegistry::run(const std::string& name, ExecutionSet& executed)
{
    std::vector<std::string> resolving;
    return runResolving_(name, executed, resolving);
}

std::string TaskRegistry::runResolving_(const std::string& name,
                                        ExecutionSet& executed,
                                        std::vector<std::string>& resolving)
{
    // 1. 本次链路里已经成功执行过
    if (executed.count(name)) {
        return {};
    }

    // 2. 查找定义
    auto def = get(name);

    // 正在解析的祖先里又出现自己 -> 环
    auto it = std::find(resolving.begin(), resolving.end(), name);
    if (it != resolving.end()) {
        std::vector<std::string> cycle(it, resolving.end());
        cycle.push_back(name);
        throw core::CycleDetectedError(std::move(cycle));
    }

    // 3. 依赖按声明顺序、严格串行
    resolving.push_back(name);
    for (const auto& dep : def->dependencies) {
        runResolving_(dep, executed, resolving);
    }

    // 4-7. 执行本任务；失败直接抛出，不会加入 executed
    const std::string runId = execute_(*def, resolving);
    resolving.pop_back();

    // 8.
    executed.insert(name);
    return runId;
}

std::string TaskRegistry::execute_(const TaskDefinition& def, const std::vector<std::string>& chain)
{
    const std::string runId = utils::generate_run_id();
    const auto triggeredAt = std::chrono::system_clock::now();
    const auto start = std::chrono::steady_clock::now();

    _store.insertRunning(runId, def.name, triggeredAt);
    // 行已写入：从这里起任何退出路径都要落终态
    RunFinalizer finalizer(_store, runId, def.name, triggeredAt);

    core::emitEvent(def.name, runId, LogLevel::Info, "run started");

    core::TaskOutcome outcome = invokeBody_(def);

    std::optional<std::string> artifacts;
    if (outcome.ok() && outcome.artifacts && !outcome.artifacts->is_null()) {
        try {
            artifacts = outcome.artifacts->dump();
        } catch (const nlohmann::json::exception& ex) {
            outcome = core::TaskOutcome::failure(
                "task result is not serializable",
                std::string("json error: ") + ex.what());
        }
    }

    const core::RunStatus status = outcome.ok() ? core::RunStatus::Success : core::RunStatus::Failed;
    std::optional<std::string> error;
    if (!outcome.ok()) {
        error = formatError(def, chain, outcome);
        artifacts.reset();
    }

    finalizer.commit(status, artifacts, error);

    const long long durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    if (!outcome.ok()) {
        core::emitEvent(def.name, runId, LogLevel::Error, "run finished", durationMs,
                        {{"status", core::runStatusToString(status)}, {"error", outcome.message}});
        throw core::TaskFailedError(def.name, runId, outcome.message);
    }

    core::emitEvent(def.name, runId, LogLevel::Info, "run finished", durationMs,
                    {{"status", core::runStatusToString(status)}});
    return runId;
}

core::TaskOutcome TaskRegistry::invokeBody_(const TaskDefinition& def)
{
    // 任务体抛出的任何东西都转成 FAILED，不会越过 Registry
    try {
        return def.body->invoke();
    } catch (const std::exception& ex) {
        return core::TaskOutcome::failure(ex.what(), "exception: " + exceptionTypeName(ex));
    } catch (...) {
        return core::TaskOutcome::failure("unknown exception thrown by task body",
                                          "exception: <non-std exception>");
    }
}

} // namespace pipehub::runner
