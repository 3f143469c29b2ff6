#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pipehub::core {

/// 任务名未注册（直接请求或作为依赖被引用）
class UnknownTaskError : public std::runtime_error {
public:
    explicit UnknownTaskError(const std::string& name)
        : std::runtime_error("Unknown task: " + name), _name(name) {}

    const std::string& taskName() const { return _name; }

private:
    std::string _name;
};

/// A task body failed. Carries the run id of the FAILED record so callers
/// can report which run failed; dependency failures reach the top-level
/// caller with the dependency's own task name and run id.
class TaskFailedError : public std::runtime_error {
public:
    TaskFailedError(const std::string& name, const std::string& runId, const std::string& message)
        : std::runtime_error("Task " + name + " failed; run_id=" + runId + ": " + message),
          _name(name), _runId(runId), _message(message) {}

    const std::string& taskName() const { return _name; }
    const std::string& runId() const { return _runId; }
    const std::string& message() const { return _message; }

private:
    std::string _name;
    std::string _runId;
    std::string _message;
};

class CycleDetectedError : public std::runtime_error {
public:
    explicit CycleDetectedError(std::vector<std::string> path)
        : std::runtime_error("Dependency cycle detected: " + join(path)), _path(std::move(path)) {}

    // e.g. {"a", "b", "a"}
    const std::vector<std::string>& path() const { return _path; }

private:
    static std::string join(const std::vector<std::string>& path) {
        std::string out;
        for (const auto& p : path) {
            if (!out.empty()) out += " -> ";
            out += p;
        }
        return out;
    }

    std::vector<std::string> _path;
};

/// Run store / SQLite failure. Never swallowed: a run record must not be dropped silently.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace pipehub::core
