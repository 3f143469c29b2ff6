#pragma once

#include <string>
#include "runner/task_body.h"

namespace pipehub::runner {

/// 通过 shell 执行外部命令的任务体：
/// - exit code != 0 -> 失败，detail 带上命令与输出
/// - stdout 是 JSON 对象/数组 -> 作为产物
/// - 否则产物为 {"exit_code": 0, "stdout": "..."}
class CommandTaskBody : public ITaskBody {
public:
    CommandTaskBody(std::string taskName, std::string command);

    core::TaskOutcome invoke() override;

    const std::string& command() const { return _command; }

private:
    std::string _taskName;
    std::string _command;
};

} // namespace pipehub::runner
