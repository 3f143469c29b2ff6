#include "command_task_body.h"
#include "core/utils.h"
#include "log/logger.h"

using json = nlohmann::json;

namespace pipehub::runner {

CommandTaskBody::CommandTaskBody(std::string taskName, std::string command)
    : _taskName(std::move(taskName)), _command(std::move(command))
{
}

core::TaskOutcome CommandTaskBody::invoke()
{
    if (_command.empty()) {
        return core::TaskOutcome::failure("no command configured for task " + _taskName);
    }

    Logger::debug("CommandTaskBody[" + _taskName + "] exec: " + _command);
    const utils::CommandResult res = utils::run_command(_command);

    if (res.exitCode != 0) {
        std::string detail = "command: " + _command;
        detail += "\nstdout:\n" + res.stdoutData;
        detail += "\nstderr:\n" + res.stderrData;
        return core::TaskOutcome::failure(
            "command exited with code " + std::to_string(res.exitCode), detail);
    }
    if (!res.stderrData.empty()) {
        Logger::warn("CommandTaskBody[" + _taskName + "] stderr: " + res.stderrData);
    }

    json payload = json::parse(res.stdoutData, nullptr, false);
    if (!payload.is_discarded() && (payload.is_object() || payload.is_array())) {
        return core::TaskOutcome::success(std::move(payload));
    }

    json j;
    j["exit_code"] = res.exitCode;
    j["stdout"] = res.stdoutData;
    return core::TaskOutcome::success(std::move(j));
}

} // namespace pipehub::runner
