#include "run_finalizer.h"
#include <algorithm>
#include "core/errors.h"
#include "log/logger.h"

namespace pipehub::runner {

RunFinalizer::RunFinalizer(RunStore& store, std::string runId, std::string taskName, TimePoint triggeredAt)
    : _store(store),
      _runId(std::move(runId)),
      _taskName(std::move(taskName)),
      _triggeredAt(triggeredAt)
{
}

TimePoint RunFinalizer::completedAt() const
{
    // 系统时钟回拨时也保证 completed_at >= triggered_at
    return std::max(std::chrono::system_clock::now(), _triggeredAt);
}

void RunFinalizer::commit(core::RunStatus status,
                          const std::optional<std::string>& artifacts,
                          const std::optional<std::string>& error)
{
    try {
        _store.finalize(_runId, status, completedAt(), artifacts, error);
    } catch (const core::StoreError& ex) {
        _commitError = ex.what();
        throw;
    }
    _committed = true;
}

RunFinalizer::~RunFinalizer()
{
    if (_committed) return;

    std::string reason = "run aborted before completion";
    if (!_commitError.empty()) {
        reason += " (finalize failed: " + _commitError + ")";
    }
    try {
        _store.finalize(_runId, core::RunStatus::Failed, completedAt(), std::nullopt, reason);
        Logger::warn("Run " + _runId + " of task " + _taskName + " finalized as FAILED on scope exit: " + reason);
    } catch (const std::exception& ex) {
        // 析构里不能再抛：记录下来，这一行会停在 RUNNING
        Logger::error("Run " + _runId + " of task " + _taskName + " could not be finalized: " + ex.what());
    }
}

} // namespace pipehub::runner
