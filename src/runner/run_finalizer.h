#pragma once

#include <optional>
#include <string>
#include "db/run_store.h"

namespace pipehub::runner {

/// Owns one RUNNING row of task_runs. commit() writes the terminal state;
/// if the scope is left without a successful commit (exception, early exit)
/// the destructor finalizes the row as FAILED so it is never left RUNNING.
class RunFinalizer {
public:
    RunFinalizer(RunStore& store, std::string runId, std::string taskName, TimePoint triggeredAt);
    ~RunFinalizer();

    RunFinalizer(const RunFinalizer&) = delete;
    RunFinalizer& operator=(const RunFinalizer&) = delete;

    // 抛 core::StoreError
    void commit(core::RunStatus status,
                const std::optional<std::string>& artifacts,
                const std::optional<std::string>& error);

    bool committed() const { return _committed; }

    // completed_at，不早于 triggered_at
    TimePoint completedAt() const;

private:
    RunStore& _store;
    std::string _runId;
    std::string _taskName;
    TimePoint _triggeredAt;
    bool _committed{false};
    std::string _commitError;
};

} // namespace pipehub::runner
