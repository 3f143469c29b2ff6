#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "db.h"
#include "runner/task_common.h"

namespace pipehub {

using TimePoint = std::chrono::system_clock::time_point;

struct RunRecord {
    std::string runId;
    std::string taskName;
    core::RunStatus status{core::RunStatus::Running};
    TimePoint triggeredAt;
    std::optional<TimePoint> completedAt;
    std::optional<std::string> artifacts; // JSON text
    std::optional<std::string> error;
};

// task_runs 表的读写。Registry 是唯一的写入方，dashboard 之类只读。
// 所有失败抛 core::StoreError。
class RunStore {
public:
    explicit RunStore(Db& db);

    void insertRunning(const std::string& runId, const std::string& taskName, TimePoint triggeredAt);

    // RUNNING -> status。同一终态重复调用是 no-op；终态之间改写、未知 run_id 抛 StoreError
    void finalize(const std::string& runId,
                  core::RunStatus status,
                  TimePoint completedAt,
                  const std::optional<std::string>& artifacts,
                  const std::optional<std::string>& error);

    std::optional<RunRecord> get(const std::string& runId) const;

    // 最新的在前；limit <= 0 不限；taskName 为空不过滤
    std::vector<RunRecord> listRecent(int limit, const std::string& taskName = "") const;

private:
    std::optional<RunRecord> fetchOne_(const std::string& runId) const;

    Db& _db;
    mutable std::mutex _mu;
};

nlohmann::json runRecordToJson(const RunRecord& r);

} // namespace pipehub
