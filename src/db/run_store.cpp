#include "run_store.h"
#include <stdexcept>
#include "core/errors.h"
#include "core/utils.h"
#include "log/logger.h"

using json = nlohmann::json;

namespace pipehub {

namespace {

const char* kSelectColumns =
    "SELECT run_id, task_name, status, triggered_at, completed_at, artifacts, error FROM task_runs";

std::optional<std::string> columnText(sqlite3_stmt* stmt, int col)
{
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    const unsigned char* p = sqlite3_column_text(stmt, col);
    return std::string(p ? reinterpret_cast<const char*>(p) : "");
}

RunRecord readRow(sqlite3_stmt* stmt)
{
    RunRecord r;
    r.runId    = columnText(stmt, 0).value_or("");
    r.taskName = columnText(stmt, 1).value_or("");
    const std::string status = columnText(stmt, 2).value_or("");
    r.status = core::runStatusFromString(status).value_or(core::RunStatus::Failed);
    r.triggeredAt = utils::fromEpochMs(sqlite3_column_int64(stmt, 3));
    if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
        r.completedAt = utils::fromEpochMs(sqlite3_column_int64(stmt, 4));
    }
    r.artifacts = columnText(stmt, 5);
    r.error     = columnText(stmt, 6);
    return r;
}

void bindOptionalText(sqlite3_stmt* stmt, int idx, const std::optional<std::string>& v)
{
    if (v) sqlite3_bind_text(stmt, idx, v->c_str(), -1, SQLITE_TRANSIENT);
    else sqlite3_bind_null(stmt, idx);
}

} // namespace

RunStore::RunStore(Db& db) : _db(db) {}

void RunStore::insertRunning(const std::string& runId, const std::string& taskName, TimePoint triggeredAt)
{
    std::lock_guard<std::mutex> lk(_mu);

    sqlite3* db = _db.handle();
    if (!db) {
        throw core::StoreError("insertRunning failed: DB handle is null");
    }

    const char* sql =
        "INSERT INTO task_runs (run_id, task_name, status, triggered_at) VALUES (?,?,?,?);";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw core::StoreError("task_runs insert prepare failed: " + _db.last_error());
    }

    const std::string status = core::runStatusToString(core::RunStatus::Running);
    sqlite3_bind_text(stmt, 1, runId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, taskName.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, status.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(utils::toEpochMs(triggeredAt)));

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw core::StoreError("task_runs insert failed (run_id=" + runId + "): " + _db.last_error());
    }
}

void RunStore::finalize(const std::string& runId,
                        core::RunStatus status,
                        TimePoint completedAt,
                        const std::optional<std::string>& artifacts,
                        const std::optional<std::string>& error)
{
    if (!core::isTerminal(status)) {
        throw std::invalid_argument("finalize requires a terminal status, got RUNNING");
    }

    std::lock_guard<std::mutex> lk(_mu);

    sqlite3* db = _db.handle();
    if (!db) {
        throw core::StoreError("finalize failed: DB handle is null");
    }

    // 只允许从 RUNNING 迁移一次
    const char* sql =
        "UPDATE task_runs SET status=?, completed_at=?, artifacts=?, error=? "
        "WHERE run_id=? AND status='RUNNING';";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw core::StoreError("task_runs finalize prepare failed: " + _db.last_error());
    }

    const std::string statusStr = core::runStatusToString(status);
    sqlite3_bind_text(stmt, 1, statusStr.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(utils::toEpochMs(completedAt)));
    bindOptionalText(stmt, 3, artifacts);
    bindOptionalText(stmt, 4, error);
    sqlite3_bind_text(stmt, 5, runId.c_str(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(stmt);
    const int changed = rc == SQLITE_DONE ? sqlite3_changes(db) : 0;
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw core::StoreError("task_runs finalize failed (run_id=" + runId + "): " + _db.last_error());
    }
    if (changed > 0) {
        return;
    }

    // 没有更新到：要么 run_id 不存在，要么已经是终态
    auto existing = fetchOne_(runId);
    if (!existing) {
        throw core::StoreError("finalize failed: unknown run_id " + runId);
    }
    if (existing->status == status) {
        Logger::debug("finalize ignored, run " + runId + " already " + statusStr);
        return;
    }
    throw core::StoreError("finalize failed: run " + runId + " already finalized as " +
                           core::runStatusToString(existing->status));
}

std::optional<RunRecord> RunStore::get(const std::string& runId) const
{
    std::lock_guard<std::mutex> lk(_mu);
    return fetchOne_(runId);
}

std::optional<RunRecord> RunStore::fetchOne_(const std::string& runId) const
{
    sqlite3* db = _db.handle();
    if (!db) {
        throw core::StoreError("task_runs get failed: DB handle is null");
    }

    const std::string sql = std::string(kSelectColumns) + " WHERE run_id=?;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw core::StoreError("task_runs get prepare failed: " + _db.last_error());
    }
    sqlite3_bind_text(stmt, 1, runId.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<RunRecord> result;
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        result = readRow(stmt);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        throw core::StoreError("task_runs get failed: " + _db.last_error());
    }
    return result;
}

std::vector<RunRecord> RunStore::listRecent(int limit, const std::string& taskName) const
{
    std::lock_guard<std::mutex> lk(_mu);

    sqlite3* db = _db.handle();
    if (!db) {
        throw core::StoreError("task_runs query failed: DB handle is null");
    }

    std::string sql = kSelectColumns;
    if (!taskName.empty()) {
        sql += " WHERE task_name = ?";
    }
    // 同一毫秒内按插入顺序
    sql += " ORDER BY triggered_at DESC, rowid DESC";
    if (limit > 0) {
        sql += " LIMIT " + std::to_string(limit);
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw core::StoreError("task_runs query prepare failed: " + _db.last_error());
    }
    if (!taskName.empty()) {
        sqlite3_bind_text(stmt, 1, taskName.c_str(), -1, SQLITE_TRANSIENT);
    }

    std::vector<RunRecord> rows;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        rows.push_back(readRow(stmt));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw core::StoreError("task_runs query failed: " + _db.last_error());
    }
    return rows;
}

json runRecordToJson(const RunRecord& r)
{
    json j;
    j["run_id"]       = r.runId;
    j["task_name"]    = r.taskName;
    j["status"]       = core::runStatusToString(r.status);
    j["triggered_at"] = utils::formatTimestampMs(r.triggeredAt);
    j["completed_at"] = r.completedAt ? json(utils::formatTimestampMs(*r.completedAt)) : json(nullptr);

    // artifacts 按 JSON 还原；万一不是合法 JSON 就原样给字符串
    if (r.artifacts) {
        json a = json::parse(*r.artifacts, nullptr, false);
        j["artifacts"] = a.is_discarded() ? json(*r.artifacts) : a;
    } else {
        j["artifacts"] = nullptr;
    }
    j["error"] = r.error ? json(*r.error) : json(nullptr);
    return j;
}

} // namespace pipehub
