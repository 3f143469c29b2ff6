#include "db.h"
#include <filesystem>
#include <mutex>
#include "core/errors.h"
#include "log/logger.h"

namespace {
// Ensure SQLite is configured for serialized mode exactly once before any open.
std::once_flag g_sqlite_config_once;
}

namespace pipehub {

void Db::open(const std::string &path, int busyTimeoutMs)
{
    std::call_once(g_sqlite_config_once, [] {
        sqlite3_config(SQLITE_CONFIG_SERIALIZED);
    });
    if (m_db) {
        return; // 已经打开
    }

    if (path != ":memory:") {
        namespace fs = std::filesystem;
        std::error_code ec;
        const fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
        }
    }

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK) {
        const std::string msg = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
        sqlite3_close(m_db);
        m_db = nullptr;
        throw core::StoreError("Failed to open DB " + path + ": " + msg);
    }
    m_path = path;

    // 多进程同时写 task_runs：WAL + busy timeout 由 SQLite 负责串行化
    sqlite3_busy_timeout(m_db, busyTimeoutMs);
    try {
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
        exec("PRAGMA foreign_keys=ON;");
    } catch (...) {
        close();
        throw;
    }

    Logger::debug("DB opened at " + path +
                  ", threadsafe=" + std::to_string(sqlite3_threadsafe()) +
                  " (FULLMUTEX, WAL)");
}

void Db::close()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
        Logger::debug("DB closed: " + m_path);
    }
}

void Db::exec(const std::string &sql)
{
    if (!m_db) {
        throw core::StoreError("DB exec failed: DB handle is null");
    }
    char* errmsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string msg = errmsg ? errmsg : sqlite3_errstr(rc);
        if (errmsg) sqlite3_free(errmsg);
        throw core::StoreError("DB exec error: " + msg + " SQL: " + sql);
    }
}

std::string Db::last_error() const
{
    if (!m_db) return {};
    return sqlite3_errmsg(m_db);
}

Db::~Db()
{
    close();
}

} // namespace pipehub
