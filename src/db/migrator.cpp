#include "migrator.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include "core/errors.h"
#include "log/logger.h"

namespace fs = std::filesystem;

namespace pipehub {

int DbMigrator::migrate(Db &db, const std::string &migrations_dir)
{
    ensure_registry(db);

    const auto done = applied(db);
    const std::set<std::string> appliedIds(done.begin(), done.end());

    int count = 0;
    for (const auto& file : list_migration_files(migrations_dir)) {
        const std::string id = fs::path(file).stem().string();
        if (appliedIds.count(id)) {
            continue;
        }
        if (apply_file(db, id, file)) {
            ++count;
        }
    }

    if (count > 0) {
        Logger::info("Applied " + std::to_string(count) + " migration(s) from " + migrations_dir);
    } else {
        Logger::debug("Schema up to date (" + std::to_string(appliedIds.size()) + " migrations)");
    }
    return count;
}

std::vector<std::string> DbMigrator::applied(Db &db)
{
    ensure_registry(db);

    std::vector<std::string> ids;
    const char* sql = "SELECT id FROM schema_migrations ORDER BY id;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db.handle(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw core::StoreError("schema_migrations query prepare failed: " + db.last_error());
    }
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const unsigned char* id = sqlite3_column_text(stmt, 0);
        ids.emplace_back(id ? reinterpret_cast<const char*>(id) : "");
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw core::StoreError("schema_migrations query failed: " + db.last_error());
    }
    return ids;
}

void DbMigrator::ensure_registry(Db &db)
{
    db.exec(
        "CREATE TABLE IF NOT EXISTS schema_migrations ("
        "id TEXT PRIMARY KEY,"
        "description TEXT,"
        "applied_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP"
        ");");
}

std::vector<std::string> DbMigrator::list_migration_files(const std::string &migrations_dir)
{
    std::error_code ec;
    if (!fs::is_directory(migrations_dir, ec)) {
        throw core::StoreError("migrations directory not found: " + migrations_dir +
                               ", cwd=" + fs::current_path(ec).string());
    }

    std::vector<std::string> files;
    for (const auto& entry : fs::directory_iterator(migrations_dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".sql") {
            files.push_back(entry.path().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

bool DbMigrator::is_applied(Db &db, const std::string &id)
{
    const char* sql = "SELECT 1 FROM schema_migrations WHERE id = ?;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db.handle(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw core::StoreError("schema_migrations lookup prepare failed: " + db.last_error());
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        throw core::StoreError("schema_migrations lookup failed: " + db.last_error());
    }
    return rc == SQLITE_ROW;
}

bool DbMigrator::apply_file(Db &db, const std::string &id, const std::string &filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw core::StoreError("cannot open migration file: " + filepath);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    const std::string sql = buffer.str();

    // 写锁拿到之后再确认一次：另一个进程可能刚刚执行完同一个迁移
    db.exec("BEGIN IMMEDIATE;");
    try {
        if (is_applied(db, id)) {
            db.exec("COMMIT;");
            Logger::debug("Migration " + id + " already applied by another connection");
            return false;
        }

        Logger::info("Applying migration " + id);
        db.exec(sql);

        const char* insertSql = "INSERT INTO schema_migrations (id, description) VALUES (?, ?);";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db.handle(), insertSql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw core::StoreError("schema_migrations insert prepare failed: " + db.last_error());
        }
        const std::string name = fs::path(filepath).filename().string();
        sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_TRANSIENT);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            throw core::StoreError("schema_migrations insert failed: " + db.last_error());
        }

        db.exec("COMMIT;");
        return true;
    } catch (const core::StoreError& ex) {
        Logger::error("Migration " + id + " failed: " + ex.what());
        sqlite3_exec(db.handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

} // namespace pipehub
