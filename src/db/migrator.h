#pragma once

#include <string>
#include <vector>
#include "db.h"

namespace pipehub {

// 迁移：migrations 目录下的 *.sql 按文件名顺序执行，
// 已执行过的记录在 schema_migrations(id = 文件名去掉扩展名)。
class DbMigrator {
public:
    // 入口：启动时调用，返回本次执行的迁移个数。失败抛 core::StoreError
    static int migrate(Db& db, const std::string& migrations_dir);

    static std::vector<std::string> applied(Db& db);

private:
    static void ensure_registry(Db& db);
    static std::vector<std::string> list_migration_files(const std::string& migrations_dir);
    static bool is_applied(Db& db, const std::string& id);
    // 在 BEGIN IMMEDIATE 内执行；已被其他连接执行过时返回 false
    static bool apply_file(Db& db, const std::string& id, const std::string& filepath);
};

} // namespace pipehub
