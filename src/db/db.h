#pragma once

#include <string>
#include <sqlite3.h>

namespace pipehub {

// 一个 SQLite 连接。由进程入口构造并持有，按引用传给 RunStore / DbMigrator。
// 打开失败、执行失败均抛 core::StoreError。
class Db {
public:
    Db() = default;
    ~Db();

    Db(const Db&) = delete;
    Db& operator=(const Db&) = delete;

    // path 由 Config 决定；":memory:" 用于测试
    void open(const std::string& path, int busyTimeoutMs = 60000);
    void close();
    bool isOpen() const { return m_db != nullptr; }

    // 执行无结果的 SQL（建表、事务控制等）
    void exec(const std::string& sql);

    sqlite3* handle() const { return m_db; }
    const std::string& path() const { return m_path; }

    std::string last_error() const;

private:
    sqlite3* m_db = nullptr;
    std::string m_path;
};

} // namespace pipehub
