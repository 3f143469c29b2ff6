#pragma once
#include <memory>
#include <string>
#include <vector>

#include "db/db.h"
#include "db/run_store.h"
#include "runner/task_registry.h"

namespace pipehub {

constexpr const char* PIPEHUB_VERSION = "0.1.0";

// 退出码
enum ExitCode : int {
    kExitOk          = 0,
    kExitTaskFailure = 1, // 任务失败 / 未知任务 / 依赖环 / run 不存在
    kExitUsage       = 2,
    kExitStore       = 3, // 数据库或配置错误
};

class OrchestratorApp {
public:
    OrchestratorApp();
    ~OrchestratorApp();

    // 程序主入口，返回进程退出码
    int run(int argc, char** argv);

    static void printUsage(const char* progName);

private:
    struct Options {
        std::string command;
        std::vector<std::string> args;
        std::string configPath;
        std::string taskFilter;
        int limit = 10;
    };

    bool parse_args(int argc, char** argv, Options& opt);

    void init_config(const std::string& explicitPath);
    void init_logger();
    void init_db();
    void init_registry();

    int cmd_list();
    int cmd_show(const std::string& name);
    int cmd_run(const std::string& name);
    int cmd_runs(int limit, const std::string& taskFilter);
    int cmd_show_run(const std::string& runId);
    int cmd_migrate();

private:
    // 由入口持有并按引用注入：Db -> RunStore -> TaskRegistry
    std::unique_ptr<Db> m_db;
    std::unique_ptr<RunStore> m_store;
    std::unique_ptr<runner::TaskRegistry> m_registry;
};

} // namespace pipehub
