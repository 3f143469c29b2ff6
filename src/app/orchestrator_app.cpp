#include "orchestrator_app.h"
#include <cstdlib>
#include <iostream>
#include <nlohmann/json.hpp>

#include "core/config.h"
#include "core/errors.h"
#include "db/migrator.h"
#include "log/logger.h"
#include "log/log_manager.h"
#include "log/log_sink_console.h"
#include "log/log_sink_file.h"
#include "tasks/pipeline_tasks.h"

using json = nlohmann::json;

namespace pipehub {

OrchestratorApp::OrchestratorApp() = default;

// 析构顺序：registry -> store -> db
OrchestratorApp::~OrchestratorApp() {
    m_registry.reset();
    m_store.reset();
    m_db.reset();
}

void OrchestratorApp::printUsage(const char* progName) {
    std::cout << "pipehub pipeline orchestrator v" << PIPEHUB_VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options] <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  list                 List registered tasks with descriptions\n";
    std::cout << "  show <task>          Show one task definition\n";
    std::cout << "  run <task>           Run a task and its dependencies\n";
    std::cout << "  runs                 List recent runs (newest first)\n";
    std::cout << "  show-run <run_id>    Show one run record\n";
    std::cout << "  migrate              Apply pending database migrations\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>      Config file (default: search /etc/pipehub, ./config.json)\n";
    std::cout << "  --limit <n>          Number of runs for 'runs' (default 10)\n";
    std::cout << "  --task <name>        Filter 'runs' by task name\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "  -v, --version        Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  PIPEHUB_CONFIG       Config file path\n";
    std::cout << "  PIPEHUB_DB           SQLite database path\n";
    std::cout << "  PIPEHUB_MIGRATIONS   Migrations directory\n";
    std::cout << "  PIPEHUB_LOG          Log file path (empty = console only)\n";
    std::cout << "  PIPEHUB_LOG_LEVEL    Log level (debug, info, warn, error)\n";
}

bool OrchestratorApp::parse_args(int argc, char** argv, Options& opt) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            opt.command = "help";
            return true;
        }
        if (arg == "-v" || arg == "--version") {
            opt.command = "version";
            return true;
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](const std::string& flag) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << flag << " requires a value\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--config") {
            const char* v = needValue(arg);
            if (!v) return false;
            opt.configPath = v;
        } else if (arg == "--limit") {
            const char* v = needValue(arg);
            if (!v) return false;
            try {
                opt.limit = std::stoi(v);
            } catch (const std::exception&) {
                std::cerr << "Error: --limit expects a number, got '" << v << "'\n";
                return false;
            }
        } else if (arg == "--task") {
            const char* v = needValue(arg);
            if (!v) return false;
            opt.taskFilter = v;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << "\n";
            return false;
        } else if (opt.command.empty()) {
            opt.command = arg;
        } else {
            opt.args.push_back(arg);
        }
    }
    return true;
}

int OrchestratorApp::run(int argc, char** argv) {
    Options opt;
    if (!parse_args(argc, argv, opt)) {
        printUsage(argv[0]);
        return kExitUsage;
    }
    if (opt.command.empty() || opt.command == "help") {
        printUsage(argv[0]);
        return opt.command.empty() ? kExitUsage : kExitOk;
    }
    if (opt.command == "version") {
        std::cout << PIPEHUB_VERSION << "\n";
        return kExitOk;
    }

    const bool needsArg = opt.command == "show" || opt.command == "run" || opt.command == "show-run";
    const bool known = needsArg || opt.command == "list" || opt.command == "runs" || opt.command == "migrate";
    if (!known) {
        std::cerr << "Error: unknown command '" << opt.command << "'\n";
        printUsage(argv[0]);
        return kExitUsage;
    }
    if (needsArg && opt.args.size() != 1) {
        std::cerr << "Error: '" << opt.command << "' takes exactly one argument\n";
        return kExitUsage;
    }

    try {
        // 1. 加载配置
        init_config(opt.configPath);

        // 2. 初始化日志系统
        init_logger();

        // 3. 打开数据库并迁移
        init_db();

        if (opt.command == "migrate") return cmd_migrate();
        if (opt.command == "runs")     return cmd_runs(opt.limit, opt.taskFilter);
        if (opt.command == "show-run") return cmd_show_run(opt.args[0]);

        // 4. 构建任务注册表（每次进程启动重新构建）
        init_registry();

        if (opt.command == "list") return cmd_list();
        if (opt.command == "show") return cmd_show(opt.args[0]);
        return cmd_run(opt.args[0]);
    } catch (const core::ConfigError& ex) {
        std::cerr << "Config error: " << ex.what() << "\n";
        return kExitStore;
    } catch (const core::StoreError& ex) {
        Logger::error(std::string("Run store failure: ") + ex.what());
        std::cerr << "Store error: " << ex.what() << "\n";
        return kExitStore;
    }
}

void OrchestratorApp::init_config(const std::string& explicitPath) {
    auto& cfg = Config::instance();

    std::string path = explicitPath;
    if (path.empty()) {
        if (const char* p = std::getenv("PIPEHUB_CONFIG")) path = p;
    }

    if (!path.empty()) {
        // 显式指定的配置文件必须存在
        if (!cfg.load(path)) {
            throw core::ConfigError("Config file not found: " + path);
        }
    } else {
        // 优先生产环境配置，其次当前目录，再次源码默认配置
        bool loaded = cfg.load("/etc/pipehub/config.json");
        if (!loaded) loaded = cfg.load("config.json");
        if (!loaded) loaded = cfg.load("config/default_config.json");
        if (!loaded) {
            Logger::debug("No config file found in fallback paths, using built-in defaults");
        }
    }

    // 环境变量覆盖
    cfg.load_from_env();
}

void OrchestratorApp::init_logger() {
    auto& cfg = Config::instance();

    core::LogManager::instance().setMinLevel(parseLogLevel(cfg.log_level()));

    std::vector<std::shared_ptr<core::ILogSink>> sinks;
    sinks.push_back(std::make_shared<core::ConsoleLogSink>());

    const std::string logPath = cfg.log_path();
    if (!logPath.empty()) {
        core::FileLogSink::Options fopt;
        fopt.path = logPath;
        fopt.rotateBytes = static_cast<std::uint64_t>(cfg.get<long long>("log.rotate_bytes", 10 * 1024 * 1024));
        fopt.maxFiles = cfg.get<int>("log.max_files", 5);
        sinks.push_back(std::make_shared<core::FileLogSink>(fopt));
    }
    core::LogManager::instance().setSinks(std::move(sinks));

    Logger::debug(std::string("Logger initialized") + (logPath.empty() ? " (console-only)" : (" (file=" + logPath + ")")));
}

void OrchestratorApp::init_db() {
    auto& cfg = Config::instance();

    m_db = std::make_unique<Db>();
    m_db->open(cfg.db_path(), cfg.busy_timeout_ms());
    DbMigrator::migrate(*m_db, cfg.migrations_dir());
    m_store = std::make_unique<RunStore>(*m_db);
}

void OrchestratorApp::init_registry() {
    m_registry = std::make_unique<runner::TaskRegistry>(*m_store);
    tasks::registerPipelineTasks(*m_registry, Config::instance());
}

int OrchestratorApp::cmd_list() {
    for (const auto& name : m_registry->list()) {
        const auto def = m_registry->get(name);
        std::cout << name << ": " << def->description << "\n";
    }
    return kExitOk;
}

int OrchestratorApp::cmd_show(const std::string& name) {
    try {
        const auto def = m_registry->get(name);
        std::cout << runner::taskDefinitionToJson(*def).dump(2) << "\n";
        return kExitOk;
    } catch (const core::UnknownTaskError& ex) {
        std::cerr << ex.what() << "\n";
        return kExitTaskFailure;
    }
}

int OrchestratorApp::cmd_run(const std::string& name) {
    try {
        const std::string runId = m_registry->run(name);
        json out;
        out["task"] = name;
        out["run_id"] = runId;
        std::cout << out.dump() << "\n";
        return kExitOk;
    } catch (const core::TaskFailedError& ex) {
        json out;
        out["task"] = name;
        out["status"] = "FAILED";
        out["failed_task"] = ex.taskName();
        out["run_id"] = ex.runId();
        out["error"] = ex.message();
        std::cout << out.dump() << "\n";
        std::cerr << ex.what() << "\n";
        return kExitTaskFailure;
    } catch (const core::UnknownTaskError& ex) {
        std::cerr << ex.what() << "\n";
        return kExitTaskFailure;
    } catch (const core::CycleDetectedError& ex) {
        std::cerr << ex.what() << "\n";
        return kExitTaskFailure;
    }
}

int OrchestratorApp::cmd_runs(int limit, const std::string& taskFilter) {
    json arr = json::array();
    for (const auto& r : m_store->listRecent(limit, taskFilter)) {
        arr.push_back(runRecordToJson(r));
    }
    std::cout << arr.dump(2) << "\n";
    return kExitOk;
}

int OrchestratorApp::cmd_show_run(const std::string& runId) {
    auto r = m_store->get(runId);
    if (!r) {
        std::cerr << "Run not found: " << runId << "\n";
        return kExitTaskFailure;
    }
    std::cout << runRecordToJson(*r).dump(2) << "\n";
    return kExitOk;
}

int OrchestratorApp::cmd_migrate() {
    json out;
    out["database"] = m_db->path();
    out["migrations"] = DbMigrator::applied(*m_db);
    std::cout << out.dump(2) << "\n";
    return kExitOk;
}

} // namespace pipehub
