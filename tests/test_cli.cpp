#include "test_support.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

#include "app/orchestrator_app.h"
#include "core/config.h"
#include "db/run_store.h"

using namespace pipehub;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

struct CliResult {
    int code{-1};
    std::string out;
};

// 每次调用都是一次全新的进程启动：配置、日志 sink 都从头来
CliResult runCli(std::vector<std::string> args) {
    args.insert(args.begin(), "pipehub");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    Config::instance().reset();

    std::ostringstream captured;
    std::streambuf* old = std::cout.rdbuf(captured.rdbuf());
    CliResult res;
    try {
        OrchestratorApp app;
        res.code = app.run(static_cast<int>(args.size()), argv.data());
    } catch (...) {
        std::cout.rdbuf(old);
        core::LogManager::instance().clearSinks();
        throw;
    }
    std::cout.rdbuf(old);
    core::LogManager::instance().clearSinks();
    res.out = captured.str();
    return res;
}

struct Workspace {
    fs::path dir;
    std::string config;
    std::string db;

    Workspace() {
        dir = test::tempPath("pipehub_cli");
        fs::create_directories(dir);
        db = (dir / "runs.db").string();
        config = (dir / "config.json").string();

        json cfg;
        cfg["database"]["path"] = db;
        cfg["database"]["migrations_dir"] = PIPEHUB_TEST_MIGRATIONS_DIR;
        cfg["log"]["level"] = "warn";
        cfg["pipeline"]["commands"]["build_ticker_universe"] = R"(echo '{"tickers": 3}')";
        cfg["pipeline"]["commands"]["ingest_market_daily"] = "echo 'vendor down' >&2; exit 5";
        cfg["pipeline"]["commands"]["ingest_news_hourly"] = "true";
        std::ofstream(config) << cfg.dump(2);
    }

    ~Workspace() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

} // namespace

static void test_run_success_prints_run_id() {
    Workspace ws;
    auto res = runCli({"--config", ws.config, "run", "build_ticker_universe"});
    assert(res.code == kExitOk);

    auto out = json::parse(res.out);
    assert(out["task"] == "build_ticker_universe");
    const std::string runId = out["run_id"];
    assert(runId.size() == 32);

    Db db;
    db.open(ws.db);
    RunStore store(db);
    auto rec = store.get(runId);
    assert(rec.has_value());
    assert(rec->status == core::RunStatus::Success);
    assert(json::parse(rec->artifacts.value())["tickers"] == 3);
    std::cout << "[OK] run success\n";
}

static void test_dependency_failure_reports_failed_run() {
    Workspace ws;
    auto res = runCli({"--config", ws.config, "run", "build_features_daily"});
    assert(res.code == kExitTaskFailure);

    auto out = json::parse(res.out);
    assert(out["task"] == "build_features_daily");
    assert(out["status"] == "FAILED");
    assert(out["failed_task"] == "ingest_market_daily");
    assert(out["error"] == "command exited with code 5");

    // run_id 指向失败的依赖那一行
    auto shown = runCli({"--config", ws.config, "show-run", out["run_id"].get<std::string>()});
    assert(shown.code == kExitOk);
    auto rec = json::parse(shown.out);
    assert(rec["task_name"] == "ingest_market_daily");
    assert(rec["status"] == "FAILED");
    assert(rec["error"].get<std::string>().find("vendor down") != std::string::npos);

    // 下游任务没有落行
    Db db;
    db.open(ws.db);
    RunStore store(db);
    assert(store.listRecent(0, "build_features_daily").empty());
    assert(store.listRecent(0, "build_ticker_universe").size() == 1);
    std::cout << "[OK] dependency failure\n";
}

static void test_unknown_task_and_run() {
    Workspace ws;
    auto res = runCli({"--config", ws.config, "run", "nope"});
    assert(res.code == kExitTaskFailure);
    assert(res.out.empty());

    res = runCli({"--config", ws.config, "show", "nope"});
    assert(res.code == kExitTaskFailure);

    res = runCli({"--config", ws.config, "show-run", "0123456789abcdef0123456789abcdef"});
    assert(res.code == kExitTaskFailure);
    std::cout << "[OK] unknown task / run\n";
}

static void test_usage_errors() {
    assert(runCli({}).code == kExitUsage);
    assert(runCli({"frobnicate"}).code == kExitUsage);
    assert(runCli({"--bogus", "list"}).code == kExitUsage);
    assert(runCli({"run"}).code == kExitUsage);
    assert(runCli({"--limit", "many", "runs"}).code == kExitUsage);
    assert(runCli({"--help"}).code == kExitOk);
    std::cout << "[OK] usage errors\n";
}

static void test_config_errors() {
    Workspace ws;
    assert(runCli({"--config", (ws.dir / "missing.json").string(), "list"}).code == kExitStore);

    const std::string broken = (ws.dir / "broken.json").string();
    std::ofstream(broken) << "{ \"database\": ";
    assert(runCli({"--config", broken, "list"}).code == kExitStore);
    std::cout << "[OK] config errors\n";
}

static void test_runs_lists_newest_first() {
    Workspace ws;
    auto first = json::parse(runCli({"--config", ws.config, "run", "build_ticker_universe"}).out);
    auto second = json::parse(runCli({"--config", ws.config, "run", "build_ticker_universe"}).out);

    auto res = runCli({"--config", ws.config, "--limit", "1", "runs"});
    assert(res.code == kExitOk);
    auto arr = json::parse(res.out);
    assert(arr.size() == 1);
    assert(arr[0]["run_id"] == second["run_id"]);
    assert(arr[0]["run_id"] != first["run_id"]);
    std::cout << "[OK] runs listing\n";
}

int main() {
    test_run_success_prints_run_id();
    test_dependency_failure_reports_failed_run();
    test_unknown_task_and_run();
    test_usage_errors();
    test_config_errors();
    test_runs_lists_newest_first();
    std::cout << "\nALL cli tests passed\n";
    return 0;
}
