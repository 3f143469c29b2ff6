#include "test_support.h"

#include <iostream>
#include <memory>
#include <set>

#include "core/config.h"
#include "core/errors.h"
#include "db/run_store.h"
#include "runner/command_task_body.h"
#include "runner/task_registry.h"
#include "tasks/pipeline_tasks.h"

using namespace pipehub;
using runner::CommandTaskBody;

static void test_json_stdout_becomes_artifacts() {
    CommandTaskBody body("ingest", R"(echo '{"rows": 3, "source": "stub"}')");
    auto out = body.invoke();
    assert(out.ok());
    assert(out.artifacts.has_value());
    assert((*out.artifacts)["rows"] == 3);
    assert((*out.artifacts)["source"] == "stub");
    std::cout << "[OK] json stdout\n";
}

static void test_plain_stdout_is_wrapped() {
    CommandTaskBody body("ingest", "echo hello");
    assert(body.command() == "echo hello");
    auto out = body.invoke();
    assert(out.ok());
    assert((*out.artifacts)["exit_code"] == 0);
    assert((*out.artifacts)["stdout"] == "hello\n");

    // 标量 JSON 也按文本处理
    CommandTaskBody scalar("ingest", "echo 42");
    auto s = scalar.invoke();
    assert((*s.artifacts)["stdout"] == "42\n");
    std::cout << "[OK] plain stdout\n";
}

static void test_non_zero_exit_fails() {
    CommandTaskBody body("ingest", "echo partial; exit 3");
    auto out = body.invoke();
    assert(!out.ok());
    assert(out.message == "command exited with code 3");
    assert(out.detail.find("echo partial; exit 3") != std::string::npos);
    assert(out.detail.find("partial") != std::string::npos);
    std::cout << "[OK] non-zero exit\n";
}

static void test_stderr_reaches_run_error() {
    CommandTaskBody body("ingest_market_daily", "echo 'provider timeout: yahoo 503' >&2; exit 4");
    auto out = body.invoke();
    assert(!out.ok());
    assert(out.message == "command exited with code 4");
    assert(out.detail.find("provider timeout: yahoo 503") != std::string::npos);

    Db db;
    test::openMigrated(db);
    RunStore store(db);
    runner::TaskRegistry registry(store);
    registry.registerTask("ingest_market_daily",
                          std::make_shared<CommandTaskBody>(
                              "ingest_market_daily", "echo rows=0; echo 'provider timeout: yahoo 503' >&2; exit 4"));

    try {
        registry.run("ingest_market_daily");
        assert(false && "expected TaskFailedError");
    } catch (const core::TaskFailedError& ex) {
        auto r = store.get(ex.runId());
        assert(r->status == core::RunStatus::Failed);
        const std::string err = r->error.value();
        assert(err.rfind("command exited with code 4", 0) == 0);
        assert(err.find("stderr:\nprovider timeout: yahoo 503") != std::string::npos);
        assert(err.find("stdout:\nrows=0") != std::string::npos);
    }

    // 成功的命令只把 stdout 当产物
    CommandTaskBody noisy("t", "echo warning >&2; echo '{\"n\": 1}'");
    auto ok = noisy.invoke();
    assert(ok.ok());
    assert((*ok.artifacts)["n"] == 1);
    std::cout << "[OK] stderr captured\n";
}

static void test_missing_command_fails() {
    CommandTaskBody body("feedback_daily", "");
    auto out = body.invoke();
    assert(!out.ok());
    assert(out.message == "no command configured for task feedback_daily");
    std::cout << "[OK] missing command\n";
}

static void test_pipeline_catalogue_shape() {
    const auto& specs = tasks::pipelineTaskSpecs();
    assert(specs.size() == 8);

    std::set<std::string> seen;
    for (const auto& s : specs) {
        // 依赖都在前面声明过，且都在目录里
        for (const auto& d : s.dependencies) assert(seen.count(d));
        assert(s.cadence.has_value());
        assert(!s.description.empty());
        seen.insert(s.name);
    }
    assert(specs.front().name == "build_ticker_universe");
    assert(specs.back().name == "trading_cycle_intraday");
    std::cout << "[OK] pipeline catalogue\n";
}

static void test_full_pipeline_run() {
    auto& cfg = Config::instance();
    cfg.reset();
    for (const auto& s : tasks::pipelineTaskSpecs()) {
        cfg.set("pipeline.commands." + s.name, R"(echo '{"ok": true}')");
    }

    Db db;
    test::openMigrated(db);
    RunStore store(db);
    runner::TaskRegistry registry(store);
    tasks::registerPipelineTasks(registry, cfg);

    assert(registry.list().size() == 8);
    auto def = registry.get("build_features_daily");
    assert((def->dependencies == std::vector<std::string>{"ingest_market_daily", "ingest_news_hourly"}));
    assert(def->cadence.value() == "daily");
    assert(registry.get("ingest_news_hourly")->cadence.value() == "hourly");

    const std::string runId = registry.run("trading_cycle_intraday");
    assert(store.get(runId)->taskName == "trading_cycle_intraday");

    auto runs = store.listRecent(0);
    assert(runs.size() == 8);
    for (const auto& r : runs) {
        assert(r.status == core::RunStatus::Success);
        assert(nlohmann::json::parse(r.artifacts.value())["ok"] == true);
    }
    // 最新的是目标任务，最早的是 universe
    assert(runs.front().taskName == "trading_cycle_intraday");
    assert(runs.back().taskName == "build_ticker_universe");

    cfg.reset();
    std::cout << "[OK] full pipeline\n";
}

static void test_unconfigured_task_fails_its_chain() {
    auto& cfg = Config::instance();
    cfg.reset();
    cfg.set("pipeline.commands.build_ticker_universe", "echo '[]'");
    // ingest_market_daily 没有配置命令

    Db db;
    test::openMigrated(db);
    RunStore store(db);
    runner::TaskRegistry registry(store);
    tasks::registerPipelineTasks(registry, cfg);

    try {
        registry.run("build_features_daily");
        assert(false && "expected TaskFailedError");
    } catch (const core::TaskFailedError& ex) {
        assert(ex.taskName() == "ingest_market_daily");
        assert(ex.message() == "no command configured for task ingest_market_daily");
    }

    auto runs = store.listRecent(0);
    assert(runs.size() == 2);
    assert(runs[0].taskName == "ingest_market_daily");
    assert(runs[0].status == core::RunStatus::Failed);
    assert(runs[1].taskName == "build_ticker_universe");
    assert(runs[1].status == core::RunStatus::Success);
    assert(runs[1].artifacts.value() == "[]");

    cfg.reset();
    std::cout << "[OK] unconfigured task\n";
}

int main() {
    test_json_stdout_becomes_artifacts();
    test_plain_stdout_is_wrapped();
    test_non_zero_exit_fails();
    test_stderr_reaches_run_error();
    test_missing_command_fails();
    test_pipeline_catalogue_shape();
    test_full_pipeline_run();
    test_unconfigured_task_fails_its_chain();
    std::cout << "\nALL command task tests passed\n";
    return 0;
}
