#include "test_support.h"

#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "core/errors.h"
#include "db/run_store.h"

using namespace pipehub;
using namespace std::chrono_literals;

static void test_insert_running_row() {
    Db db;
    test::openMigrated(db);
    RunStore store(db);

    const auto t0 = std::chrono::system_clock::now();
    store.insertRunning("run-1", "base", t0);

    auto r = store.get("run-1");
    assert(r.has_value());
    assert(r->taskName == "base");
    assert(r->status == core::RunStatus::Running);
    assert(utils::toEpochMs(r->triggeredAt) == utils::toEpochMs(t0));
    assert(!r->completedAt.has_value());
    assert(!r->artifacts.has_value());
    assert(!r->error.has_value());

    assert(!store.get("nope").has_value());
    std::cout << "[OK] insertRunning\n";
}

static void test_finalize_success_and_failure() {
    Db db;
    test::openMigrated(db);
    RunStore store(db);

    const auto t0 = std::chrono::system_clock::now();
    store.insertRunning("ok-run", "base", t0);
    store.insertRunning("bad-run", "base", t0);

    store.finalize("ok-run", core::RunStatus::Success, t0 + 5ms, std::string(R"({"n":1})"), std::nullopt);
    store.finalize("bad-run", core::RunStatus::Failed, t0 + 7ms, std::nullopt, std::string("boom"));

    auto ok = store.get("ok-run");
    assert(ok->status == core::RunStatus::Success);
    assert(ok->completedAt.has_value());
    assert(*ok->completedAt >= ok->triggeredAt);
    assert(ok->artifacts.value() == R"({"n":1})");
    assert(!ok->error.has_value());

    auto bad = store.get("bad-run");
    assert(bad->status == core::RunStatus::Failed);
    assert(!bad->artifacts.has_value());
    assert(bad->error.value() == "boom");

    auto j = runRecordToJson(*ok);
    assert(j["status"] == "SUCCESS");
    assert(j["artifacts"]["n"] == 1);
    assert(j["error"].is_null());
    std::cout << "[OK] finalize success / failure\n";
}

static void test_finalize_is_idempotent_for_same_status() {
    Db db;
    test::openMigrated(db);
    RunStore store(db);

    const auto t0 = std::chrono::system_clock::now();
    store.insertRunning("r", "base", t0);
    store.finalize("r", core::RunStatus::Success, t0 + 1ms, std::string("{}"), std::nullopt);
    const auto first = store.get("r");

    // 同一终态再来一次：no-op
    store.finalize("r", core::RunStatus::Success, t0 + 1s, std::string(R"({"x":2})"), std::nullopt);
    const auto second = store.get("r");
    assert(second->status == core::RunStatus::Success);
    assert(utils::toEpochMs(*second->completedAt) == utils::toEpochMs(*first->completedAt));
    assert(second->artifacts == first->artifacts);

    // 终态之间不能改写
    assert(test::throwsAs<core::StoreError>([&] {
        store.finalize("r", core::RunStatus::Failed, t0 + 2s, std::nullopt, std::string("late"));
    }));
    assert(store.get("r")->status == core::RunStatus::Success);
    std::cout << "[OK] finalize idempotence\n";
}

static void test_finalize_rejects_bad_input() {
    Db db;
    test::openMigrated(db);
    RunStore store(db);
    const auto t0 = std::chrono::system_clock::now();

    assert(test::throwsAs<core::StoreError>([&] {
        store.finalize("missing", core::RunStatus::Success, t0, std::nullopt, std::nullopt);
    }));

    store.insertRunning("r", "base", t0);
    assert(test::throwsAs<std::invalid_argument>([&] {
        store.finalize("r", core::RunStatus::Running, t0, std::nullopt, std::nullopt);
    }));

    // run_id 是主键
    assert(test::throwsAs<core::StoreError>([&] {
        store.insertRunning("r", "other", t0);
    }));
    std::cout << "[OK] finalize / insert rejections\n";
}

static void test_store_without_schema_fails_loudly() {
    Db db;
    db.open(":memory:");
    assert(db.isOpen());
    RunStore store(db);
    assert(test::throwsAs<core::StoreError>([&] {
        store.insertRunning("r", "base", std::chrono::system_clock::now());
    }));
    std::cout << "[OK] missing table -> StoreError\n";
}

static void test_list_recent_order_limit_filter() {
    Db db;
    test::openMigrated(db);
    RunStore store(db);

    const auto t0 = std::chrono::system_clock::now();
    store.insertRunning("r1", "a", t0);
    store.insertRunning("r2", "b", t0 + 1ms);
    store.insertRunning("r3", "a", t0 + 2ms);
    store.insertRunning("r4", "a", t0 + 2ms); // 同一毫秒：按插入顺序

    auto all = store.listRecent(0);
    assert(all.size() == 4);
    assert(all[0].runId == "r4");
    assert(all[1].runId == "r3");
    assert(all[2].runId == "r2");
    assert(all[3].runId == "r1");

    auto two = store.listRecent(2);
    assert(two.size() == 2);
    assert(two[0].runId == "r4");

    auto onlyA = store.listRecent(10, "a");
    assert(onlyA.size() == 3);
    for (const auto& r : onlyA) assert(r.taskName == "a");
    std::cout << "[OK] listRecent\n";
}

static void test_records_survive_reopen() {
    const std::string path = test::tempPath("pipehub_store") + ".db";
    const auto t0 = std::chrono::system_clock::now();
    {
        Db db;
        test::openMigrated(db, path);
        RunStore store(db);
        store.insertRunning("durable", "base", t0);
        store.finalize("durable", core::RunStatus::Success, t0 + 3ms, std::string(R"({"n":1})"), std::nullopt);
    }
    {
        Db db;
        test::openMigrated(db, path);
        RunStore store(db);
        auto r = store.get("durable");
        assert(r.has_value());
        assert(r->status == core::RunStatus::Success);
        assert(r->artifacts.value() == R"({"n":1})");
        // 迁移不会重复执行
        assert(DbMigrator::migrate(db, PIPEHUB_TEST_MIGRATIONS_DIR) == 0);
    }
    std::error_code ec;
    std::filesystem::remove(path, ec);
    std::filesystem::remove(path + "-wal", ec);
    std::filesystem::remove(path + "-shm", ec);
    std::cout << "[OK] durable across reopen\n";
}

static void test_concurrent_writers_on_separate_connections() {
    const std::string path = test::tempPath("pipehub_concurrent") + ".db";
    {
        Db init;
        test::openMigrated(init, path);
    }

    constexpr int kPerWriter = 50;
    auto writer = [&](const std::string& prefix) {
        // 每个 writer 一条独立连接，模拟两个 CLI 进程
        Db db;
        db.open(path);
        RunStore store(db);
        for (int i = 0; i < kPerWriter; ++i) {
            const std::string id = prefix + std::to_string(i);
            const auto now = std::chrono::system_clock::now();
            store.insertRunning(id, prefix, now);
            store.finalize(id, core::RunStatus::Success, now, std::nullopt, std::nullopt);
        }
    };

    std::thread t1(writer, "w1-");
    std::thread t2(writer, "w2-");
    t1.join();
    t2.join();

    Db db;
    db.open(path);
    RunStore store(db);
    auto rows = store.listRecent(0);
    assert(rows.size() == 2 * kPerWriter);
    for (const auto& r : rows) assert(r.status == core::RunStatus::Success);

    db.close();
    std::error_code ec;
    std::filesystem::remove(path, ec);
    std::filesystem::remove(path + "-wal", ec);
    std::filesystem::remove(path + "-shm", ec);
    std::cout << "[OK] concurrent writers\n";
}

static void test_concurrent_first_start_migrates_once() {
    constexpr int kRounds = 20;
    for (int round = 0; round < kRounds; ++round) {
        const std::string path = test::tempPath("pipehub_migrate") + ".db";

        std::atomic<int> applied{0};
        std::atomic<int> failures{0};
        auto starter = [&] {
            try {
                Db db;
                db.open(path);
                applied += DbMigrator::migrate(db, PIPEHUB_TEST_MIGRATIONS_DIR);
            } catch (const core::StoreError& ex) {
                std::cerr << "migrate failed: " << ex.what() << "\n";
                ++failures;
            }
        };

        std::thread t1(starter);
        std::thread t2(starter);
        t1.join();
        t2.join();

        assert(failures == 0);

        Db db;
        db.open(path);
        const auto ids = DbMigrator::applied(db);
        // 每个迁移文件恰好执行一次，两条连接合计
        assert(applied == static_cast<int>(ids.size()));
        assert(ids.size() >= 2);
        assert(ids[0] == "0001_task_runs");
        db.close();

        std::error_code ec;
        std::filesystem::remove(path, ec);
        std::filesystem::remove(path + "-wal", ec);
        std::filesystem::remove(path + "-shm", ec);
    }
    std::cout << "[OK] concurrent first start migrates once\n";
}

int main() {
    test_insert_running_row();
    test_finalize_success_and_failure();
    test_finalize_is_idempotent_for_same_status();
    test_finalize_rejects_bad_input();
    test_store_without_schema_fails_loudly();
    test_list_recent_order_limit_filter();
    test_records_survive_reopen();
    test_concurrent_writers_on_separate_connections();
    test_concurrent_first_start_migrates_once();
    std::cout << "\nALL run store tests passed\n";
    return 0;
}
