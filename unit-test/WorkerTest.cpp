#include <unistd.h>

#include <filesystem>
#include <thread>

#include "gtest/gtest.h"
#include "monitor/interrupt_monitor.hpp"
#include "sandbox/container_sandbox.hpp"
#include "test/memory_queue.hpp"
#include "test/memory_result_store.hpp"
#include "test/scripted_sandbox.hpp"
#include "worker.hpp"

using namespace std;
using namespace grader;

class WorkerTest : public ::testing::Test {
protected:
    prometheus::Registry registry;
    grading_metrics metrics{registry};
    test::memory_broker broker;
    test::memory_result_store store;
    result_reporter reporter{store, metrics};
    retry_policy policy;

    void SetUp() override {
        policy.max_attempts = 5;
        policy.base_delay = chrono::milliseconds(10);
        policy.max_delay = chrono::milliseconds(40);
    }

    worker_pool::queue_factory factory() {
        return [this](int) { return make_unique<test::memory_queue>(broker); };
    }

    void submit(const string &submission_id, const string &task_id = "T1", test_kind kind = test_kind::PUBLIC, vector<string> command = {"run-tests"}, double time_limit = 10) {
        resource_limits limits;
        limits.time_limit = time_limit;
        job_message message;
        message.job = make_job(submission_id, task_id, kind, "fake/image", move(command), "", limits);
        test::memory_queue(broker).publish(message);
    }

    /**
     * @brief 等待条件成立，超时返回 false
     */
    template <typename F>
    bool wait_for(F condition, chrono::milliseconds timeout = chrono::seconds(10)) {
        auto deadline = chrono::steady_clock::now() + timeout;
        while (chrono::steady_clock::now() < deadline) {
            if (condition()) return true;
            this_thread::sleep_for(chrono::milliseconds(5));
        }
        return condition();
    }
};

TEST_F(WorkerTest, PassedJobIsRecordedAndAcknowledged) {
    test::scripted_sandbox sandbox({0});
    worker_pool pool(factory(), sandbox, reporter, metrics, policy);
    submit("s1");
    pool.start(1);

    ASSERT_TRUE(wait_for([&] { return broker.acked() == 1; }));
    pool.stop();
    pool.join();

    auto records = reporter.poll_result("s1");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].outcome, "passed");
    EXPECT_EQ(metrics.success_count("T1", test_kind::PUBLIC), 1);
    EXPECT_EQ(metrics.pushed_count("T1"), 1);
    EXPECT_EQ(broker.pending(), 0u);
    EXPECT_EQ(sandbox.run_count(), 1u);
}

TEST_F(WorkerTest, TimedOutJobIsTerminated) {
    filesystem::path root = filesystem::temp_directory_path() / ("grader-worker-test-" + to_string(getpid()));
    filesystem::create_directories(root / "run");
    filesystem::path runtime = root / "fake-runtime";
    filesystem::copy_file(filesystem::path(GRADER_TEST_DIR) / "fake-runtime.sh", runtime, filesystem::copy_options::overwrite_existing);
    filesystem::permissions(runtime, filesystem::perms::owner_all, filesystem::perm_options::add);

    server::sandbox_config config;
    config.runtime = runtime.string();
    config.run_dir = root / "run";
    config.kill_grace = 0.2;
    sandbox::container_sandbox sandbox(config);

    worker_pool pool(factory(), sandbox, reporter, metrics, policy);
    submit("s2", "T1", test_kind::PUBLIC, {"sh", "-c", "sleep 30"}, 5);
    pool.start(1);

    ASSERT_TRUE(wait_for([&] { return broker.acked() == 1; }, chrono::seconds(15)));
    pool.stop();
    pool.join();

    auto records = reporter.poll_result("s2");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].outcome, "timed_out");
    EXPECT_GE(records[0].duration.count(), 5000);
    EXPECT_LT(records[0].duration.count(), 6000);
    EXPECT_EQ(metrics.failed_count("T1", test_kind::PUBLIC), 1);
    EXPECT_TRUE(filesystem::is_empty(config.run_dir));
    filesystem::remove_all(root);
}

TEST_F(WorkerTest, LaunchFailuresAreRetried) {
    test::scripted_sandbox sandbox({test::scripted_sandbox::LAUNCH_FAILURE, test::scripted_sandbox::LAUNCH_FAILURE, 0});
    worker_pool pool(factory(), sandbox, reporter, metrics, policy);
    submit("s3");
    pool.start(1);

    ASSERT_TRUE(wait_for([&] { return store.size() == 1 && broker.pending() == 0; }));
    pool.stop();
    pool.join();

    auto records = reporter.poll_result("s3");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].outcome, "passed");
    EXPECT_EQ(records[0].attempt, 3);
    EXPECT_EQ(sandbox.run_count(), 3u);
    EXPECT_EQ(metrics.retried.Add({{"task_id", "T1"}}).Value(), 2);
    EXPECT_EQ(metrics.infra_failure_count("T1"), 0);
    EXPECT_EQ(metrics.success_count("T1", test_kind::PUBLIC), 1);
    // 重试不重复计入发布的任务数
    EXPECT_EQ(metrics.pushed_count("T1"), 1);
    EXPECT_TRUE(broker.dead().empty());
}

TEST_F(WorkerTest, PassesOnLastRetry) {
    test::scripted_sandbox sandbox({test::scripted_sandbox::LAUNCH_FAILURE, test::scripted_sandbox::LAUNCH_FAILURE,
                                    test::scripted_sandbox::LAUNCH_FAILURE, test::scripted_sandbox::LAUNCH_FAILURE,
                                    test::scripted_sandbox::LAUNCH_FAILURE, 0});
    worker_pool pool(factory(), sandbox, reporter, metrics, policy);
    submit("s10");
    pool.start(1);

    ASSERT_TRUE(wait_for([&] { return store.size() == 1 && broker.pending() == 0; }));
    pool.stop();
    pool.join();

    auto records = reporter.poll_result("s10");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].outcome, "passed");
    EXPECT_EQ(records[0].attempt, 6);
    EXPECT_EQ(sandbox.run_count(), 6u);
    EXPECT_EQ(metrics.retried.Add({{"task_id", "T1"}}).Value(), 5);
    EXPECT_EQ(metrics.infra_failure_count("T1"), 0);
    EXPECT_TRUE(broker.dead().empty());
}

TEST_F(WorkerTest, ExhaustedRetriesAreDeadLettered) {
    test::scripted_sandbox sandbox({test::scripted_sandbox::LAUNCH_FAILURE});
    worker_pool pool(factory(), sandbox, reporter, metrics, policy);
    submit("s4");
    pool.start(2);

    ASSERT_TRUE(wait_for([&] { return broker.dead().size() == 1; }));
    // 确认没有更多的重试
    this_thread::sleep_for(chrono::milliseconds(200));
    pool.stop();
    pool.join();

    // 首次执行加上 5 次重试
    EXPECT_EQ(sandbox.run_count(), 6u);
    EXPECT_EQ(broker.published(), 6u);
    EXPECT_EQ(broker.pending(), 0u);
    EXPECT_EQ(parse_job_message(broker.dead()[0]).retry.attempt, 6);

    auto records = reporter.poll_result("s4");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].outcome, "infra_error");
    EXPECT_EQ(records[0].attempt, 6);
    EXPECT_EQ(metrics.infra_failure_count("T1"), 1);
    EXPECT_EQ(metrics.failed_count("T1", test_kind::PUBLIC), 0);
}

TEST_F(WorkerTest, ConcurrentWorkersNeverShareDelivery) {
    test::scripted_sandbox sandbox({0, 1}, chrono::milliseconds(20));
    worker_pool pool(factory(), sandbox, reporter, metrics, policy);
    for (int i = 0; i < 40; ++i)
        submit("s" + to_string(i), "T" + to_string(i % 3), i % 2 ? test_kind::PRIVATE : test_kind::PUBLIC);
    pool.start(8);

    ASSERT_TRUE(wait_for([&] { return broker.acked() == 40; }));
    EXPECT_EQ(pool.running_workers(), 8);
    pool.stop();
    pool.join();

    EXPECT_EQ(sandbox.violation_count(), 0u);
    EXPECT_EQ(sandbox.run_count(), 40u);
    EXPECT_EQ(store.size(), 40u);
    EXPECT_EQ(broker.pending(), 0u);
    EXPECT_EQ(pool.running_workers(), 0);
}

TEST_F(WorkerTest, PersistenceErrorLeavesDeliveryUnacknowledged) {
    test::scripted_sandbox sandbox({0});
    worker_pool pool(factory(), sandbox, reporter, metrics, policy);
    test::memory_queue queue(broker);
    submit("s5");
    store.fail_next(1);

    auto delivery = queue.fetch(chrono::milliseconds(100));
    ASSERT_TRUE(delivery);
    pool.process(0, queue, *delivery);
    EXPECT_EQ(broker.acked(), 0u);
    EXPECT_EQ(broker.requeued(), 1u);
    EXPECT_EQ(store.size(), 0u);

    auto redelivery = queue.fetch(chrono::milliseconds(100));
    ASSERT_TRUE(redelivery);
    EXPECT_TRUE(redelivery->redelivered());
    pool.process(0, queue, *redelivery);
    EXPECT_EQ(broker.acked(), 1u);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(sandbox.run_count(), 2u);
    EXPECT_EQ(metrics.success_count("T1", test_kind::PUBLIC), 1);
    // 重新投递不重复计入发布的任务数
    EXPECT_EQ(metrics.pushed_count("T1"), 1);
}

TEST_F(WorkerTest, RedeliveredFinishedJobIsNotRecordedTwice) {
    test::scripted_sandbox sandbox({0, 1});
    worker_pool pool(factory(), sandbox, reporter, metrics, policy);
    test::memory_queue queue(broker);
    submit("s6");

    // 第一个消费者记录结果后、确认之前崩溃
    auto delivery = queue.fetch(chrono::milliseconds(100));
    ASSERT_TRUE(delivery);
    reporter.report(parse_job_message(delivery->body()), passed{}, execution_result{});
    delivery.reset();

    auto redelivery = queue.fetch(chrono::milliseconds(100));
    ASSERT_TRUE(redelivery);
    pool.process(0, queue, *redelivery);

    auto records = reporter.poll_result("s6");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].outcome, "passed");
    EXPECT_EQ(metrics.success_count("T1", test_kind::PUBLIC), 1);
    EXPECT_EQ(broker.acked(), 1u);
}

TEST_F(WorkerTest, InvalidJobIsDeadLettered) {
    test::scripted_sandbox sandbox({0});
    worker_pool pool(factory(), sandbox, reporter, metrics, policy);
    test::memory_queue queue(broker);
    broker.push(R"({"job": {"submission_id": "s7", "task_id": "T1", "kind": "hidden", "image": "img"}})");

    auto delivery = queue.fetch(chrono::milliseconds(100));
    ASSERT_TRUE(delivery);
    pool.process(0, queue, *delivery);

    EXPECT_EQ(broker.dead().size(), 1u);
    EXPECT_EQ(sandbox.run_count(), 0u);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(WorkerTest, RetryPublishFailureRequeuesDelivery) {
    test::scripted_sandbox sandbox({test::scripted_sandbox::LAUNCH_FAILURE});
    worker_pool pool(factory(), sandbox, reporter, metrics, policy);
    test::memory_queue queue(broker);
    submit("s8");

    auto delivery = queue.fetch(chrono::milliseconds(100));
    ASSERT_TRUE(delivery);
    broker.set_unavailable(true);
    EXPECT_THROW(pool.process(0, queue, *delivery), broker_unavailable);
    broker.set_unavailable(false);
    delivery.reset();

    EXPECT_EQ(broker.requeued(), 1u);
    EXPECT_EQ(broker.acked(), 0u);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(WorkerTest, InterruptMonitorTracksRunningJobs) {
    test::scripted_sandbox sandbox({0}, chrono::milliseconds(300));
    worker_pool pool(factory(), sandbox, reporter, metrics, policy);
    auto tracker = make_unique<interrupt_monitor>();
    interrupt_monitor &running = *tracker;
    pool.register_monitor(move(tracker));
    submit("s9");
    pool.start(1);

    ASSERT_TRUE(wait_for([&] { return running.running_jobs() == 1; }));
    pool.interrupt();
    ASSERT_TRUE(wait_for([&] { return broker.acked() == 1; }));
    EXPECT_EQ(running.running_jobs(), 0u);
    pool.stop();
    pool.join();
}
