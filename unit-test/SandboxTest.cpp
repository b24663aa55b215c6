#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <fstream>

#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "sandbox/container_sandbox.hpp"

using namespace std;
using namespace grader;

class SandboxTest : public ::testing::Test {
protected:
    filesystem::path root;
    server::sandbox_config config;

    void SetUp() override {
        root = filesystem::temp_directory_path() / ("grader-sandbox-test-" + to_string(getpid()) + "-" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        filesystem::create_directories(root / "run");

        // 容器运行时替身直接在宿主机上执行命令
        filesystem::path runtime = root / "fake-runtime";
        filesystem::copy_file(filesystem::path(GRADER_TEST_DIR) / "fake-runtime.sh", runtime, filesystem::copy_options::overwrite_existing);
        filesystem::permissions(runtime, filesystem::perms::owner_all, filesystem::perm_options::add);

        config.runtime = runtime.string();
        config.run_dir = root / "run";
        config.output_limit = 1024;
        config.kill_grace = 0.2;
    }

    void TearDown() override {
        filesystem::remove_all(root);
    }

    job_message message(vector<string> command, double time_limit = 10, const string &image = "fake/image", const string &input = "") {
        resource_limits limits;
        limits.time_limit = time_limit;
        job_message m;
        m.job = make_job("s1", "T1", test_kind::PUBLIC, image, move(command), input, limits);
        return m;
    }

    bool run_dir_empty() {
        return filesystem::is_empty(config.run_dir);
    }
};

static bool has_option(const vector<string> &args, const string &key, const string &value) {
    for (size_t i = 0; i + 1 < args.size(); ++i)
        if (args[i] == key && args[i + 1] == value) return true;
    return false;
}

TEST_F(SandboxTest, RunArguments) {
    sandbox::container_sandbox sb(config);
    auto job = message({"python", "-m", "pytest"}).job;
    job.limits.cpus = 1.5;
    job.limits.memory_mb = 512;
    job.limits.pids = 32;

    auto args = sb.run_arguments(job, "grader-test", filesystem::path("/data/s1.zip"), "/run/grader-test/workspace", "/run/grader-test/cid");
    EXPECT_EQ(args[0], config.runtime);
    EXPECT_EQ(args[1], "run");
    // 容器在查询状态后才删除
    EXPECT_EQ(find(args.begin(), args.end(), "--rm"), args.end());
    EXPECT_TRUE(has_option(args, "--cidfile", "/run/grader-test/cid"));
    EXPECT_NE(find(args.begin(), args.end(), "--read-only"), args.end());
    EXPECT_TRUE(has_option(args, "--name", "grader-test"));
    EXPECT_TRUE(has_option(args, "--network", "none"));
    EXPECT_TRUE(has_option(args, "--cpus", "1.5"));
    EXPECT_TRUE(has_option(args, "--memory", "512m"));
    EXPECT_TRUE(has_option(args, "--memory-swap", "512m"));
    EXPECT_TRUE(has_option(args, "--pids-limit", "32"));
    EXPECT_TRUE(has_option(args, "-v", "/data/s1.zip:/submission:ro"));
    EXPECT_TRUE(has_option(args, "-v", "/run/grader-test/workspace:/workspace"));
    EXPECT_EQ(vector<string>(args.end() - 4, args.end()), vector<string>({"fake/image", "python", "-m", "pytest"}));
}

TEST_F(SandboxTest, ExitZero) {
    sandbox::container_sandbox sb(config);
    auto result = sb.run(message({"sh", "-c", "echo hello"}));
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.output, "hello\n");
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.truncated);
    EXPECT_FALSE(result.launch_error);
    EXPECT_EQ(result.job, "T1-s1-public");
    EXPECT_TRUE(run_dir_empty());
}

TEST_F(SandboxTest, NonzeroExit) {
    sandbox::container_sandbox sb(config);
    auto result = sb.run(message({"sh", "-c", "echo boom >&2; exit 3"}));
    EXPECT_EQ(result.exitcode, 3);
    EXPECT_EQ(result.error, "boom\n");
    EXPECT_TRUE(holds_alternative<failed>(classify(result)));
    EXPECT_TRUE(run_dir_empty());
}

TEST_F(SandboxTest, TimeoutKillsSandbox) {
    sandbox::container_sandbox sb(config);
    filesystem::path pidfile = root / "pid";
    auto result = sb.run(message({"sh", "-c", "echo $$ > " + pidfile.string() + "; exec sleep 30"}, 1));

    EXPECT_TRUE(result.timed_out);
    EXPECT_TRUE(holds_alternative<timed_out>(classify(result)));
    EXPECT_GE(result.duration.count(), 1000);
    EXPECT_LT(result.duration.count(), 2000);

    pid_t pid = stoi(read_file_content(pidfile));
    int ret = kill(pid, 0);
    int error = errno;
    EXPECT_EQ(ret, -1);
    EXPECT_EQ(error, ESRCH);
    EXPECT_TRUE(run_dir_empty());
}

TEST_F(SandboxTest, OutputIsTruncated) {
    sandbox::container_sandbox sb(config);
    auto result = sb.run(message({"sh", "-c", "head -c 5000 /dev/zero | tr '\\0' a"}));
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.output, string(1024, 'a') + TRUNCATED_MARKER);
    EXPECT_TRUE(holds_alternative<passed>(classify(result)));
}

TEST_F(SandboxTest, TimeoutIgnoringTerminationStaysNearDeadline) {
    config.kill_grace = server::sandbox_config().kill_grace;
    sandbox::container_sandbox sb(config);
    auto result = sb.run(message({"sh", "-c", "trap '' TERM; sleep 30"}, 1));

    EXPECT_TRUE(result.timed_out);
    EXPECT_GE(result.duration.count(), 1000);
    EXPECT_LT(result.duration.count(), 2000);
    EXPECT_TRUE(run_dir_empty());
}

TEST_F(SandboxTest, LargeOutputIsNotStored) {
    sandbox::container_sandbox sb(config);
    // 输出 20MB 后统计运行目录的大小
    auto result = sb.run(message({"sh", "-c", "head -c 20000000 /dev/zero | tr '\\0' a; du -sk " + config.run_dir.string() + " >&2"}));
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.output, string(1024, 'a') + TRUNCATED_MARKER);
    EXPECT_LT(stol(result.error), 1024);
    EXPECT_TRUE(run_dir_empty());
}

TEST_F(SandboxTest, StagingDirectoryIsRemoved) {
    sandbox::container_sandbox sb(config);
    auto result = sb.run(message({"sh", "-c", "ls " + config.run_dir.string() + " | wc -l"}));
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(stoi(result.output), 1);
    EXPECT_TRUE(run_dir_empty());
}

TEST_F(SandboxTest, MissingRuntimeIsLaunchFailure) {
    config.runtime = (root / "missing-runtime").string();
    sandbox::container_sandbox sb(config);
    EXPECT_THROW(sb.run(message({"true"})), launch_failure);
    EXPECT_TRUE(run_dir_empty());
}

TEST_F(SandboxTest, RuntimeErrorIsLaunchFailure) {
    sandbox::container_sandbox sb(config);
    EXPECT_THROW(sb.run(message({"true"}, 10, "missing/image")), launch_failure);
    EXPECT_TRUE(run_dir_empty());
}

TEST_F(SandboxTest, ProgramExitCodesOfRuntimeAreFailures) {
    sandbox::container_sandbox sb(config);
    for (int code : {125, 126, 127}) {
        auto result = sb.run(message({"sh", "-c", "echo missing tool >&2; exit " + to_string(code)}));
        EXPECT_EQ(result.exitcode, code);
        EXPECT_FALSE(result.launch_error);
        EXPECT_EQ(result.error, "missing tool\n");
        EXPECT_TRUE(holds_alternative<failed>(classify(result)));
    }
    EXPECT_TRUE(run_dir_empty());
}

TEST_F(SandboxTest, MissingEntrypointIsLaunchFailure) {
    sandbox::container_sandbox sb(config);
    EXPECT_THROW(sb.run(message({"no-such-harness"})), launch_failure);
    EXPECT_TRUE(run_dir_empty());
}

TEST_F(SandboxTest, MissingInputBundleIsLaunchFailure) {
    sandbox::container_sandbox sb(config);
    EXPECT_THROW(sb.run(message({"true"}, 10, "fake/image", (root / "missing.zip").string())), launch_failure);
    EXPECT_TRUE(run_dir_empty());
}

TEST_F(SandboxTest, LocalInputBundle) {
    filesystem::path bundle = root / "s1.zip";
    ofstream(bundle) << "bundle";

    sandbox::container_sandbox sb(config);
    auto result = sb.run(message({"true"}, 10, "fake/image", bundle.string()));
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_TRUE(filesystem::exists(bundle));
}
