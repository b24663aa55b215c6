#include "sandbox/container_sandbox.hpp"

#include <fcntl.h>
#include <fmt/core.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstring>

#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/net_utils.hpp"
#include "common/scoped_fd.hpp"
#include "common/utils.hpp"
#include "logging.hpp"

namespace grader::sandbox {
using namespace std;

/**
 * 容器运行时自身出错时使用的退出码：
 * 125 运行时无法创建容器，126 入口命令无法执行，127 入口命令不存在
 * 被测程序也可能以这些退出码结束，需要查询容器状态才能区分
 */
static bool may_be_runtime_error(int exitcode) {
    return exitcode == 125 || exitcode == 126 || exitcode == 127;
}

/**
 * @brief 从管道读取程序输出，只保留前 limit 字节，超出的部分读出后丢弃
 */
struct output_capture {
    scoped_fd fd;
    string data;
    size_t limit = 0;
    bool truncated = false;
    bool closed = false;

    /**
     * @brief 读出管道中已有的全部数据，读端为非阻塞模式
     */
    void drain() {
        char buffer[8192];
        while (!closed) {
            ssize_t n = read(fd.get(), buffer, sizeof(buffer));
            if (n > 0) {
                size_t keep = min(static_cast<size_t>(n), limit - min(limit, data.size()));
                data.append(buffer, keep);
                if (keep < static_cast<size_t>(n)) truncated = true;
            } else if (n == 0) {
                closed = true;
            } else if (errno != EINTR) {
                break;
            }
        }
    }

    string content() const {
        return truncated ? data + TRUNCATED_MARKER : data;
    }
};

static void open_capture(output_capture &capture, scoped_fd &write_end, size_t limit) {
    if (!make_pipe(capture.fd, write_end, O_CLOEXEC))
        BOOST_THROW_EXCEPTION(launch_failure() << "pipe: " << strerror(errno));
    if (fcntl(capture.fd.get(), F_SETFL, O_NONBLOCK) == -1)
        BOOST_THROW_EXCEPTION(launch_failure() << "fcntl: " << strerror(errno));
    capture.limit = limit;
}

/**
 * @brief 等待进程退出直到 deadline，等待期间持续读取输出
 * @return 进程是否已经退出并被回收
 */
static bool wait_until(pid_t pid, int &status, chrono::steady_clock::time_point deadline, output_capture &out, output_capture &err) {
    while (true) {
        out.drain();
        err.drain();
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) {
            out.drain();
            err.drain();
            return true;
        }
        if (ret == -1 && errno != EINTR)
            BOOST_THROW_EXCEPTION(launch_failure() << "waitpid: " << strerror(errno));

        auto now = chrono::steady_clock::now();
        if (now >= deadline) return false;
        auto timeout = min(chrono::milliseconds(10), chrono::ceil<chrono::milliseconds>(deadline - now));
        // poll 忽略负数的文件描述符，两个管道都关闭后只起到定时的作用
        pollfd fds[2] = {{out.closed ? -1 : out.fd.get(), POLLIN, 0}, {err.closed ? -1 : err.fd.get(), POLLIN, 0}};
        if (poll(fds, 2, static_cast<int>(timeout.count())) == -1 && errno != EINTR)
            BOOST_THROW_EXCEPTION(launch_failure() << "poll: " << strerror(errno));
    }
}

static void reap(pid_t pid, int &status) {
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) BOOST_THROW_EXCEPTION(launch_failure() << "waitpid: " << strerror(errno));
    }
}

container_sandbox::container_sandbox(const server::sandbox_config &config) : config(config) {}

vector<string> container_sandbox::run_arguments(const job_descriptor &job, const string &name, const optional<filesystem::path> &bundle, const filesystem::path &workspace, const filesystem::path &cidfile) const {
    // 不使用 --rm：容器在查询状态之后由 cleanup 删除
    vector<string> args = {
        config.runtime, "run",
        "--name", name,
        "--cidfile", cidfile.string(),
        "--network", config.network,
        "--cpus", fmt::format("{}", job.limits.cpus),
        "--memory", fmt::format("{}m", job.limits.memory_mb),
        "--memory-swap", fmt::format("{}m", job.limits.memory_mb),
        "--pids-limit", to_string(job.limits.pids),
        "--read-only",
        "--tmpfs", "/tmp:rw,size=64m",
        "-v", workspace.string() + ":/workspace",
        "-w", "/workspace"};
    if (bundle) {
        args.push_back("-v");
        args.push_back(bundle->string() + ":/submission:ro");
    }
    if (!config.user.empty()) {
        args.push_back("--user");
        args.push_back(config.user);
    }
    args.push_back(job.image);
    args.insert(args.end(), job.command.begin(), job.command.end());
    return args;
}

optional<filesystem::path> container_sandbox::stage_input(const job_descriptor &job, const filesystem::path &staging) const {
    if (job.input.empty()) return nullopt;

    if (boost::algorithm::starts_with(job.input, "http://") || boost::algorithm::starts_with(job.input, "https://")) {
        filesystem::path bundle = staging / "bundle";
        try {
            net::download_file(job.input, bundle, config.download_timeout);
        } catch (network_error &ex) {
            BOOST_THROW_EXCEPTION(launch_failure() << "Unable to download input bundle " << job.input << ": " << ex.what());
        }
        return bundle;
    }

    error_code ec;
    filesystem::path bundle = filesystem::absolute(job.input, ec);
    if (ec || !filesystem::exists(bundle, ec))
        BOOST_THROW_EXCEPTION(launch_failure() << "Input bundle " << job.input << " does not exist");
    return bundle;
}

optional<string> container_sandbox::launch_error(const filesystem::path &cidfile) const {
    string cid = read_file_content(cidfile, "");
    boost::algorithm::trim(cid);
    if (cid.empty()) return "container was not created";

    string state;
    try {
        int ret = process_builder().quiet().capture(state).run(config.runtime, "inspect", "--format", "{{.State.StartedAt}}|{{.State.Error}}", cid);
        if (ret != 0) return fmt::format("unable to inspect container {}, exit code {}", cid, ret);
    } catch (grader_exception &ex) {
        return fmt::format("unable to inspect container {}: {}", cid, ex.what());
    }

    boost::algorithm::trim(state);
    auto separator = state.find('|');
    string started = state.substr(0, separator);
    string error = separator == string::npos ? "" : state.substr(separator + 1);
    if (!error.empty()) return error;
    // 从未启动的容器 StartedAt 为零值
    if (started.empty() || boost::algorithm::starts_with(started, "0001-01-01")) return "container was never started";
    return nullopt;
}

void container_sandbox::cleanup(const string &name, const filesystem::path &staging) const noexcept {
    try {
        // 容器没有被创建时返回值非零
        int ret = process_builder().quiet().run(config.runtime, "rm", "-f", name);
        LOG_DEBUG << "Removed container " << name << ", exit code " << ret;
    } catch (std::exception &ex) {
        LOG_ERROR << "Unable to remove container " << name << ": " << ex.what();
    }

    error_code ec;
    filesystem::remove_all(staging, ec);
    if (ec) LOG_ERROR << "Unable to remove " << staging << ": " << ec.message();
}

execution_result container_sandbox::run(const job_message &message) {
    const job_descriptor &job = message.job;
    string name = "grader-" + boost::lexical_cast<string>(boost::uuids::random_generator()());
    filesystem::path staging = config.run_dir / name;
    filesystem::path workspace = staging / "workspace";

    defer {
        cleanup(name, staging);
    };

    error_code ec;
    filesystem::create_directories(workspace, ec);
    if (ec) BOOST_THROW_EXCEPTION(launch_failure() << "Unable to create workspace " << workspace << ": " << ec.message());
    // 容器内的用户和宿主机不同，工作目录需要对所有人可写
    filesystem::permissions(workspace, filesystem::perms::all, ec);
    if (ec) BOOST_THROW_EXCEPTION(launch_failure() << "Unable to set permissions of " << workspace << ": " << ec.message());

    optional<filesystem::path> bundle = stage_input(job, staging);
    filesystem::path cidfile = staging / "cid";
    vector<string> args = run_arguments(job, name, bundle, workspace, cidfile);
    vector<const char *> argv;
    for (auto &arg : args) argv.push_back(arg.c_str());
    argv.push_back(nullptr);

    output_capture out, err;
    scoped_fd out_write, err_write;
    open_capture(out, out_write, config.output_limit);
    open_capture(err, err_write, config.output_limit);

    // exec 成功后写端被自动关闭；exec 失败时子进程写入 errno
    scoped_fd exec_read, exec_write;
    if (!make_pipe(exec_read, exec_write, O_CLOEXEC))
        BOOST_THROW_EXCEPTION(launch_failure() << "pipe: " << strerror(errno));

    LOG_DEBUG << "Running sandbox " << name << ": " << boost::algorithm::join(args, " ");

    execution_result result;
    result.job = job.name();
    elapsed_time timer;
    auto deadline = chrono::steady_clock::now() + chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(job.limits.time_limit));

    pid_t pid = fork();
    if (pid == -1) BOOST_THROW_EXCEPTION(launch_failure() << "fork: " << strerror(errno));
    if (pid == 0) {
        // 子进程位于独立的进程组，超时时整组终止
        setpgid(0, 0);
        signal(SIGINT, SIG_IGN);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull == -1 || dup2(devnull, STDIN_FILENO) == -1 ||
            dup2(out_write.get(), STDOUT_FILENO) == -1 || dup2(err_write.get(), STDERR_FILENO) == -1) {
            int error = errno;
            if (write(exec_write.get(), &error, sizeof(error)) < 0) _exit(EXIT_FAILURE);
            _exit(EXIT_FAILURE);
        }
        execvp(argv[0], (char **)argv.data());
        int error = errno;
        if (write(exec_write.get(), &error, sizeof(error)) < 0) _exit(EXIT_FAILURE);
        _exit(EXIT_FAILURE);
    }

    setpgid(pid, pid);
    exec_write.reset();
    out_write.reset();
    err_write.reset();

    int exec_errno = 0;
    ssize_t n;
    while ((n = read(exec_read.get(), &exec_errno, sizeof(exec_errno))) == -1 && errno == EINTR)
        ;
    int status = 0;
    if (n > 0) {
        reap(pid, status);
        BOOST_THROW_EXCEPTION(launch_failure() << "Unable to execute " << config.runtime << ": " << strerror(exec_errno));
    }

    if (!wait_until(pid, status, deadline, out, err)) {
        result.timed_out = true;
        LOG_INFO << "Sandbox " << name << " exceeded time limit of " << job.limits.time_limit << "s";

        // 先让运行时直接终止容器，再终止运行时客户端，宽限时间后强制终止整个进程组
        try {
            int ret = process_builder().quiet().run(config.runtime, "kill", name);
            LOG_DEBUG << "Killed container " << name << ", exit code " << ret;
        } catch (grader_exception &ex) {
            LOG_ERROR << "Unable to kill container " << name << ": " << ex.what();
        }
        kill(-pid, SIGTERM);
        auto grace = chrono::steady_clock::now() + chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(config.kill_grace));
        if (!wait_until(pid, status, grace, out, err)) {
            kill(-pid, SIGKILL);
            reap(pid, status);
            out.drain();
            err.drain();
        }
    }
    // 进程组中可能还有脱离运行时客户端的子进程
    kill(-pid, SIGKILL);
    result.duration = timer.duration<chrono::milliseconds>();

    result.output = out.content();
    result.error = err.content();
    result.truncated = out.truncated || err.truncated;

    if (!result.timed_out) {
        if (WIFSIGNALED(status))
            BOOST_THROW_EXCEPTION(launch_failure() << "Container runtime was killed by signal " << WTERMSIG(status));
        result.exitcode = WEXITSTATUS(status);
        if (may_be_runtime_error(result.exitcode)) {
            if (auto error = launch_error(cidfile)) {
                string detail = err.data;
                boost::algorithm::trim(detail);
                BOOST_THROW_EXCEPTION(launch_failure() << "Container runtime exited with " << result.exitcode << ": " << *error
                                                       << (detail.empty() ? "" : ", ") << detail);
            }
        }
    }

    LOG_DEBUG << "Sandbox " << name << " finished in " << result.duration.count() << "ms, exit code " << result.exitcode
              << (result.timed_out ? " (timed out)" : "");
    return result;
}

}  // namespace grader::sandbox
