#include "common/utils.hpp"

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstring>

#include "common/exceptions.hpp"
#include "common/scoped_fd.hpp"
#include "logging.hpp"
using namespace std;

extern char **environ;

int process_builder::run_argv(const vector<string> &args) {
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    LOG_DEBUG << "Running " << args.front();

    grader::scoped_fd read_end, write_end;
    if (captured && !grader::make_pipe(read_end, write_end, O_CLOEXEC))
        BOOST_THROW_EXCEPTION(grader::grader_exception() << "pipe: " << strerror(errno));

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    if (captured) {
        posix_spawn_file_actions_adddup2(&actions, write_end.get(), STDOUT_FILENO);
    } else if (discard_output) {
        posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    }
    if (discard_output)
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    pid_t pid;
    int error = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (error != 0)
        BOOST_THROW_EXCEPTION(grader::grader_exception() << "Unable to run " << args.front() << ": " << strerror(error));

    if (captured) {
        write_end.reset();
        captured->clear();
        char buffer[4096];
        ssize_t n;
        while ((n = read(read_end.get(), buffer, sizeof(buffer))) != 0) {
            if (n > 0)
                captured->append(buffer, n);
            else if (errno != EINTR)
                break;
        }
    }

    int status;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR)
            BOOST_THROW_EXCEPTION(grader::grader_exception() << "waitpid " << args.front() << ": " << strerror(errno));
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

string get_env(const string &key, const string &def_value) {
    const char *value = getenv(key.c_str());
    return value ? string(value) : def_value;
}

elapsed_time::elapsed_time() : start(chrono::steady_clock::now()) {}
