#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

std::string get_env(const std::string &key, const std::string &def_value = "");

/**
 * @brief 同步运行外部程序
 * 参数可以是字符串、路径、数字、可选字符串（为空时跳过）以及字符串数组（展开）
 * @code
 * int ret = process_builder().run("docker", "rm", "-f", name);
 * @endcode
 */
struct process_builder {
    /**
     * @brief 丢弃子进程的标准输出和标准错误
     */
    process_builder &quiet(bool value = true) {
        discard_output = value;
        return *this;
    }

    /**
     * @brief 将子进程的标准输出保存到 output，标准错误不受影响
     */
    process_builder &capture(std::string &output) {
        captured = &output;
        return *this;
    }

    /**
     * @brief 运行程序并等待结束
     * @return 程序的退出码，若程序被信号终止则返回 -1
     * @throw grader_exception 无法启动程序
     */
    template <typename... Args>
    int run(Args &&...args) {
        std::vector<std::string> argv;
        (append(argv, std::forward<Args>(args)), ...);
        return run_argv(argv);
    }

    int run_argv(const std::vector<std::string> &argv);

private:
    static void append(std::vector<std::string> &argv, const std::string &arg) { argv.push_back(arg); }
    static void append(std::vector<std::string> &argv, const char *arg) { argv.emplace_back(arg); }
    static void append(std::vector<std::string> &argv, const std::filesystem::path &arg) { argv.push_back(arg.string()); }
    static void append(std::vector<std::string> &argv, const std::optional<std::string> &arg) {
        if (arg) argv.push_back(*arg);
    }
    static void append(std::vector<std::string> &argv, const std::vector<std::string> &args) {
        argv.insert(argv.end(), args.begin(), args.end());
    }
    template <typename T, typename = std::enable_if_t<std::is_arithmetic_v<std::decay_t<T>>>>
    static void append(std::vector<std::string> &argv, T arg) { argv.push_back(std::to_string(arg)); }

    bool discard_output = false;
    std::string *captured = nullptr;
};

struct elapsed_time {
    elapsed_time();

    template <typename T>
    T duration() const {
        return std::chrono::duration_cast<T>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};
