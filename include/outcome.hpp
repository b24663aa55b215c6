#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace grader {

/**
 * @brief 沙箱一次执行的原始结果
 * 由沙箱生成，交给 classify 分类后成为持久化记录的一部分
 */
struct execution_result {
    /**
     * @brief 所属任务的名字，见 job_descriptor::name
     */
    std::string job;

    /**
     * @brief 程序退出码，未正常退出时为 -1
     */
    int exitcode = -1;

    /**
     * @brief 标准输出和标准错误，超过上限的部分被截断并附加截断标记
     */
    std::string output;
    std::string error;

    /**
     * @brief 输出是否被截断
     */
    bool truncated = false;

    /**
     * @brief 是否因为超过时钟时间限制而被强制终止
     */
    bool timed_out = false;

    std::chrono::milliseconds duration{0};

    /**
     * @brief 隔离层本身启动失败的原因，与被测程序无关
     */
    std::optional<std::string> launch_error;
};

struct passed {};

/**
 * @brief 程序运行结束但没有通过测试
 */
struct failed {
    std::string reason;
};

struct timed_out {};

/**
 * @brief 基础设施错误，不展示给学生，重试或者报告给运维
 */
struct infra_error {
    std::string cause;
};

/**
 * @brief 任务的最终分类
 * 新增种类时，所有 std::visit 的地方都会编译失败，需要逐一处理
 */
using outcome = std::variant<passed, failed, timed_out, infra_error>;

template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

/**
 * @brief 根据退出码、超时标记和启动错误对执行结果分类
 * 1. 隔离层启动失败：InfraError
 * 2. 超时：TimedOut
 * 3. 退出码为 0：Passed
 * 4. 其他：Failed，原因只用于诊断，不会影响分类
 */
outcome classify(const execution_result &result);

/**
 * @brief passed, failed, timed_out, infra_error
 */
std::string outcome_name(const outcome &o);

/**
 * @brief 失败原因或者基础设施错误原因，通过时为空
 */
std::string outcome_detail(const outcome &o);

/**
 * @brief 是否是学生可见的结果，InfraError 只对运维可见
 */
bool student_visible(const outcome &o);

}  // namespace grader
