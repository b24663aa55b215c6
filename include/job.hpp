#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "common/json_utils.hpp"

/**
 * 这个头文件包含评分任务的描述
 * 1. job_descriptor（一次评分执行，创建后不再修改）
 * 2. retry_state（在途任务的重试次数与退避时间）
 * 3. job_message（消息队列中传输的任务：描述 + 重试状态）
 */
namespace grader {

/**
 * @brief 测试集类型
 * 学生可见的公开测试或者隐藏的私有测试
 */
enum class test_kind {
    PUBLIC,
    PRIVATE
};

std::string kind_name(test_kind kind);

/**
 * @throw invalid_job 如果不是 public 或 private
 */
test_kind parse_test_kind(const std::string &kind);

/**
 * @brief 沙箱资源限制，启动容器时由隔离层强制执行
 */
struct resource_limits {
    /**
     * @brief 可使用的 CPU 核心数，允许小数
     */
    double cpus = 1.0;

    /**
     * @brief 内存限制，单位为 MB
     */
    int memory_mb = 256;

    /**
     * @brief 时钟时间限制，单位为秒
     * 超时后沙箱会被强制终止，结果为 TimedOut
     */
    double time_limit = 10.0;

    /**
     * @brief 容器内最多同时存在的进程数
     */
    int pids = 64;
};

struct job_descriptor {
    std::string submission_id;

    std::string task_id;

    test_kind kind = test_kind::PUBLIC;

    /**
     * @brief 容器镜像，包含该题目的测试脚本
     */
    std::string image;

    /**
     * @brief 容器的入口命令，为空时使用镜像自带的入口
     */
    std::vector<std::string> command;

    /**
     * @brief 学生提交的输入包位置，本地路径或者 http(s) 地址
     * 以只读方式挂载到沙箱的 /submission
     */
    std::string input;

    resource_limits limits;

    std::chrono::system_clock::time_point enqueued_at;

    /**
     * @brief 形如 T1-s42-public 的名字，用于日志和工作目录
     */
    std::string name() const;
};

/**
 * @brief 在途任务的重试状态，任务到达终态后丢弃
 */
struct retry_state {
    /**
     * @brief 当前是第几次尝试，从 1 开始
     */
    int attempt = 1;

    /**
     * @brief 本次尝试最早的开始时间（退避截止时间）
     */
    std::chrono::system_clock::time_point not_before;
};

struct job_message {
    job_descriptor job;
    retry_state retry;
};

/**
 * @brief 创建一个新任务，enqueued_at 为当前时间
 */
job_descriptor make_job(std::string submission_id, std::string task_id, test_kind kind, std::string image, std::vector<std::string> command, std::string input, resource_limits limits = {});

void from_json(const nlohmann::json &j, resource_limits &limits);
void to_json(nlohmann::json &j, const resource_limits &limits);

void from_json(const nlohmann::json &j, job_descriptor &job);
void to_json(nlohmann::json &j, const job_descriptor &job);

void from_json(const nlohmann::json &j, job_message &message);
void to_json(nlohmann::json &j, const job_message &message);

/**
 * @brief 解析消息体
 * @throw invalid_job 消息体不是合法的任务描述
 */
job_message parse_job_message(const std::string &body);

}  // namespace grader
