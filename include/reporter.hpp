#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "common/json_utils.hpp"
#include "job.hpp"
#include "metrics.hpp"
#include "outcome.hpp"

namespace grader {

/**
 * @brief 持久化的评分结果，每个 (submission_id, task_id, kind) 至多一条
 */
struct result_record {
    std::string submission_id;
    std::string task_id;
    test_kind kind = test_kind::PUBLIC;

    /**
     * @brief passed, failed, timed_out, infra_error
     */
    std::string outcome;

    /**
     * @brief 失败原因或者基础设施错误原因
     */
    std::string reason;

    int exit_code = -1;
    std::string output;
    std::string error;
    bool truncated = false;
    std::chrono::milliseconds duration{0};

    /**
     * @brief 产生该结果的是第几次尝试
     */
    int attempt = 1;

    std::chrono::system_clock::time_point created_at;
};

result_record make_record(const job_message &message, const outcome &o, const execution_result &result);

void to_json(nlohmann::json &j, const result_record &record);

/**
 * @brief 评分结果存储
 */
struct result_store {
    virtual ~result_store();

    /**
     * @brief 保存评分结果，相同 (submission_id, task_id, kind) 已经存在时不做任何事情
     * @return 是否新插入了记录
     * @throw persistence_error 写入失败
     */
    virtual bool save(const result_record &record) = 0;

    /**
     * @brief 查询某个提交的所有评分结果
     * @throw persistence_error
     */
    virtual std::vector<result_record> find(const std::string &submission_id) = 0;
};

/**
 * @brief 评分结果报告器
 * 结果只会被持久化一次：消息队列重复投递导致的重复报告不会产生新记录，
 * 也不会重复更新计数器和通知监听者。
 */
struct result_reporter {
    using listener = std::function<void(const result_record &)>;

    result_reporter(result_store &store, grading_metrics &metrics);

    /**
     * @brief 持久化任务的最终结果，更新计数器并通知监听者
     * 只有持久化写入会阻塞调用方，监听者应当异步处理通知
     * @return 是否是新结果，重复报告时为 false
     * @throw persistence_error 写入失败，调用方不能确认对应的消息
     */
    bool report(const job_message &message, const outcome &o, const execution_result &result);

    /**
     * @brief 供网页层轮询某个提交的评分结果
     * @throw persistence_error
     */
    std::vector<result_record> poll_result(const std::string &submission_id);

    /**
     * @brief 注册结果通知，必须在 worker 启动前注册
     */
    void on_result(listener callback);

private:
    result_store &store;
    grading_metrics &metrics;
    std::vector<listener> listeners;
};

}  // namespace grader
