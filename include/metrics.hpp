#pragma once

#include <prometheus/counter.h>
#include <prometheus/exposer.h>
#include <prometheus/registry.h>

#include <memory>

#include "job.hpp"
#include "outcome.hpp"

namespace grader {

/**
 * @brief 评分流水线的计数器
 * 在 main 中创建一次并注册到 registry，之后以引用的方式交给 result_reporter 和 worker。
 * 测试时可以使用独立的 registry。
 */
struct grading_metrics {
    explicit grading_metrics(prometheus::Registry &registry);

    prometheus::Family<prometheus::Counter> &pushed, &success, &failed, &outcomes, &retried, &infra_failures, &logins_failed;

    /**
     * @brief 任务已经发布到消息队列
     * 评分守护进程在第一次领取任务时调用，重试和重新投递不重复计数
     */
    void job_pushed(const job_descriptor &job);

    /**
     * @brief 任务的最终结果已经被持久化
     * Passed 计入 success；Failed 和 TimedOut 计入 failed；
     * InfraError 只有在重试耗尽后才会被持久化，计入 infra_failures 供运维报警
     */
    void job_finished(const job_descriptor &job, const outcome &o);

    void job_retried(const job_descriptor &job);

    /**
     * @brief 由网页层调用，评分系统本身不处理登录
     */
    void login_failed();

    double pushed_count(const std::string &task_id);
    double success_count(const std::string &task_id, test_kind kind);
    double failed_count(const std::string &task_id, test_kind kind);
    double infra_failure_count(const std::string &task_id);
};

}  // namespace grader
