#pragma once

#include "metrics.hpp"
#include "server/job_queue.hpp"

namespace grader {

/**
 * @brief 网页层提交评分任务的入口
 */
struct job_submitter {
    job_submitter(server::job_queue &queue, grading_metrics &metrics);

    /**
     * @brief 发布任务的第一次尝试
     * 没有设置入队时间的任务使用当前时间
     * @throw broker_unavailable 消息队列没有持久化接收该任务
     */
    job_message submit(job_descriptor job);

private:
    server::job_queue &queue;
    grading_metrics &metrics;
};

}  // namespace grader
