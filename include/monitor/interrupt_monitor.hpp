#pragma once

#include <map>
#include <mutex>

#include "monitor/monitor.hpp"

namespace grader {

/**
 * @brief 记录正在执行的任务，运维中断评分系统时输出到日志
 * 被中断的任务没有被确认，消息队列会重新投递
 */
struct interrupt_monitor : public monitor {
    void start_job(int worker_id, const job_message &message) override;

    void end_job(int worker_id, const job_message &message, const execution_result &result) override;

    void interrupt_jobs() override;

    std::size_t running_jobs();

private:
    std::mutex mut;

    std::map<int, job_message> running;
};

}  // namespace grader
