#pragma once

#include <string>

#include "job.hpp"
#include "outcome.hpp"

namespace grader {

enum class worker_state {
    START,
    GRADING,
    IDLE,
    CRASHED,
    STOPPED
};

std::string state_name(worker_state state);

/**
 * @brief 执行监控行为
 * 所有方法默认不做任何事情
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报某个 worker 已经开始执行一个评分任务
     * @param worker_id 执行任务的 Worker 编号
     */
    virtual void start_job(int worker_id, const job_message &message);

    /**
     * @brief 监控上报某个评分任务的一次尝试已经结束
     * @param result 沙箱的执行结果，启动失败时 launch_error 不为空
     */
    virtual void end_job(int worker_id, const job_message &message, const execution_result &result);

    /**
     * @brief 监控上报当前某个 Worker 的状态
     * @param worker_id Worker 编号
     * @param state Worker 的新状态
     * @param information 如果 Worker 崩溃，则为错误原因，用于日志记录
     */
    virtual void worker_state_changed(int worker_id, worker_state state, const std::string &information);

    virtual void report_error(int worker_id, const std::string &error_log);

    /**
     * @brief 运维中断评分系统时调用
     */
    virtual void interrupt_jobs();
};

}  // namespace grader
