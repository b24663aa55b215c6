#pragma once

#include "job.hpp"
#include "outcome.hpp"

namespace grader::sandbox {

/**
 * @brief 沙箱执行器
 * 在隔离环境中运行一个评分任务，执行期间强制资源限制
 */
struct sandbox {
    virtual ~sandbox() = default;

    /**
     * @brief 运行任务并等待结束或超时
     * 被测程序的失败体现在返回值的退出码中；超时时 timed_out 为 true
     * 无论如何退出，沙箱的工作目录和容器都会被清理
     * @throw launch_failure 隔离层本身无法启动
     */
    virtual execution_result run(const job_message &message) = 0;
};

}  // namespace grader::sandbox
