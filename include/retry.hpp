#pragma once

#include <chrono>

#include "common/json_utils.hpp"
#include "job.hpp"

namespace grader {

/**
 * @brief 基础设施错误的重试策略
 * 第 n 次尝试失败后，等待 min(base_delay * 2^(n-1), max_delay) 再进行第 n+1 次尝试，
 * 首次执行之外最多重试 max_attempts 次，第 max_attempts + 1 次尝试仍然失败时放弃，将任务转入死信队列
 */
struct retry_policy {
    int max_attempts = 5;

    std::chrono::milliseconds base_delay{1000};

    std::chrono::milliseconds max_delay{60000};

    /**
     * @brief 第 attempt 次尝试失败后是否还可以重试
     */
    bool exhausted(int attempt) const noexcept;

    /**
     * @brief 第 attempt 次尝试失败后的退避时间
     */
    std::chrono::milliseconds backoff(int attempt) const noexcept;

    /**
     * @brief 生成下一次尝试的消息，任务描述保持不变
     */
    job_message next_attempt(const job_message &message, std::chrono::system_clock::time_point now) const;
};

void from_json(const nlohmann::json &j, retry_policy &policy);

}  // namespace grader
