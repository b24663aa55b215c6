#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "job.hpp"

namespace grader::server {

/**
 * @brief 消息队列的一次投递
 * 投递不会被自动确认：处理方必须显式调用 ack 或 reject。
 * 处理方崩溃时未确认的投递会被消息队列重新投递（至少一次）。
 */
struct delivery {
    virtual ~delivery();

    virtual std::string body() const = 0;

    /**
     * @brief 该消息是否之前已经投递过但没有被确认
     */
    virtual bool redelivered() const = 0;

    /**
     * @brief 确认消息，消息队列将删除该消息
     */
    void ack();

    /**
     * @brief 拒绝消息
     * @param requeue true 表示放回队列重新投递，false 表示转入死信队列
     */
    void reject(bool requeue);

    /**
     * @brief 是否已经确认或拒绝
     */
    bool settled() const noexcept;

protected:
    virtual void do_ack() = 0;
    virtual void do_reject(bool requeue) = 0;

private:
    bool done = false;
};

/**
 * @brief 评分任务队列
 * 不同任务之间的顺序没有保证；同一个投递同一时刻只会被一个消费者持有。
 */
struct job_queue {
    virtual ~job_queue();

    /**
     * @brief 发布任务，消息队列持久化接收后才返回
     * @throw broker_unavailable 无法连接消息队列，或者发布没有被确认
     */
    virtual void publish(const job_message &message) = 0;

    /**
     * @brief 延迟发布任务，用于退避重试
     * @throw broker_unavailable
     */
    virtual void publish_delayed(const job_message &message, std::chrono::milliseconds delay) = 0;

    /**
     * @brief 等待一个投递
     * @return 超时时返回空指针
     * @throw broker_unavailable
     */
    virtual std::unique_ptr<delivery> fetch(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 持续消费直到 running 为 false
     * handler 对每个投递调用一次，且必须确认或拒绝该投递。
     * handler 抛出异常且没有处理投递时，投递被放回队列。
     */
    void consume(const std::function<void(delivery &)> &handler, const std::atomic<bool> &running, std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500));
};

}  // namespace grader::server
