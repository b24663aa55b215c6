#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

#include "SimpleAmqpClient/SimpleAmqpClient.h"
#include "common/concurrent_queue.hpp"
#include "server/config.hpp"
#include "server/job_queue.hpp"

namespace grader::server {

struct rabbitmq_channel;

struct rabbitmq_envelope : delivery {
    rabbitmq_envelope(rabbitmq_channel &owner, AmqpClient::Envelope::ptr_t envelope, unsigned generation);

    std::string body() const override;
    bool redelivered() const override;

protected:
    void do_ack() override;
    void do_reject(bool requeue) override;

private:
    rabbitmq_channel &owner;
    AmqpClient::Envelope::ptr_t envelope;

    /**
     * @brief 取得该投递时信道的连接代数，重连后旧投递的 delivery tag 失效
     */
    unsigned generation;
};

/**
 * @brief RabbitMQ 实现的评分任务队列
 * 拓扑：
 * 1. exchange --routing_key--> queue，拒绝且不重新入队的消息进入 queue.dead
 * 2. queue.retry 中的消息按照每条消息的 expiration 过期后回到 exchange
 * 每个信道只能被一个线程使用，多个 worker 需要各自创建信道。
 */
struct rabbitmq_channel : job_queue {
    friend struct rabbitmq_envelope;

    /**
     * @param write 为 true 时只用于发送消息，并启动异步发送线程；否则监听队列
     * @param dead_lettering 是否声明重试队列和死信队列，结果推送队列不需要
     */
    rabbitmq_channel(const amqp &amqp, bool write = false, bool dead_lettering = true);
    ~rabbitmq_channel();

    void publish(const job_message &message) override;
    void publish_delayed(const job_message &message, std::chrono::milliseconds delay) override;
    std::unique_ptr<delivery> fetch(std::chrono::milliseconds timeout) override;

    /**
     * @brief 异步向队列发送消息，routing_key 为队列默认
     * @param message 消息内容
     */
    void report(const std::string &message);

    /**
     * @brief 异步向队列发送消息
     * @param message 消息内容
     * @param routing_key 该消息采用特定的 routing key
     */
    void report(const std::string &message, const std::string &routing_key);

    std::string retry_queue() const;
    std::string dead_queue() const;

private:
    struct pending_message {
        std::string message;
        std::string routing_key;
    };

    void connect();
    void try_connect(bool force);
    void message_write_loop();

    /**
     * @brief 同步发布，失败时重连并重试 amqp.retries 次
     * @throw broker_unavailable
     */
    void send(const std::string &exchange, const std::string &routing_key, const AmqpClient::BasicMessage::ptr_t &message);

    void ack(const rabbitmq_envelope &envelope);
    void reject(const rabbitmq_envelope &envelope, bool requeue);

    AmqpClient::Channel::ptr_t channel;
    std::string tag;
    amqp queue;
    bool write;
    bool dead_lettering;
    unsigned generation = 0;
    std::mutex mut;

    concurrent_queue<pending_message> write_queue;
    std::atomic<bool> shutdown{false};
    std::thread write_thread;
};

}  // namespace grader::server
