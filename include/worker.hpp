#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include "metrics.hpp"
#include "monitor/monitor.hpp"
#include "reporter.hpp"
#include "retry.hpp"
#include "sandbox/sandbox.hpp"
#include "server/job_queue.hpp"

/**
 * 评分 worker 相关函数
 * 每个 worker 持有自己的消息队列连接，每次只从消息队列取一个任务（prefetch 为 1），
 * 因此同一时刻执行的沙箱数量不超过 worker 数量。worker 之间不共享任务，由消息队列决定
 * 哪个 worker 获得哪个任务。
 *
 * 一个任务的处理顺序：
 * 1. 解析消息，格式错误的消息直接转入死信队列
 * 2. 运行沙箱，所有启动错误在这里被转换为 InfraError
 * 3. InfraError 且未超过最大尝试次数：延迟重新发布下一次尝试，确认当前消息
 * 4. InfraError 且已超过最大尝试次数：记录永久基础设施错误，拒绝消息使其进入死信队列
 * 5. 其他结果：记录结果后确认消息
 * 记录结果失败时不确认消息，由消息队列重新投递。
 */
namespace grader {

struct worker_pool {
    /**
     * @brief 为某个 worker 创建消息队列连接
     */
    using queue_factory = std::function<std::unique_ptr<server::job_queue>(int worker_id)>;

    worker_pool(queue_factory factory, sandbox::sandbox &executor, result_reporter &reporter, grading_metrics &metrics, const retry_policy &policy);
    ~worker_pool();

    /**
     * @brief 注册监控器，必须在 start 之前调用
     */
    void register_monitor(std::unique_ptr<monitor> &&monitor);

    /**
     * @brief 启动 count 个 worker 线程
     */
    void start(int count);

    /**
     * @brief 停止所有的 worker
     * worker 不再拉取新任务，执行完当前任务后退出
     */
    void stop();

    /**
     * @brief 等待所有 worker 退出
     */
    void join();

    /**
     * @brief 通知所有监控器评分系统被中断
     */
    void interrupt();

    int running_workers() const;

    /**
     * @brief 处理一个投递，保证在返回前确认或拒绝该投递
     * @param queue 投递所属的消息队列，用于发布重试
     */
    void process(int worker_id, server::job_queue &queue, server::delivery &delivery);

private:
    void worker_loop(int worker_id);

    /**
     * @brief 运行沙箱，将沙箱抛出的所有异常转换为 launch_error
     */
    execution_result run_sandbox(const job_message &message);

    void call_monitor(int worker_id, const std::function<void(monitor &)> &callback);

    queue_factory factory;
    sandbox::sandbox &executor;
    result_reporter &reporter;
    grading_metrics &metrics;
    retry_policy policy;

    std::vector<std::unique_ptr<monitor>> monitors;
    std::vector<std::thread> threads;
    std::atomic<bool> running{false};
    std::atomic<int> workers{0};
};

}  // namespace grader
