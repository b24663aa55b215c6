#pragma once

#include <filesystem>
#include <optional>

#include "common/json_utils.hpp"
#include "retry.hpp"

namespace grader::server {

/**
 * @brief 表示一个需要登录的服务配置
 */
struct login {
    /**
     * @brief 某个服务的访问用户名
     */
    std::string username;

    /**
     * @brief 某个服务的访问密码
     */
    std::string password;
};

void from_json(const nlohmann::json &j, login &log);

/**
 * @brief 描述一个 AMQP 消息队列的配置数据结构
 */
struct amqp {
    /**
     * @brief AMQP 消息队列的地址
     */
    std::string uri;

    /**
     * @brief 通过该结构体发送的消息的 Exchange 名
     */
    std::string exchange;

    /**
     * @brief Exchange 类型，可选 direct, topic, fanout
     */
    std::string exchange_type;

    /**
     * @brief AMQP 消息队列的队列名
     * 重试队列为 <queue>.retry，死信队列为 <queue>.dead
     */
    std::string queue;

    /**
     * @brief AMQP 消息队列的 Routing Key
     */
    std::string routing_key;

    /**
     * @brief 每个消费者预取的消息数
     * 评分任务要求为 1，保证一个 worker 同时只持有一个投递
     */
    int concurrency;

    /**
     * @brief 连接或发布失败时的重试次数，超过后报告 broker_unavailable
     */
    int retries;
};

void from_json(const nlohmann::json &j, amqp &mq);

/**
 * @brief 描述一个 MySQL 数据库连接信息
 */
struct database : login {
    /**
     * @brief 数据库服务器的地址
     */
    std::string host;

    /**
     * @brief 数据库服务器端口
     */
    unsigned int port = 0;

    /**
     * @brief 使用连接到的数据库服务器的哪一个数据库
     */
    std::string database;

    /**
     * @brief 连接超时（单位为秒）
     */
    int connect_timeout = 5;
};

void from_json(const nlohmann::json &j, database &db);

/**
 * @brief 沙箱执行器配置
 */
struct sandbox_config {
    /**
     * @brief 兼容 docker 命令行的容器运行时
     */
    std::string runtime = "docker";

    /**
     * @brief 存放每个任务临时工作目录的根目录
     */
    std::filesystem::path run_dir = "/tmp/grading-system";

    /**
     * @brief 标准输出和标准错误各自最多保留的字节数
     */
    std::size_t output_limit = 64 * 1024;

    /**
     * @brief 超时后等待容器退出的宽限时间（单位为秒）
     */
    double kill_grace = 0.5;

    /**
     * @brief 下载远程输入包的时限（单位为秒）
     */
    double download_timeout = 30.0;

    /**
     * @brief 容器网络，默认没有网络
     */
    std::string network = "none";

    /**
     * @brief 在容器内以哪个用户运行，为空时使用镜像默认用户
     */
    std::string user;

    /**
     * @brief 任务描述没有给出资源限制时使用的限制，由 grader-submit 填入任务
     */
    resource_limits default_limits;
};

void from_json(const nlohmann::json &j, sandbox_config &config);

struct grader_config {
    /**
     * @brief 评分任务队列
     */
    amqp job_queue;

    /**
     * @brief 评分完成后推送结果的队列，可选
     */
    std::optional<amqp> report_queue;

    database db;

    sandbox_config sandbox;

    retry_policy retry;
};

void from_json(const nlohmann::json &j, grader_config &config);

/**
 * @brief 读取并解析配置文件
 * @throw configuration_error 文件不存在或格式错误
 */
grader_config load_config(const std::filesystem::path &path);

}  // namespace grader::server
