#pragma once

#include <mysql.h>

#include <mutex>

#include "reporter.hpp"
#include "server/config.hpp"

namespace grader::sql {

/**
 * @brief 存储在 MySQL 表 grading_results 中的评分结果
 * (submission_id, task_id, kind) 上的唯一索引配合 INSERT IGNORE 保证幂等
 * 一个连接被所有 worker 共享，操作之间互斥
 */
struct mysql_result_store : result_store {
    /**
     * @throw persistence_error 无法连接数据库或无法创建表
     */
    explicit mysql_result_store(const server::database &dbcfg);
    ~mysql_result_store();

    bool save(const result_record &record) override;
    std::vector<result_record> find(const std::string &submission_id) override;

private:
    void connect();

    /**
     * @brief 连接断开时重新连接
     */
    void ensure_connected();

    void execute(const std::string &sql);
    std::string escape(const std::string &value);

    server::database dbcfg;
    MYSQL *con = nullptr;
    std::mutex mut;
};

}  // namespace grader::sql
