#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "sandbox/sandbox.hpp"
#include "server/config.hpp"

namespace grader::sandbox {

/**
 * @brief 通过兼容 docker 命令行的容器运行时执行任务
 * 每个任务的临时目录结构：
 * run_dir/grader-<uuid>/
 *   workspace/  可写工作目录，挂载到容器 /workspace
 *   bundle      下载得到的输入包（仅当输入为 http(s) 地址）
 *   cid         运行时写入的容器 id
 * 标准输出和标准错误通过管道读取，只保留 output_limit 字节，不落盘。
 */
struct container_sandbox : sandbox {
    explicit container_sandbox(const server::sandbox_config &config);

    execution_result run(const job_message &message) override;

    /**
     * @brief 生成 runtime run 的完整参数
     */
    std::vector<std::string> run_arguments(const job_descriptor &job, const std::string &name, const std::optional<std::filesystem::path> &bundle, const std::filesystem::path &workspace, const std::filesystem::path &cidfile) const;

private:
    /**
     * @brief 准备输入包，远程输入包会被下载到 staging 目录
     * @return 输入包的本地路径，任务没有输入包时为空
     * @throw launch_failure
     */
    std::optional<std::filesystem::path> stage_input(const job_descriptor &job, const std::filesystem::path &staging) const;

    /**
     * @brief 查询容器是否真正启动过
     * 运行时自身出错和被测程序的退出码可能相同（125、126、127），需要根据容器状态区分
     * @return 容器没有被创建或者没有启动时返回原因
     */
    std::optional<std::string> launch_error(const std::filesystem::path &cidfile) const;

    /**
     * @brief 删除容器和临时目录，不抛出异常
     */
    void cleanup(const std::string &name, const std::filesystem::path &staging) const noexcept;

    server::sandbox_config config;
};

}  // namespace grader::sandbox
