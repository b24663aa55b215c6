#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文件内容
 * @param path 文件路径
 * @param max_bytes 最多读取多少字节，超出部分截断并附加截断标记，小于等于 0 表示不限制
 */
std::string read_file_content(const std::filesystem::path &path, long max_bytes = -1);

/**
 * @brief 读取文件内容，文件不存在时返回默认值
 */
std::string read_file_content(const std::filesystem::path &path, const std::string &def, long max_bytes = -1);

/**
 * @brief 检查路径片段不会跳出所在目录，用于拼接提交 id、题目 id 等外部输入
 * @throw invalid_job 如果路径不安全
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 截断标记，被截断的输出末尾会追加该字符串
 */
extern const char *const TRUNCATED_MARKER;

}  // namespace grader
