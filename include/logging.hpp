#pragma once

#include <boost/log/trivial.hpp>
#include <string>

std::string LOG_PREFIX(const char *file, int line, const char *function);
void LOG_BEGIN(const std::string &prefix);
void LOG_END();

/**
 * @brief 初始化 Boost.Log
 * 总是输出到控制台；如果 log_dir 不为空，同时输出到 log_dir 下按大小和日期滚动的日志文件
 * @param file_pattern 日志文件名模式，如 grader_%d_%m_%Y.%N.log
 */
void init_logging(const std::string &log_dir, const std::string &file_pattern, bool debug);

#define LOG_DEBUG BOOST_LOG_TRIVIAL(debug) << LOG_PREFIX(__FILE__, __LINE__, __FUNCTION__)
#define LOG_INFO BOOST_LOG_TRIVIAL(info) << LOG_PREFIX(__FILE__, __LINE__, __FUNCTION__)
#define LOG_WARN BOOST_LOG_TRIVIAL(warning) << LOG_PREFIX(__FILE__, __LINE__, __FUNCTION__)
#define LOG_ERROR BOOST_LOG_TRIVIAL(error) << LOG_PREFIX(__FILE__, __LINE__, __FUNCTION__)
#define LOG_FATAL BOOST_LOG_TRIVIAL(fatal) << LOG_PREFIX(__FILE__, __LINE__, __FUNCTION__)
