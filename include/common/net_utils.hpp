#pragma once

#include <filesystem>
#include <string>

namespace grader::net {

/**
 * @brief 将文件从 url 下载到本地路径 path
 * @param url 要下载的文件的网络地址
 * @param path 下载文件的保存路径
 * @param connect_timeout 最大限制请求时间，单位为秒
 * @throw network_error 下载失败或者服务器返回错误状态码
 */
void download_file(const std::string &url, const std::filesystem::path &path, double connect_timeout = 10.0);

}  // namespace grader::net
