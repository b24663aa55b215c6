#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace grader {

inline bool exists(const nlohmann::json &j, const std::string &key) {
    return j.find(key) != j.end();
}

/**
 * @brief 若 key 存在则赋值，否则保持默认值
 */
template <typename T>
void assign_optional(const nlohmann::json &j, T &value, const std::string &key) {
    if (exists(j, key) && !j.at(key).is_null())
        j.at(key).get_to(value);
}

template <typename T>
void assign_optional(const nlohmann::json &j, std::optional<T> &value, const std::string &key) {
    if (exists(j, key) && !j.at(key).is_null())
        value = j.at(key).get<T>();
}

/**
 * @brief 非 UTF-8 的字符串无法写入 json，需要替换
 */
std::string ensure_utf8(const std::string &str);

}  // namespace grader
