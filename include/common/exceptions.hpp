#pragma once

#include <boost/exception/all.hpp>
#include <sstream>
#include <stdexcept>
#include <string>

namespace grader {

/**
 * @brief 评分系统所有异常的基类
 * 支持通过 << 拼接错误信息，配合 BOOST_THROW_EXCEPTION 记录抛出位置
 * @code
 * BOOST_THROW_EXCEPTION(invalid_job() << "missing field " << name);
 * @endcode
 */
struct grader_exception : virtual boost::exception, virtual std::exception {
    grader_exception() noexcept;
    explicit grader_exception(const std::string &what) noexcept;
    grader_exception(const grader_exception &other);

    const char *what() const noexcept override;

    template <typename T>
    grader_exception &operator<<(const T &value) {
        std::ostringstream ss;
        ss << value;
        message += ss.str();
        return *this;
    }

protected:
    std::string message;
};

/**
 * @brief 消息队列无法连接，或者发布消息未被确认
 * 调用方应当稍后重试
 */
struct broker_unavailable : grader_exception {
    using grader_exception::grader_exception;

    template <typename T>
    broker_unavailable &operator<<(const T &value) {
        grader_exception::operator<<(value);
        return *this;
    }
};

/**
 * @brief 沙箱本身启动失败（容器运行时、挂载、下载输入包等）
 * 与被测程序无关，可以重试
 */
struct launch_failure : grader_exception {
    using grader_exception::grader_exception;

    template <typename T>
    launch_failure &operator<<(const T &value) {
        grader_exception::operator<<(value);
        return *this;
    }
};

/**
 * @brief 评测结果写入数据库失败
 * 出现该异常时消息不能被确认，从而让消息队列重新投递
 */
struct persistence_error : grader_exception {
    using grader_exception::grader_exception;

    template <typename T>
    persistence_error &operator<<(const T &value) {
        grader_exception::operator<<(value);
        return *this;
    }
};

/**
 * @brief 任务描述格式不正确，无法评测
 */
struct invalid_job : grader_exception {
    using grader_exception::grader_exception;

    template <typename T>
    invalid_job &operator<<(const T &value) {
        grader_exception::operator<<(value);
        return *this;
    }
};

struct configuration_error : grader_exception {
    using grader_exception::grader_exception;

    template <typename T>
    configuration_error &operator<<(const T &value) {
        grader_exception::operator<<(value);
        return *this;
    }
};

struct network_error : grader_exception {
    using grader_exception::grader_exception;

    template <typename T>
    network_error &operator<<(const T &value) {
        grader_exception::operator<<(value);
        return *this;
    }
};

}  // namespace grader
