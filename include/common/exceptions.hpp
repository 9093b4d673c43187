#pragma once

#include <boost/exception/exception.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

/**
 * @brief 评测系统所有异常的基类
 * 构造时会记录调用栈，便于在日志中定位问题
 */
struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    template <typename T>
    grader_exception operator<<(const T &t) const {
        return grader_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是违反了不变式，比如非法的状态转移
 */
struct internal_error : public grader_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示网络错误
 * RPC 传输层的所有错误（连接被拒绝、响应格式错误、消息队列断开）都归为此类
 */
struct network_error : public grader_exception {
    network_error();
    explicit network_error(const std::string &message);
};

/**
 * @brief 表示对象存储的错误，比如对象不存在或者无法读取
 */
struct store_error : public grader_exception {
    store_error();
    explicit store_error(const std::string &message);
};

/**
 * @brief 对象内容与其摘要不一致
 * 这种错误不能自动修复，只能交给管理员删除后重新上传
 */
struct corrupted_object_error : public store_error {
    const std::string digest;

    corrupted_object_error(const std::string &digest, const std::string &actual);
};

}  // namespace grader
