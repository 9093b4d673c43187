#pragma once

#include <functional>
#include <map>
#include <string>
#include "rpc/message.hpp"

namespace grader::rpc {

/**
 * @brief 被调用方的方法表
 * 方法抛出的异常会被转换为 fail 响应，错误信息放在 data.error 中。
 */
struct service {
    typedef std::function<nlohmann::json(const nlohmann::json &)> method;

    explicit service(const std::string &name);

    /**
     * @brief 注册方法，同名方法会被覆盖
     */
    void bind(const std::string &method_name, method handler);

    /**
     * @brief 执行请求对应的方法
     * 这个函数不会抛出异常
     */
    response handle(const request &req);

    const std::string &name() const;

private:
    std::string service_name;
    std::map<std::string, method> methods;
};

}  // namespace grader::rpc
