#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace grader::rpc {

/**
 * @brief 描述一个 AMQP 消息队列的配置数据结构
 */
struct amqp {
    /**
     * @brief AMQP 消息队列的主机地址
     */
    std::string hostname = "localhost";

    /**
     * @brief AMQP 消息队列的主机端口
     */
    int port = 5672;

    std::string username = "guest";

    std::string password = "guest";

    /**
     * @brief 请求发送到的 Exchange 名，routing key 为 <service>.<shard>
     */
    std::string exchange = "grader.rpc";

    /**
     * @brief Exchange 类型，可选 direct, topic, fanout
     */
    std::string exchange_type = "direct";
};

void from_json(const nlohmann::json &j, amqp &mq);

/**
 * redis 的登录情况
 */
struct redis {
    /**
     * @brief redis 服务器地址
     */
    std::string host = "localhost";

    /**
     * @brief redis 服务器端口
     */
    int port = 6379;

    /**
     * @brief 重试时间间隔，单位毫秒
     */
    unsigned retry_interval = 1000;

    /**
     * @brief 密码，若不为空，则使用该密码登录
     */
    std::string password;

    /**
     * @brief 调用结果的保存时间，单位秒
     */
    int result_ttl = 3600;
};

void from_json(const nlohmann::json &j, redis &redis_config);

}  // namespace grader::rpc
