#pragma once

#include <mutex>
#include <string>
#include "SimpleAmqpClient/SimpleAmqpClient.h"
#include "rpc/config.hpp"

namespace grader::rpc {

/**
 * @brief 与消息队列交互的类
 * AMQP 的 channel 不是线程安全的，每个线程应当持有自己的 rabbitmq 对象。
 */
struct rabbitmq {
    /**
     * @brief 只发送消息的连接
     */
    explicit rabbitmq(const amqp &amqp);

    /**
     * @brief 监听队列 queue 的连接，队列以 routing_key 绑定到 exchange 上
     */
    rabbitmq(const amqp &amqp, const std::string &queue, const std::string &routing_key);

    /**
     * @brief 从队列中取出一条消息
     * @param timeout 等待时间，单位毫秒
     * @return 是否取到了消息
     * @throw network_error 如果多次重连仍然失败
     */
    bool fetch(AmqpClient::Envelope::ptr_t &envelope, int timeout);

    void ack(const AmqpClient::Envelope::ptr_t &envelope);

    /**
     * @brief 发送消息到 exchange
     * @throw network_error 如果消息无法送达
     */
    void publish(const std::string &routing_key, const std::string &message);

private:
    void connect();

    AmqpClient::Channel::ptr_t channel;
    amqp config;
    std::string queue;
    std::string routing_key;
    bool write;
    std::mutex mut;
};

}  // namespace grader::rpc
