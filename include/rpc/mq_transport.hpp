#pragma once

#include <atomic>
#include <thread>
#include <vector>
#include "rpc/config.hpp"
#include "rpc/rabbitmq.hpp"
#include "rpc/redis.hpp"
#include "rpc/service.hpp"
#include "rpc/transport.hpp"

namespace grader::rpc {

/**
 * @brief 基于消息队列的传输层（调用方）
 * 请求以 JSON 发布到 exchange，routing key 为 <service>.<shard>；
 * 被调用方把结果写到 Redis 的 rpc:<id>，并向列表 rpc:<id>:done 推入一个元素，
 * 同步调用通过 BLPOP 这个列表等待结果。
 */
struct mq_transport : public transport {
    mq_transport(const amqp &amqp_config, const redis &redis_config);

    void submit(const request &req) override;
    response fetch(const std::string &id) override;
    response invoke(const request &req, std::chrono::milliseconds timeout) override;
    void release(const std::string &id) override;

private:
    amqp amqp_config;
    redis redis_config;
    rabbitmq publisher;
    redis_conn results;
};

/**
 * @brief 基于消息队列的服务端
 * 监听队列 grader.rpc.<service>.<shard>，每个线程持有自己的 AMQP 连接。
 */
struct mq_server {
    mq_server(const amqp &amqp_config, const redis &redis_config);
    ~mq_server();

    /**
     * @brief 开始为 (handler.name(), shard) 提供服务
     * @param handler 方法表，生命周期必须长于 mq_server
     */
    void serve(int shard, service &handler, size_t threads = 1);

    /**
     * @brief 停止接收新的请求并等待正在执行的请求完成
     */
    void stop();

private:
    amqp amqp_config;
    redis redis_config;
    std::atomic<bool> stopping{false};
    std::vector<std::thread> threads;

    void consume(int shard, service &handler);
};

/**
 * @brief 端点的 routing key
 */
std::string routing_key_of(const std::string &service, int shard);

}  // namespace grader::rpc
