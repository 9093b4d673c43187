#pragma once

#include <cpp_redis/cpp_redis>
#include <functional>
#include <future>
#include <mutex>
#include <vector>
#include "rpc/config.hpp"

namespace grader::rpc {

/**
 * @brief 表示一个 Redis 连接
 */
struct redis_conn {
    /**
     * @brief 根据 Redis 配置初始化 Redis 服务器连接
     */
    void init(const redis &redis_config) noexcept;

    /**
     * @brief 在 callback 内发送 Redis 的操作
     * 该函数负责确保 Redis 连接会被建立。
     * 如果 Redis 服务器主动断开连接，那么这个函数将尝试重新创建连接，
     * 如果重试次数过多则抛出 network_error。
     * @param callback 你可以在 callback 内完成 Redis 的操作，并将 future 放入 replies 中
     * @return 最后一次成功执行时各个操作的结果，顺序和 replies 相同
     */
    std::vector<cpp_redis::reply> execute(std::function<void(cpp_redis::client &, std::vector<std::future<cpp_redis::reply>> &)> callback);

    /**
     * @brief 尝试重连
     * @param force 真时强制重连
     */
    void reconnect(bool force = false);

    const redis &config() const;

private:
    redis redis_config;
    cpp_redis::client redis_client;
    std::mutex mut;
};

}  // namespace grader::rpc
