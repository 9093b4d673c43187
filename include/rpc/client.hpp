#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "rpc/transport.hpp"

namespace grader::rpc {

/**
 * @brief 一次异步调用的句柄
 */
struct call_handle {
    std::string id;
    std::shared_ptr<cancellation_token> token;

    /**
     * @brief 调用的最终结果，不会是 wait
     */
    std::shared_future<response> result;
};

/**
 * @brief RPC 调用方
 * 每个未完成的异步调用由一个线程负责投递和轮询，结果通过 future 返回。
 * 传输层的错误会被转换为 fail 响应，调用方只需要处理一种失败路径。
 */
struct client {
    explicit client(transport &t, std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500));

    /**
     * @brief 取消所有未完成的调用并等待轮询线程退出
     */
    ~client();

    /**
     * @brief 异步调用
     * @param timeout 最长等待时间，超时后返回 timeout
     * @param on_complete 得到结果后在轮询线程中调用，先于 future 就绪
     * @param token 调用方持有的取消标记，为空时新建一个
     */
    call_handle call(const std::string &service, int shard, const std::string &method, const nlohmann::json &arguments,
                     std::chrono::milliseconds timeout, std::function<void(const response &)> on_complete = nullptr,
                     std::shared_ptr<cancellation_token> token = nullptr);

    /**
     * @brief 同步调用，不轮询，阻塞直到被调用方返回或者超时
     */
    response call_sync(const std::string &service, int shard, const std::string &method, const nlohmann::json &arguments,
                       std::chrono::milliseconds timeout);

    /**
     * @brief 未完成的异步调用数量
     */
    size_t outstanding();

private:
    transport &t;
    std::chrono::milliseconds poll_interval;

    std::mutex mut;
    std::map<std::string, std::pair<std::thread, std::shared_ptr<cancellation_token>>> calls;
    std::vector<std::string> finished;

    response poll(const request &req, std::chrono::milliseconds timeout, cancellation_token &token);
    void join_finished(std::unique_lock<std::mutex> &lock);
};

}  // namespace grader::rpc
