#pragma once

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "rpc/service.hpp"
#include "rpc/transport.hpp"

namespace grader::rpc {

/**
 * @brief 进程内的传输层
 * 每个端点 (service, shard) 有一个请求队列和若干执行线程，语义和消息队列传输层相同。
 * 用于单进程部署和测试，支持模拟端点断开连接。
 */
struct local_transport : public transport {
    ~local_transport() override;

    /**
     * @brief 为端点 (service_name, shard) 提供服务
     * @param handler 方法表，生命周期必须长于这个传输层，或者在销毁前调用 stop
     * @param threads 同时执行请求的线程数
     */
    void serve(const std::string &service_name, int shard, service &handler, size_t threads = 1);

    /**
     * @brief 模拟端点断开连接
     * 断开期间投递和轮询都会抛出 network_error，
     * 断开前收到的请求如果还没执行就会丢失，正在执行的请求的结果也会丢失。
     */
    void disconnect(const std::string &service_name, int shard);

    /**
     * @brief 恢复端点的连接，之前丢失的请求不会恢复
     */
    void reconnect(const std::string &service_name, int shard);

    /**
     * @brief 停止所有端点的执行线程
     */
    void stop();

    void submit(const request &req) override;
    response fetch(const std::string &id) override;
    response invoke(const request &req, std::chrono::milliseconds timeout) override;
    void release(const std::string &id) override;

private:
    typedef std::pair<std::string, int> endpoint_key;

    struct envelope {
        request req;
        unsigned generation;
    };

    struct endpoint {
        service *handler;
        concurrent_queue<envelope> inbox;
        std::vector<std::thread> threads;
        bool connected = true;

        /**
         * @brief 每次断开连接加一，旧连接上的请求和结果都会被丢弃
         */
        unsigned generation = 0;
    };

    struct pending_result {
        endpoint_key owner;
        unsigned generation;
        response resp;
    };

    std::mutex mut;
    std::condition_variable cond;
    std::map<endpoint_key, std::unique_ptr<endpoint>> endpoints;
    std::map<std::string, pending_result> results;

    void run_endpoint(endpoint &ep);
    endpoint &connected_endpoint(const endpoint_key &key);
};

}  // namespace grader::rpc
