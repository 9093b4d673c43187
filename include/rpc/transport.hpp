#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include "rpc/message.hpp"

namespace grader::rpc {

/**
 * @brief 取消标记
 * 每个未完成的调用持有一个，取消后轮询会尽快停止并返回 cancelled。
 * 取消不会中断被调用方正在执行的操作。
 */
struct cancellation_token {
    void cancel();

    bool cancelled() const;

    /**
     * @brief 等待 duration，期间被取消时提前返回
     * @return 是否已经被取消
     */
    bool wait_for(std::chrono::milliseconds duration);

private:
    std::atomic<bool> flag{false};
    std::mutex mut;
    std::condition_variable cond;
};

/**
 * @brief RPC 传输层
 * 调用方通过 submit 投递请求，被调用方异步执行并以请求 id 为键保存结果，
 * 调用方通过 fetch 轮询直到状态不再是 wait。
 * 所有方法都可能被多个线程同时调用，对同一个 id 的多次 fetch 是幂等的。
 * 传输层的错误（连接被拒绝、响应格式错误）以 network_error 抛出。
 */
struct transport {
    virtual ~transport();

    /**
     * @brief 投递请求，不等待执行结果
     * @throw network_error 如果请求无法送达
     */
    virtual void submit(const request &req) = 0;

    /**
     * @brief 查询请求的结果
     * @return 请求未完成时返回 wait
     * @throw network_error 如果结果无法获取或者格式错误
     */
    virtual response fetch(const std::string &id) = 0;

    /**
     * @brief 同步调用，阻塞直到被调用方返回或者超时
     * @return 超时时返回 timeout
     * @throw network_error 如果请求无法送达
     */
    virtual response invoke(const request &req, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 调用方不再需要这个请求的结果，释放保存的结果
     */
    virtual void release(const std::string &id) = 0;
};

}  // namespace grader::rpc
