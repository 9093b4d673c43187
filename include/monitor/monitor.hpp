#pragma once

#include <string>
#include "evaluation/operation.hpp"
#include "evaluation/outcome.hpp"
#include "evaluation/submission_result.hpp"

namespace grader {

enum class worker_state {
    /**
     * @brief worker 响应了心跳
     */
    CONNECTED,

    /**
     * @brief worker 没有响应心跳，正在执行的操作已经重新入队
     */
    DISCONNECTED,

    /**
     * @brief 管理员允许 worker 接收新的操作
     */
    ENABLED,

    /**
     * @brief worker 不再接收新的操作，可能是管理员禁用或者操作超时
     */
    DISABLED
};

const char *get_display_message(worker_state);

/**
 * @brief 执行监控行为
 * 所有回调都在 evaluation_service 持有锁时调用，实现不能阻塞太久，也不能回调 evaluation_service
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报一个操作已经派发给 worker
     * @param shard 执行操作的 worker 编号
     * @param attempt 派发编号，每次派发都不同
     */
    virtual void operation_dispatched(int shard, const operation &op, unsigned long long attempt);

    /**
     * @brief 监控上报一个操作已经完成
     * @param result 操作的结果，传输层错误也会转换为 SANDBOX_ERROR 的结果
     */
    virtual void operation_finished(int shard, const operation &op, const outcome &result);

    /**
     * @brief 监控上报评测状态发生了变化
     */
    virtual void result_state_changed(const submission_result &result);

    /**
     * @brief 监控上报当前某个 Worker 的状态
     * @param shard Worker 编号
     * @param state Worker 的新状态
     * @param information 状态变化的原因，用于日志记录
     */
    virtual void worker_state_changed(int shard, worker_state state, const std::string &information);

    /**
     * @brief 上报需要管理员处理的错误
     */
    virtual void report_error(const std::string &message);
};

/**
 * @brief 将监控信息写入日志
 */
struct log_monitor : public monitor {
    void operation_dispatched(int shard, const operation &op, unsigned long long attempt) override;
    void operation_finished(int shard, const operation &op, const outcome &result) override;
    void result_state_changed(const submission_result &result) override;
    void worker_state_changed(int shard, worker_state state, const std::string &information) override;
    void report_error(const std::string &message) override;
};

}  // namespace grader
