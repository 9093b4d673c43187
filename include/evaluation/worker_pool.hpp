#pragma once

#include <chrono>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>
#include "evaluation/operation.hpp"
#include "rpc/transport.hpp"

namespace grader {

/**
 * @brief 一个已经派发给 worker、还没有收到结果的操作
 */
struct dispatch_entry {
    operation op;

    /**
     * @brief 派发编号，全局单调递增，用于区分同一个操作的不同次派发
     */
    unsigned long long attempt = 0;

    std::chrono::system_clock::time_point dispatched_at;

    /**
     * @brief 轮询的取消标记，worker 断开连接时取消
     */
    std::shared_ptr<rpc::cancellation_token> token;

    /**
     * @brief 提交被重新评测后，旧的操作被标记为过期，其结果会被忽略
     */
    bool stale = false;
};

struct worker_record {
    int shard = 0;

    bool connected = false;

    /**
     * @brief 为假时不再派发新的操作，但不会中断正在执行的操作
     */
    bool enabled = true;

    /**
     * @brief 同时执行的操作数上限
     */
    size_t capacity = 1;

    /**
     * @brief 正在执行的操作，按派发顺序排列
     */
    std::list<dispatch_entry> operations;

    /**
     * @brief 进入当前连接状态的时间
     */
    std::chrono::system_clock::time_point since;

    /**
     * @brief 是否可以接收新的操作
     */
    bool can_accept() const;
};

/**
 * @brief worker 的注册表
 * 不加锁，由 evaluation_service 串行化所有访问
 */
struct worker_pool {
    /**
     * @brief 注册 worker，初始状态为未连接、已启用
     */
    void add_worker(int shard, size_t capacity);

    bool contains(int shard) const;

    /**
     * @throw std::invalid_argument 如果 worker 不存在
     */
    worker_record &at(int shard);
    const worker_record &at(int shard) const;

    std::vector<int> shards() const;

    /**
     * @brief 指纹相同的操作是否正在执行（不包括过期的操作）
     */
    bool in_flight(const fingerprint &fp) const;

    /**
     * @brief 记录派发，必须在发出 RPC 之前调用
     */
    dispatch_entry &record(int shard, const operation &op, unsigned long long attempt);

    /**
     * @brief 删除并返回派发记录
     * @return 没有匹配的记录（结果已经过期）时返回空
     */
    std::optional<dispatch_entry> release(int shard, const fingerprint &fp, unsigned long long attempt);

    /**
     * @brief 标记 worker 为已连接
     * @return 之前是否未连接
     */
    bool connect(int shard);

    /**
     * @brief 标记 worker 为断开，并取出所有正在执行的操作
     */
    std::vector<dispatch_entry> disconnect(int shard);

    /**
     * @return 状态是否改变
     */
    bool enable(int shard);

    /**
     * @return 状态是否改变
     */
    bool disable(int shard);

    /**
     * @brief 将满足条件的正在执行的操作标记为过期
     * @return 标记的操作数
     */
    size_t mark_stale(const std::function<bool(const operation &)> &pred);

    /**
     * @brief 所有 worker 上正在执行的操作数（包括过期的操作）
     */
    size_t total_in_flight() const;

    /**
     * @brief worker 状态的快照，shard -> {connected, enabled, operations, start_time}
     */
    nlohmann::json status() const;

private:
    std::map<int, worker_record> workers;
};

}  // namespace grader
