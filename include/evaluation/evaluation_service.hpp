#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "evaluation/job.hpp"
#include "evaluation/operation_queue.hpp"
#include "evaluation/submission_store.hpp"
#include "evaluation/worker_pool.hpp"
#include "monitor/monitor.hpp"
#include "rpc/client.hpp"
#include "rpc/service.hpp"
#include "store/object_store.hpp"

namespace grader {

struct worker_config {
    int shard = 0;

    /**
     * @brief 该 worker 同时执行的操作数上限
     */
    size_t capacity = 1;
};

/**
 * @brief 评测协调器的配置，对应配置文件中的 evaluation 字段
 * 配置文件中的时间均以秒为单位
 */
struct evaluation_config {
    /**
     * @brief 编译最多执行的次数，只有基础设施错误才会计数
     */
    int max_compilation_tries = 3;

    /**
     * @brief 每个数据点评测最多执行的次数
     */
    int max_evaluation_tries = 3;

    int compilation_priority = 3;

    int evaluation_priority = 2;

    /**
     * @brief 单个操作在 worker 上执行的最长时间
     * 超时计为一次基础设施错误，并且该 worker 会被停用，直到管理员重新启用
     */
    std::chrono::milliseconds worker_timeout{600000};

    /**
     * @brief 心跳请求的超时时间
     */
    std::chrono::milliseconds heartbeat_timeout{10000};

    /**
     * @brief 检查 worker 连接状态的间隔
     */
    std::chrono::milliseconds connection_check_interval{10000};

    /**
     * @brief 扫描未完成提交的间隔
     */
    std::chrono::milliseconds jobs_not_done_interval{117000};

    /**
     * @brief 对象存储垃圾回收的间隔，为 0 时不进行垃圾回收
     */
    std::chrono::seconds gc_interval{0};

    std::vector<worker_config> workers;
};

void from_json(const nlohmann::json &j, worker_config &config);
void from_json(const nlohmann::json &j, evaluation_config &config);

/**
 * @brief 评测协调器
 * 负责接收新提交、维护操作队列、将操作分发给 worker，并根据 worker 返回的
 * 结果推进 submission_result 的状态机。
 *
 * 每个 worker 有一个独立的分发线程，分发线程从操作队列中取出优先级最高的操作，
 * 记录到 worker_pool 后通过 RPC 异步调用 worker 的 execute_operation 方法。
 * RPC 的结果由 rpc::client 的轮询线程回调 operation_finished 处理。
 *
 * 所有可变状态（操作队列、worker_pool、结果缓存）都由同一个互斥锁保护，
 * RPC 调用本身不在锁内进行。
 */
struct evaluation_service {
    evaluation_service(const evaluation_config &config, submission_store &submissions, rpc::client &client,
                       store::object_store *objects = nullptr);

    ~evaluation_service();

    /**
     * @brief 注册监控器，必须在 start 之前调用
     */
    void register_monitor(std::unique_ptr<monitor> &&monitor);

    /**
     * @brief 启动分发线程和维护线程
     * 启动时会检查一次所有 worker 的连接状态，并扫描一次未完成的提交
     */
    void start();

    /**
     * @brief 停止所有线程，取消所有正在执行的 RPC 调用并等待回调结束
     */
    void stop();

    /**
     * @brief 新提交到达，为需要评测的每个数据集加入编译操作
     * @return 加入操作队列的操作数
     * @throw std::invalid_argument 如果提交不存在
     */
    size_t new_submission(const std::string &submission_id);

    /**
     * @brief 使提交的结果失效并重新评测
     * @param dataset_id 为空时表示该提交需要评测的所有数据集
     * @param level "compilation" 表示重新编译，"evaluation" 表示保留编译结果重新评测
     * @return 加入操作队列的操作数
     * @throw std::invalid_argument 如果 level 非法或者提交不存在
     */
    size_t invalidate_submission(const std::string &submission_id, const std::optional<std::string> &dataset_id,
                                 const std::string &level);

    /**
     * @brief 扫描所有提交，为未完成的结果补充缺失的操作
     * 用于启动时恢复以及定期修复丢失的操作
     * @return 加入操作队列的操作数
     */
    size_t search_jobs_not_done();

    /**
     * @brief 按分发顺序列出操作队列
     */
    nlohmann::json queue_status();

    nlohmann::json workers_status();

    /**
     * @brief 统计每种状态的结果数
     */
    nlohmann::json submissions_status();

    /**
     * @brief 启用 worker
     * @return 状态是否发生变化
     * @throw std::invalid_argument 如果 worker 不存在
     */
    bool enable_worker(int shard);

    /**
     * @brief 停用 worker，不再分发新操作
     * 正在执行的操作不会被抢占，完成后照常处理结果
     * @return 状态是否发生变化
     * @throw std::invalid_argument 如果 worker 不存在
     */
    bool disable_worker(int shard);

    /**
     * @brief 向所有 worker 发送心跳，更新连接状态
     * 失去连接的 worker 上的操作会重新加入队列，不计入重试次数
     */
    void check_connections();

    /**
     * @brief worker 失去连接
     */
    void worker_disconnected(int shard, const std::string &reason);

    /**
     * @brief 尝试向 worker 分发一个操作
     * @return 是否分发了操作
     */
    bool dispatch_one(int shard);

    /**
     * @brief 处理 worker 返回的操作结果
     * 如果这个结果对应的分发记录已经不存在或者已经过时，结果会被丢弃
     */
    void operation_finished(int shard, const fingerprint &fp, unsigned long long attempt, const rpc::response &resp);

    /**
     * @brief 等待操作队列为空且没有正在执行的操作
     * @return 超时前是否达到空闲状态
     */
    bool wait_idle(std::chrono::milliseconds timeout);

    std::optional<submission_result> result(const std::string &submission_id, const std::string &dataset_id);

    /**
     * @brief 管理接口，服务名为 EvaluationService
     */
    rpc::service &admin_service();

private:
    evaluation_config config;
    submission_store &submissions;
    rpc::client &client;
    store::object_store *objects;

    std::vector<std::unique_ptr<monitor>> monitors;

    std::mutex mut;
    std::condition_variable cond;
    operation_queue queue;
    worker_pool pool;
    std::map<std::pair<std::string, std::string>, submission_result> results;
    unsigned long long next_attempt = 0;
    size_t outstanding_calls = 0;
    bool stopping = false;
    bool started = false;

    std::vector<std::thread> dispatchers;
    std::thread housekeeper;
    std::mutex stop_mut;
    std::condition_variable stop_cond;

    std::unique_ptr<rpc::service> admin;

    void call_monitor(const std::function<void(monitor &)> &callback);
    void report_error(const std::string &message);

    void dispatch_loop(int shard);
    void housekeeping_loop();

    // 以下函数的调用者必须持有 mut
    submission_result &load(const std::string &submission_id, const std::string &dataset_id);
    void save(const submission_result &result);
    void transition(submission_result &result, result_state next);
    bool enqueue(const operation &op);
    size_t admit(submission_result &result);
    void abandon(submission_result &result, operation_type type);
    void score(submission_result &result);
    void compilation_finished(submission_result &result, const operation &op, int shard, const outcome &res);
    void evaluation_finished(submission_result &result, const operation &op, int shard, const outcome &res);
    job build_job(const operation &op);
    size_t judge_submission(const submission &submit);
    void disconnect_locked(int shard, const std::string &reason);
};

}  // namespace grader
