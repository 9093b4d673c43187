#pragma once

#include <atomic>
#include <memory>
#include "evaluation/job.hpp"
#include "evaluation/operation.hpp"
#include "evaluation/outcome.hpp"
#include "rpc/service.hpp"
#include "sandbox/sandbox.hpp"
#include "store/object_store.hpp"

/**
 * 评测 worker
 * 每个 worker 进程对应一个 shard，通过 RPC 接收评测协调器分发的操作。
 *
 * worker 不关心提交、数据集等概念，只负责执行 job：从对象存储取出 job 需要的
 * 所有文件放入沙箱，运行命令后把标准输出、标准错误以及产生的文件写回对象存储，
 * 以摘要的形式返回给评测协调器。
 *
 * 对外提供的 RPC 方法（服务名 Worker）：
 *     execute_operation {operation, attempt, job} -> outcome
 *     ping {} -> {shard, running}
 *     precache_files {digests} -> {cached}
 */
namespace grader {

struct worker {
    /**
     * @param concurrency 同时执行的操作数上限，超出时拒绝请求
     */
    worker(int shard, store::object_store &objects, sandbox &box, size_t concurrency = 1);

    /**
     * @brief 执行一个操作
     * 沙箱错误、对象存储读取失败都会返回 SANDBOX_ERROR，由评测协调器决定是否重试
     */
    outcome execute_operation(const operation &op, unsigned long long attempt, const job &j);

    /**
     * @brief 预先把文件拉取到本地缓存
     * @return 成功缓存的文件数
     */
    size_t precache_files(const std::vector<std::string> &digests);

    rpc::service &rpc_service();

    int shard() const;

    size_t running() const;

private:
    int worker_shard;
    store::object_store &objects;
    sandbox &box;
    size_t concurrency;
    std::atomic<size_t> running_operations{0};
    std::unique_ptr<rpc::service> svc;
};

}  // namespace grader
