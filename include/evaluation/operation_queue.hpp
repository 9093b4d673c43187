#pragma once

#include <functional>
#include <map>
#include <set>
#include <vector>
#include "evaluation/operation.hpp"

namespace grader {

/**
 * @brief 待执行操作的优先队列
 * 优先级高的先出队，优先级相同时先入队的先出队（入队时间相同时按插入顺序）。
 * 同一个指纹的操作在队列中至多存在一个，重复入队会被忽略。
 *
 * 队列本身不加锁，由 evaluation_service 用保护 worker 状态的同一把锁串行化所有访问。
 */
struct operation_queue {
    /**
     * @brief 操作入队
     * @return 是否入队，队列中已有相同指纹的操作时返回 false
     */
    bool enqueue(const operation &op);

    /**
     * @brief 弹出优先级最高的操作
     * @return 队列为空时返回 false
     */
    bool pop_next(operation &op);

    /**
     * @brief 按出队顺序返回队列中所有操作的快照
     */
    std::vector<operation> peek_all() const;

    bool contains(const fingerprint &fp) const;

    /**
     * @brief 删除指定指纹的操作
     * @return 操作是否在队列中
     */
    bool remove(const fingerprint &fp);

    /**
     * @brief 删除满足条件的所有操作
     * @return 删除的操作数
     */
    size_t remove_if(const std::function<bool(const operation &)> &pred);

    size_t size() const;

    bool empty() const;

private:
    struct entry {
        operation op;
        unsigned long long sequence;
    };

    struct entry_order {
        bool operator()(const entry &a, const entry &b) const;
    };

    std::set<entry, entry_order> entries;
    std::map<fingerprint, std::set<entry, entry_order>::iterator> index;
    unsigned long long next_sequence = 0;
};

}  // namespace grader
