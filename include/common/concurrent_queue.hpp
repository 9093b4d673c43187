#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

namespace grader {

/**
 * @brief 并发队列，写者读者模型
 * 关闭后 push 的元素将被丢弃，阻塞中的 pop_for 会立即返回
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 尝试从队列中弹出队头元素，如果队列为空返回 false
     * @param element 如果队列有元素，则保存队头元素，否则不变
     * @return 是否成功弹出队列头元素
     */
    bool try_pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 从队列中弹出队头元素，队列为空时最多等待 timeout
     * @return 是否成功弹出队列头元素，队列关闭或者超时时返回 false
     */
    template <typename Rep, typename Period>
    bool pop_for(T &element, const std::chrono::duration<Rep, Period> &timeout) {
        std::unique_lock<std::mutex> mlock(mut);
        if (!cond.wait_for(mlock, timeout, [this] { return closed || !q.empty(); }))
            return false;
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素
     * @return 队列已关闭时返回 false
     */
    bool push(const T &value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (closed) return false;
        q.push(value);
        mlock.unlock();
        cond.notify_one();
        return true;
    }

    /**
     * @brief 关闭队列并唤醒所有等待者
     */
    void close() {
        {
            std::unique_lock<std::mutex> mlock(mut);
            closed = true;
        }
        cond.notify_all();
    }

    bool is_closed() {
        std::unique_lock<std::mutex> mlock(mut);
        return closed;
    }

private:
    std::queue<T> q;
    bool closed = false;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace grader
