#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace grader {

/**
 * @brief 并发队列，写者读者模型
 * 队列可以被关闭：关闭后 push 不再生效，pop 在队列取空后立即返回空值，
 * 以便 worker 在没有剩余工作或者发生致命错误时自然退出。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列被关闭为止
     * @return 队列头元素，队列已关闭且为空时返回 std::nullopt
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> mlock(mut);
        cond.wait(mlock, [this] { return !q.empty() || closed; });
        if (q.empty()) return std::nullopt;
        std::optional<T> result(std::move(q.front()));
        q.pop();
        return result;
    }

    /**
     * @brief 向队列中插入一个新元素
     * @return 队列已关闭时返回 false
     */
    bool push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (closed) return false;
        q.push(std::move(value));
        mlock.unlock();
        cond.notify_one();
        return true;
    }

    /**
     * @brief 关闭队列并唤醒所有等待中的读者
     * @param discard 为真时同时丢弃尚未被取走的元素
     */
    void close(bool discard = false) {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        if (discard) q = std::queue<T>();
        mlock.unlock();
        cond.notify_all();
    }

private:
    std::queue<T> q;
    std::mutex mut;
    std::condition_variable cond;
    bool closed = false;
};

}  // namespace grader
