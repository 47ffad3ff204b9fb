#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace coderun {

/**
 * @brief 并发队列，写者读者模型
 * 批量运行时，所有请求的下标先被放进队列并关闭队列，
 * 固定数量的 worker 不断从队列中取出下标执行，直到队列被取空。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列被关闭为止
     * @return 队列头元素，如果队列已关闭且为空，返回 std::nullopt
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
     * @note 关闭后的队列仍然允许插入，元素依然会被消费者取走
     */
    void push(const T &value) {
        std::unique_lock<std::mutex> mlock(mut);
        q.push(value);
        mlock.unlock();
        cond.notify_one();
    }

    /**
     * @brief 关闭队列，唤醒所有阻塞在 pop 上的消费者
     * 队列中剩余的元素仍然可以被取出，取空之后 pop 返回 std::nullopt
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        mlock.unlock();
        cond.notify_all();
    }

private:
    std::queue<T> q;
    bool closed = false;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace coderun
