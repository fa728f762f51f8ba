#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace ojudge {

/**
 * @brief 并发队列，写者读者模型
 * 写者在放入全部元素后调用 close，读者在队列关闭且为空后退出循环：
 * @code{.cpp}
 *     while (auto item = queue.pop()) consume(*item);
 * @endcode
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 尝试从队列中弹出队头元素，不阻塞
     * @return 队头元素，队列为空时返回空
     */
    std::optional<T> try_pop() {
        std::unique_lock<std::mutex> mlock(mut);
        if (q.empty()) return std::nullopt;
        T result = std::move(q.front());
        q.pop();
        return result;
    }

    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列被关闭
     * @return 队列头元素，队列已关闭且为空时返回空
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> mlock(mut);
        cond.wait(mlock, [this] { return !q.empty() || closed; });
        if (q.empty()) return std::nullopt;
        T result = std::move(q.front());
        q.pop();
        return result;
    }

    /**
     * @brief 向队列中插入一个新元素
     */
    void push(const T &value) {
        std::unique_lock<std::mutex> mlock(mut);
        q.push(value);
        mlock.unlock();
        cond.notify_one();
    }

    /**
     * @brief 关闭队列，唤醒所有等待中的读者
     * 关闭后仍可以取出剩余元素
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        mlock.unlock();
        cond.notify_all();
    }

    std::size_t size() const {
        std::unique_lock<std::mutex> mlock(mut);
        return q.size();
    }

private:
    std::queue<T> q;
    bool closed = false;
    mutable std::mutex mut;
    std::condition_variable cond;
};

}  // namespace ojudge
