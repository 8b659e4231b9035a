#pragma once

#include <condition_variable>
#include <cstddef>
#include <limits>
#include <mutex>
#include <optional>
#include <queue>

namespace quest {

/**
 * @brief 有界并发队列，写者读者模型
 * 队列关闭后不再接受新元素，但读者仍可以取出剩余的元素。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    explicit concurrent_queue(std::size_t capacity = std::numeric_limits<std::size_t>::max())
        : capacity(capacity) {}

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
        mlock.unlock();
        not_full.notify_one();
        return true;
    }

    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素为止
     * @return 队列头元素，若队列已关闭且为空则返回空
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> mlock(mut);
        not_empty.wait(mlock, [this] { return !q.empty() || closed; });
        if (q.empty()) return std::nullopt;
        std::optional<T> result(std::move(q.front()));
        q.pop();
        mlock.unlock();
        not_full.notify_one();
        return result;
    }

    /**
     * @brief 向队列中插入一个新元素，队列已满时立即返回
     * @return 队列已满或已关闭时返回 false
     */
    bool try_push(const T &value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (closed || q.size() >= capacity) return false;
        q.push(value);
        mlock.unlock();
        not_empty.notify_one();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素，队列已满时阻塞等待
     * @return 队列已关闭时返回 false
     */
    bool push(const T &value) {
        std::unique_lock<std::mutex> mlock(mut);
        not_full.wait(mlock, [this] { return q.size() < capacity || closed; });
        if (closed) return false;
        q.push(value);
        mlock.unlock();
        not_empty.notify_one();
        return true;
    }

    /**
     * @brief 关闭队列，唤醒所有等待的读者和写者
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        mlock.unlock();
        not_empty.notify_all();
        not_full.notify_all();
    }

    std::size_t size() const {
        std::unique_lock<std::mutex> mlock(mut);
        return q.size();
    }

private:
    std::size_t capacity;
    bool closed = false;
    std::queue<T> q;
    mutable std::mutex mut;
    std::condition_variable not_empty;
    std::condition_variable not_full;
};

}  // namespace quest
