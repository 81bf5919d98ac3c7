#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace grader {

/**
 * @brief 并发队列，写者读者模型
 * 评分服务的 worker 从这里取待评分的提交
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 从队列中弹出队头元素，队列为空时最多等待 timeout
     * 队列被关闭后不再等待
     * @return 是否成功弹出队列头元素
     */
    template <typename Rep, typename Period>
    bool pop_for(T &element, const std::chrono::duration<Rep, Period> &timeout) {
        std::unique_lock<std::mutex> mlock(mut);
        if (!cond.wait_for(mlock, timeout, [this] { return !q.empty() || closed; }))
            return false;
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop_front();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素
     */
    void push(const T &value) {
        std::unique_lock<std::mutex> mlock(mut);
        q.push_back(value);
        mlock.unlock();
        cond.notify_one();
    }

    /**
     * @brief 关闭队列，唤醒所有正在等待的读者
     * 关闭后仍然可以取出剩余元素
     */
    void close() {
        {
            std::scoped_lock mlock(mut);
            closed = true;
        }
        cond.notify_all();
    }

    std::size_t size() {
        std::scoped_lock mlock(mut);
        return q.size();
    }

private:
    std::deque<T> q;
    bool closed = false;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace grader
