#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace grader {

/**
 * @brief 计数信号量，用于限制同时发往沙箱的请求数
 */
struct counting_semaphore {
    explicit counting_semaphore(std::size_t permits) : permits(permits) {}

    void acquire() {
        std::unique_lock<std::mutex> lock(mut);
        cond.wait(lock, [this] { return permits > 0; });
        --permits;
    }

    void release() {
        {
            std::scoped_lock lock(mut);
            ++permits;
        }
        cond.notify_one();
    }

    std::size_t available() {
        std::scoped_lock lock(mut);
        return permits;
    }

private:
    std::size_t permits;
    std::mutex mut;
    std::condition_variable cond;
};

/**
 * @brief RAII 形式持有一个信号量许可
 */
struct semaphore_permit {
    explicit semaphore_permit(counting_semaphore &sem) : sem(sem) {
        sem.acquire();
    }

    semaphore_permit(const semaphore_permit &) = delete;
    semaphore_permit &operator=(const semaphore_permit &) = delete;

    ~semaphore_permit() {
        sem.release();
    }

private:
    counting_semaphore &sem;
};

}  // namespace grader
