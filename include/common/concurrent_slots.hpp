#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace sandbox {

/**
 * @brief 计数信号量，限制同时进行的执行数量
 * capacity 为 0 时不做任何限制，acquire 立即返回
 */
struct concurrent_slots {
    explicit concurrent_slots(std::size_t capacity) : capacity(capacity), used(0) {}

    concurrent_slots(const concurrent_slots &) = delete;
    concurrent_slots &operator=(const concurrent_slots &) = delete;

    /**
     * @brief 占用一个槽位，如果没有空闲槽位则阻塞等待直到有槽位被释放为止
     */
    void acquire() {
        if (capacity == 0) return;
        std::unique_lock<std::mutex> mlock(mut);
        while (used >= capacity) cond.wait(mlock);
        ++used;
    }

    /**
     * @brief 释放一个由 acquire 占用的槽位
     */
    void release() {
        if (capacity == 0) return;
        std::unique_lock<std::mutex> mlock(mut);
        --used;
        mlock.unlock();
        cond.notify_one();
    }

    /**
     * @brief 在作用域内占用一个槽位
     */
    struct guard {
        explicit guard(concurrent_slots &slots) : slots(slots) { slots.acquire(); }
        ~guard() { slots.release(); }

        guard(const guard &) = delete;
        guard &operator=(const guard &) = delete;

    private:
        concurrent_slots &slots;
    };

private:
    const std::size_t capacity;
    std::size_t used;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace sandbox
