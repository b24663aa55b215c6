#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace grader {

/**
 * @brief 线程安全的 FIFO 队列
 */
template <typename T>
struct concurrent_queue {
    void push(T &&value) {
        {
            std::scoped_lock guard(mut);
            queue.push_back(std::move(value));
        }
        cv.notify_one();
    }

    void push(const T &value) {
        {
            std::scoped_lock guard(mut);
            queue.push_back(value);
        }
        cv.notify_one();
    }

    template <typename Rep, typename Period>
    bool pop_for(T &value, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock guard(mut);
        if (!cv.wait_for(guard, timeout, [this] { return !queue.empty(); }))
            return false;
        value = std::move(queue.front());
        queue.pop_front();
        return true;
    }

    std::size_t size() const {
        std::scoped_lock guard(mut);
        return queue.size();
    }

private:
    mutable std::mutex mut;
    std::condition_variable cv;
    std::deque<T> queue;
};

}  // namespace grader
