#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>

namespace ladder {

/**
 * @brief 可关闭的任务队列
 * 生产者 push 完任务后调用 close，消费者通过 pop 取任务直到返回 false
 * @param <T> 任务类型
 */
template <typename T>
struct concurrent_queue {
    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(mut);
            tasks.push_back(std::move(value));
        }
        cond.notify_one();
    }

    /**
     * @brief 取出队头任务，队列为空时阻塞
     * @param element 保存取出的任务
     * @return 队列已关闭且没有剩余任务时返回 false
     */
    bool pop(T &element) {
        std::unique_lock<std::mutex> lock(mut);
        cond.wait(lock, [this] { return closed || !tasks.empty(); });
        if (tasks.empty()) return false;
        element = std::move(tasks.front());
        tasks.pop_front();
        return true;
    }

    // 关闭后不应再 push
    void close() {
        {
            std::lock_guard<std::mutex> lock(mut);
            closed = true;
        }
        cond.notify_all();
    }

private:
    std::deque<T> tasks;
    std::mutex mut;
    std::condition_variable cond;
    bool closed = false;
};

}  // namespace ladder
