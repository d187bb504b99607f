#ifndef RETICLE_THREAD_SAFE_QUEUE_H
#define RETICLE_THREAD_SAFE_QUEUE_H

#include <deque>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>
#include <cstddef>

namespace reticle {

/**
 * @brief Bounded multi-producer queue used by the asynchronous log writer
 *
 * When the queue is full the oldest entry is discarded so that producers
 * (pipeline stages) never block on a slow sink.
 * @tparam T Element type
 */
template<typename T>
class ThreadSafeQueue {
public:
    explicit ThreadSafeQueue(size_t capacity = 10000)
        : m_capacity(capacity == 0 ? 1 : capacity), m_closed(false), m_dropped(0) {}

    /**
     * @brief Push an item, evicting the oldest one if the queue is full
     * @return false if the queue is closed
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                return false;
            }
            if (m_queue.size() >= m_capacity) {
                m_queue.pop_front();
                ++m_dropped;
            }
            m_queue.push_back(std::move(item));
        }
        m_condition.notify_one();
        return true;
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return popLocked();
    }

    /**
     * @brief Pop an item, waiting at most timeoutMs
     * @return Empty on timeout or when closed and drained
     */
    std::optional<T> popWithTimeout(int timeoutMs) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                             [this] { return !m_queue.empty() || m_closed; });
        return popLocked();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    /**
     * @brief Number of items evicted because the queue was full
     */
    size_t droppedCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_dropped;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_condition.notify_all();
    }

    /**
     * @brief Reopen a closed queue so that it accepts items again
     */
    void reopen() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = false;
    }

private:
    std::optional<T> popLocked() {
        if (m_queue.empty()) {
            return std::nullopt;
        }
        T item = std::move(m_queue.front());
        m_queue.pop_front();
        return item;
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::deque<T> m_queue;
    size_t m_capacity;
    bool m_closed;
    size_t m_dropped;
};

} // namespace reticle

#endif // RETICLE_THREAD_SAFE_QUEUE_H
