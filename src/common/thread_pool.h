#ifndef RETICLE_THREAD_POOL_H
#define RETICLE_THREAD_POOL_H

#include <vector>
#include <queue>
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future>
#include <functional>
#include <stdexcept>
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <type_traits>

namespace reticle {

/**
 * @brief Outcome of a call made with a deadline
 */
enum class WaitStatus {
    COMPLETED,
    TIMED_OUT,
    FAILED      // The call threw; message in BoundedResult::error
};

template<typename T>
struct BoundedResult {
    WaitStatus status = WaitStatus::FAILED;
    std::optional<T> value;
    std::string error;

    bool ok() const { return status == WaitStatus::COMPLETED; }
};

/**
 * @brief Small worker pool used to put deadlines on collaborator calls
 *
 * A call that misses its deadline is abandoned, not interrupted: the worker
 * keeps running it and the result is discarded. Shutdown joins all workers,
 * so a collaborator call that never returns also blocks shutdown.
 */
class ThreadPool {
public:
    struct PoolStats {
        size_t numThreads;
        size_t numBusyThreads;
        size_t numPendingTasks;
        size_t totalTasksExecuted;
        size_t totalTasksFailed;
    };

    /**
     * @param numThreads Number of worker threads (0 = hardware concurrency)
     */
    explicit ThreadPool(size_t numThreads = 2);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a callable
     * @return Future for the callable's result
     * @throws std::runtime_error if the pool is shutting down
     */
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using return_type = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
        std::future<return_type> result = task->get_future();

        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            if (m_stopping) {
                throw std::runtime_error("Cannot submit task to stopping thread pool");
            }
            m_tasks.emplace([task]() { (*task)(); });
        }

        m_condition.notify_one();
        return result;
    }

    /**
     * @brief Run a callable on the pool and wait at most `deadline`
     *
     * A non-positive deadline runs the callable on the calling thread with
     * no time limit. Exceptions thrown by the callable are reported as
     * WaitStatus::FAILED.
     */
    template<typename F>
    auto runWithDeadline(F&& f, std::chrono::milliseconds deadline)
        -> BoundedResult<std::invoke_result_t<std::decay_t<F>>> {
        using return_type = std::invoke_result_t<std::decay_t<F>>;
        static_assert(!std::is_void<return_type>::value, "runWithDeadline needs a value-returning callable");

        BoundedResult<return_type> outcome;
        try {
            if (deadline.count() <= 0) {
                outcome.value = f();
                outcome.status = WaitStatus::COMPLETED;
                return outcome;
            }

            auto future = submit(std::forward<F>(f));
            if (future.wait_for(deadline) != std::future_status::ready) {
                outcome.status = WaitStatus::TIMED_OUT;
                outcome.error = "deadline of " + std::to_string(deadline.count()) + "ms exceeded";
                return outcome;
            }
            outcome.value = future.get();
            outcome.status = WaitStatus::COMPLETED;
        } catch (const std::exception& e) {
            outcome.status = WaitStatus::FAILED;
            outcome.error = e.what();
        }
        return outcome;
    }

    /**
     * @brief Stop accepting work and join the workers
     * @param waitForTasks If false, queued tasks that have not started are dropped
     */
    void shutdown(bool waitForTasks = true);

    size_t getNumThreads() const { return m_threads.size(); }
    size_t getNumPendingTasks() const;
    PoolStats getStats() const;

private:
    void workerThread(size_t threadId);

    std::vector<std::thread> m_threads;
    std::queue<std::function<void()>> m_tasks;

    mutable std::mutex m_queueMutex;
    std::condition_variable m_condition;

    std::atomic<bool> m_stopping;
    std::atomic<size_t> m_numBusyThreads;
    std::atomic<size_t> m_totalTasksExecuted;
    std::atomic<size_t> m_totalTasksFailed;
};

} // namespace reticle

#endif // RETICLE_THREAD_POOL_H
