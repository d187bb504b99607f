#include "thread_pool.h"
#include "structured_logger.h"

namespace reticle {

ThreadPool::ThreadPool(size_t numThreads)
    : m_stopping(false)
    , m_numBusyThreads(0)
    , m_totalTasksExecuted(0)
    , m_totalTasksFailed(0) {

    if (numThreads == 0) {
        numThreads = std::thread::hardware_concurrency();
        if (numThreads == 0) {
            numThreads = 2;
        }
    }

    RETICLE_LOG_DEBUG().message("Creating thread pool").context("num_threads", numThreads);

    for (size_t i = 0; i < numThreads; ++i) {
        m_threads.emplace_back(&ThreadPool::workerThread, this, i);
    }
}

ThreadPool::~ThreadPool() {
    shutdown(false);
}

void ThreadPool::workerThread(size_t threadId) {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_condition.wait(lock, [this] {
                return m_stopping || !m_tasks.empty();
            });

            if (m_stopping && m_tasks.empty()) {
                break;
            }

            task = std::move(m_tasks.front());
            m_tasks.pop();
            m_numBusyThreads++;
        }

        // packaged_task stores exceptions in its future; this only catches
        // failures of the task wrapper itself
        try {
            task();
            m_totalTasksExecuted++;
        } catch (const std::exception& e) {
            m_totalTasksFailed++;
            RETICLE_LOG_ERROR().message("Uncaught exception in thread pool task")
                .context("thread_id", threadId)
                .context("error", e.what());
        }

        m_numBusyThreads--;
    }
}

void ThreadPool::shutdown(bool waitForTasks) {
    {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        if (m_stopping) {
            return;
        }
        m_stopping = true;

        if (!waitForTasks) {
            // Dropping a packaged_task breaks its promise; abandoned futures
            // see std::future_error, which nobody waits on any more
            std::queue<std::function<void()>> empty;
            std::swap(m_tasks, empty);
        }
    }

    m_condition.notify_all();

    for (std::thread& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

size_t ThreadPool::getNumPendingTasks() const {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_tasks.size();
}

ThreadPool::PoolStats ThreadPool::getStats() const {
    PoolStats stats;
    stats.numThreads = m_threads.size();
    stats.numBusyThreads = m_numBusyThreads;
    stats.numPendingTasks = getNumPendingTasks();
    stats.totalTasksExecuted = m_totalTasksExecuted;
    stats.totalTasksFailed = m_totalTasksFailed;
    return stats;
}

} // namespace reticle
