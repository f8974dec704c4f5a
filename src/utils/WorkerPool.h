#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace YtMerge {

/**
 * @brief Fixed number of threads draining a shared job queue
 *
 * Jobs must not throw; the pool does not catch for them.
 * The destructor finishes queued jobs before joining.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t threadCount);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(std::function<void()> job);

    // Block until the queue is empty and no job is running
    void waitIdle();

    size_t size() const { return m_threads.size(); }

private:
    void workerLoop();

    std::vector<std::thread> m_threads;
    std::queue<std::function<void()>> m_jobs;
    std::mutex m_mutex;
    std::condition_variable m_jobAvailable;
    std::condition_variable m_idle;
    size_t m_active = 0;
    bool m_stopping = false;
};

} // namespace YtMerge
