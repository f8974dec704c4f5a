#include "WorkerPool.h"

#include <utility>

namespace YtMerge {

WorkerPool::WorkerPool(size_t threadCount) {
    if (threadCount == 0) threadCount = 1;
    m_threads.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i) {
        m_threads.emplace_back(&WorkerPool::workerLoop, this);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_jobAvailable.notify_all();
    for (auto& t : m_threads) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_jobs.push(std::move(job));
    }
    m_jobAvailable.notify_one();
}

void WorkerPool::waitIdle() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idle.wait(lock, [this] { return m_jobs.empty() && m_active == 0; });
}

void WorkerPool::workerLoop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_jobAvailable.wait(lock, [this] { return m_stopping || !m_jobs.empty(); });
            if (m_jobs.empty()) {
                return;  // stopping and drained
            }
            job = std::move(m_jobs.front());
            m_jobs.pop();
            ++m_active;
        }

        job();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_active;
            if (m_jobs.empty() && m_active == 0) {
                m_idle.notify_all();
            }
        }
    }
}

} // namespace YtMerge
