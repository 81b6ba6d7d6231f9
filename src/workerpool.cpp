#include "workerpool.hpp"
#include "logging.hpp"

#include <exception>

WorkerPool::WorkerPool(size_t nThreads)
{
    if (nThreads == 0) {
        nThreads = 1;
    }
    for (size_t i = 0; i < nThreads; i++) {
        m_workers.emplace_back([this]() { workerLoop(); });
    }
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

bool WorkerPool::submit(Task task)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            return false;
        }
        m_tasks.emplace_back(std::move(task));
    }
    m_cv.notify_one();
    return true;
}

void WorkerPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_cv.notify_all();

    for (auto& worker: m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();
}

size_t WorkerPool::pending()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size() + m_busy;
}

void WorkerPool::workerLoop()
{
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]() { return m_stopping || m_tasks.empty() == false; });
            // Queued tasks are still executed after shutdown was requested
            if (m_tasks.empty()) {
                return;
            }
            task = std::move(m_tasks.front());
            m_tasks.pop_front();
            m_busy++;
        }

        try {
            task();
        } catch (std::exception& e) {
            LOG_ERROR("Worker task failed: ", e.what());
        } catch (...) {
            LOG_ERROR("Worker task failed with unknown exception");
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_busy--;
    }
}
