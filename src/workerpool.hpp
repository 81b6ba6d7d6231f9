/**
 * @file workerpool.hpp
 * @brief Fixed-size thread pool for blocking work.
 */

#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

/**
 * @class WorkerPool
 * @brief Runs submitted tasks on a fixed set of threads.
 *
 * Used to keep blocking DoH and system lookups off the event loop thread.
 * Destruction stops accepting new tasks, drains the queue and joins all
 * threads, so it may block for as long as the slowest pending task takes.
 */
class WorkerPool {
    public:
        typedef std::function<void()> Task;

    private:
        std::vector<std::thread> m_workers;
        std::deque<Task> m_tasks;
        std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_stopping = false;
        size_t m_busy = 0;

        void workerLoop();

    public:
        /**
         * @brief Starts the worker threads.
         * @param nThreads Number of threads, at least one is always started.
         */
        explicit WorkerPool(size_t nThreads);
        ~WorkerPool();

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;

        /**
         * @brief Queues a task for execution.
         * @return False if the pool is shutting down and the task was rejected.
         */
        bool submit(Task task);

        /**
         * @brief Stops accepting tasks, waits for queued ones and joins threads.
         *
         * Safe to call more than once.
         */
        void shutdown();

        /**
         * @brief Number of queued plus running tasks.
         */
        size_t pending();
};
