/**
 * @file WorkerPool.hpp
 * @brief Fixed-size pool of worker threads for blocking filesystem work.
 */

#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace discarchiver::application {

/**
 * @class WorkerPool
 * @brief Runs submitted tasks on a bounded set of threads.
 *
 * Callers fan out with submit() and fan in by waiting on the returned
 * futures. The pool lives across chunks; destruction drains the queue and
 * joins every worker.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t threadCount) {
        if (threadCount == 0) {
            throw std::invalid_argument("WorkerPool needs at least one thread");
        }
        m_workers.reserve(threadCount);
        for (size_t i = 0; i < threadCount; ++i) {
            m_workers.emplace_back(&WorkerPool::workerLoop, this);
        }
    }

    ~WorkerPool() {
        shutdown();
    }

    /** @brief Stops accepting work, runs what is queued and joins the workers. Idempotent. */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_running = false;
        }
        m_cv.notify_all();
        for (auto& worker : m_workers) {
            if (worker.joinable()) worker.join();
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /** @brief Queues a callable; its result (or exception) is delivered through the future. */
    template<typename F>
    std::future<std::invoke_result_t<F>> submit(F&& f) {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        std::future<R> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running) {
                throw std::runtime_error("WorkerPool is shutting down");
            }
            m_queue.push([task]() { (*task)(); });
        }
        m_cv.notify_one();
        return result;
    }

    size_t size() const { return m_workers.size(); }

private:
    void workerLoop() {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait(lock, [this] {
                    return !m_queue.empty() || !m_running;
                });

                if (!m_running && m_queue.empty()) {
                    return;
                }

                job = std::move(m_queue.front());
                m_queue.pop();
            }

            // Run outside the lock; packaged_task captures exceptions.
            job();
        }
    }

    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_running = true;
};

} // namespace discarchiver::application
