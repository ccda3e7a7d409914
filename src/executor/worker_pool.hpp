/**
 * @file worker_pool.hpp
 * @brief Fixed-size std::jthread worker pool with cooperative cancellation.
 *
 * Bounds how many jobs run at once; the discovery scanner uses it to cap the
 * number of outstanding HTTP probes (and therefore open sockets).
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <vector>

namespace exo_watch {

class WorkerPool {
public:
    using Job = std::function<void(std::stop_token)>;

    explicit WorkerPool(size_t num_threads = 0);
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a job. Returns false once shutdown() has been called.
    bool post(Job job);

    /// Block until the queue is empty and no job is running.
    void wait_idle();

    /**
     * @brief Drop queued jobs, ask running jobs to stop, and join the workers.
     */
    void shutdown();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<Job> job_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::condition_variable_any idle_cv_;
    std::atomic<size_t> active_jobs_{0};
    bool accepting_{true};
};

}  // namespace exo_watch
