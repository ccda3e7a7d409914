/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation.
 */

#include "executor/worker_pool.hpp"

namespace exo_watch {

WorkerPool::WorkerPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::post(Job job) {
    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_) return false;
        job_queue_.push(std::move(job));
    }
    queue_cv_.notify_one();
    return true;
}

void WorkerPool::wait_idle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return job_queue_.empty() && active_jobs_.load() == 0;
    });
}

void WorkerPool::shutdown() {
    {
        std::lock_guard lock(queue_mutex_);
        accepting_ = false;
        std::queue<Job> empty;
        job_queue_.swap(empty);
    }
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    idle_cv_.notify_all();
}

void WorkerPool::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        Job job;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !job_queue_.empty(); });

            if (stop.stop_requested() || job_queue_.empty()) {
                continue;
            }

            job = std::move(job_queue_.front());
            job_queue_.pop();
            ++active_jobs_;
        }

        job(stop);

        {
            std::lock_guard lock(queue_mutex_);
            --active_jobs_;
        }
        idle_cv_.notify_all();
    }
}

size_t WorkerPool::active_count() const noexcept {
    return active_jobs_.load();
}

size_t WorkerPool::queued_count() const {
    std::lock_guard lock(queue_mutex_);
    return job_queue_.size();
}

size_t WorkerPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace exo_watch
