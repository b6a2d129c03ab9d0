#include "shiplot/transfer/worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace shiplot::transfer {

std::size_t compute_pool_size(std::size_t configured_max, std::size_t volume_count) {
    const std::size_t size = configured_max == 0 ? volume_count : std::min(configured_max, volume_count);
    return std::max<std::size_t>(size, 1);
}

WorkerPool::WorkerPool(std::size_t capacity) {
    std::lock_guard lock(mutex_);
    capacity_ = std::max<std::size_t>(capacity, 1);
    while (workers_.size() < capacity_) {
        spawn_locked();
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Job job) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return false;
        }
        jobs_.push_back(std::move(job));
    }
    work_cv_.notify_one();
    return true;
}

void WorkerPool::set_capacity(std::size_t capacity) {
    {
        std::lock_guard lock(mutex_);
        const std::size_t next = std::max<std::size_t>(capacity, 1);
        if (next == capacity_) {
            return;
        }
        spdlog::debug("Worker pool capacity {} -> {}", capacity_, next);
        capacity_ = next;
        if (!stopping_) {
            while (workers_.size() < capacity_) {
                spawn_locked();
            }
        }
    }
    work_cv_.notify_all();
}

std::size_t WorkerPool::capacity() const {
    std::lock_guard lock(mutex_);
    return capacity_;
}

std::size_t WorkerPool::running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

std::size_t WorkerPool::pending() const {
    std::lock_guard lock(mutex_);
    return jobs_.size();
}

void WorkerPool::drain() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this] { return jobs_.empty() && running_ == 0; });
}

void WorkerPool::shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
        workers.swap(workers_);
    }
    work_cv_.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::spawn_locked() {
    workers_.emplace_back([this] { worker_loop(); });
}

void WorkerPool::worker_loop() {
    for (;;) {
        Job job;
        {
            std::unique_lock lock(mutex_);
            work_cv_.wait(lock, [this] {
                return (stopping_ && jobs_.empty()) || (!jobs_.empty() && running_ < capacity_);
            });
            if (jobs_.empty()) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
            ++running_;
        }

        try {
            job();
        } catch (const std::exception& e) {
            spdlog::error("Transfer job threw: {}", e.what());
        } catch (...) {
            spdlog::error("Transfer job threw a non-standard exception");
        }

        {
            std::lock_guard lock(mutex_);
            --running_;
        }
        // Idle workers may be waiting on capacity or on shutdown
        work_cv_.notify_all();
        idle_cv_.notify_all();
    }
}

} // namespace shiplot::transfer
