#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace shiplot::transfer {

/**
 * @brief Pool size for a given configuration and destination count
 *
 * configured_max == 0 means "one transfer per destination". The result is
 * never below 1, so a drained registry still leaves one worker to wait.
 */
std::size_t compute_pool_size(std::size_t configured_max, std::size_t volume_count);

/**
 * @brief FIFO job queue executed by a resizable number of workers
 *
 * Capacity is an admission limit: at most capacity() jobs run at once.
 * Growing the capacity spawns threads as needed; shrinking it lets running
 * jobs finish and holds back new ones until the running count drops below
 * the new limit. Threads are only joined at shutdown.
 *
 * THREAD SAFETY: every member may be called from any thread except that
 * drain() and shutdown() must not be called from inside a job.
 */
class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(std::size_t capacity);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * RETURNS: false if the pool is shutting down and the job was dropped
     */
    bool submit(Job job);

    void set_capacity(std::size_t capacity);

    std::size_t capacity() const;
    std::size_t running() const;
    std::size_t pending() const;

    /**
     * BLOCKS: until no job is queued or running
     */
    void drain();

    /**
     * @brief Stop accepting jobs, finish the queued ones and join the workers
     *
     * Idempotent.
     */
    void shutdown();

private:
    void spawn_locked();
    void worker_loop();

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<Job> jobs_;
    std::vector<std::thread> workers_;
    std::size_t capacity_ = 1;
    std::size_t running_ = 0;
    bool stopping_ = false;
};

} // namespace shiplot::transfer
