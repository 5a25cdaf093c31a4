#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <tbb/concurrent_queue.h>

/**
 * @brief Fixed-size pool of threads reserved for blocking provider calls.
 *
 * Shared by every concurrent pipeline run. Jobs are taken strictly in
 * submission order. The pool size is set at construction and never changes.
 */
class BlockingWorkerPool
{
public:
    using Job = std::function<void()>;

    /**
     * @brief Start the pool
     * @param pool_size Number of worker threads, out-of-range values fall back to DEFAULT_POOL_SIZE
     */
    explicit BlockingWorkerPool(size_t pool_size = DEFAULT_POOL_SIZE);
    ~BlockingWorkerPool();

    /**
     * @brief Queue a job behind every job already submitted
     * @return false when the pool has been shut down and the job was not queued
     */
    bool submit(Job job);

    /**
     * @brief Stop accepting jobs, let queued jobs finish and join the workers
     */
    void shutdown();

    size_t getPoolSize() const { return pool_size_; }
    bool isShutdown() const { return shutting_down_.load(); }

    static bool validatePoolSize(size_t pool_size);

    static constexpr size_t MIN_POOL_SIZE = 1;
    static constexpr size_t MAX_POOL_SIZE = 64;
    static constexpr size_t DEFAULT_POOL_SIZE = 4;

private:
    BlockingWorkerPool(const BlockingWorkerPool &) = delete;
    BlockingWorkerPool &operator=(const BlockingWorkerPool &) = delete;

    // Outlives the pool while a detached worker still drains it
    struct JobQueue
    {
        // An empty job is the stop sentinel for one worker
        tbb::concurrent_bounded_queue<Job> jobs;
    };

    static void workerLoop(std::shared_ptr<JobQueue> queue, size_t worker_index);

    size_t pool_size_;
    std::shared_ptr<JobQueue> queue_;
    std::vector<std::thread> workers_;
    std::atomic<bool> shutting_down_{false};
    std::mutex lifecycle_mutex_;
};
