#include "core/blocking_worker_pool.hpp"
#include "logging/logger.hpp"

BlockingWorkerPool::BlockingWorkerPool(size_t pool_size)
    : pool_size_(pool_size), queue_(std::make_shared<JobQueue>())
{
    if (!validatePoolSize(pool_size_))
    {
        Logger::error("Invalid blocking pool size: " + std::to_string(pool_size) + ". Using default: " + std::to_string(DEFAULT_POOL_SIZE));
        pool_size_ = DEFAULT_POOL_SIZE;
    }

    workers_.reserve(pool_size_);
    for (size_t i = 0; i < pool_size_; ++i)
    {
        workers_.emplace_back(&BlockingWorkerPool::workerLoop, queue_, i);
    }

    Logger::info("Blocking worker pool initialized with " + std::to_string(pool_size_) + " threads");
}

BlockingWorkerPool::~BlockingWorkerPool()
{
    shutdown();
}

bool BlockingWorkerPool::submit(Job job)
{
    if (!job)
    {
        Logger::warn("Ignoring empty job submitted to blocking worker pool");
        return false;
    }

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (shutting_down_.load())
    {
        Logger::error("Blocking worker pool is shut down, job rejected");
        return false;
    }

    queue_->jobs.push(std::move(job));
    return true;
}

void BlockingWorkerPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (shutting_down_.exchange(true))
        {
            return;
        }

        // One sentinel per worker, queued behind every pending job
        for (size_t i = 0; i < workers_.size(); ++i)
        {
            queue_->jobs.push(Job());
        }
    }

    for (auto &worker : workers_)
    {
        if (!worker.joinable())
        {
            continue;
        }
        if (worker.get_id() == std::this_thread::get_id())
        {
            // Last owner released from inside a job; this worker keeps the queue
            // alive and exits on its sentinel
            worker.detach();
        }
        else
        {
            worker.join();
        }
    }

    Logger::info("Blocking worker pool shutdown complete");
}

bool BlockingWorkerPool::validatePoolSize(size_t pool_size)
{
    if (pool_size < MIN_POOL_SIZE || pool_size > MAX_POOL_SIZE)
    {
        Logger::warn("Blocking pool size " + std::to_string(pool_size) + " is outside valid range [" +
                     std::to_string(MIN_POOL_SIZE) + ", " + std::to_string(MAX_POOL_SIZE) + "]");
        return false;
    }
    return true;
}

void BlockingWorkerPool::workerLoop(std::shared_ptr<JobQueue> queue, size_t worker_index)
{
    Logger::debug("Blocking worker " + std::to_string(worker_index) + " started");

    while (true)
    {
        Job job;
        queue->jobs.pop(job);
        if (!job)
        {
            break;
        }

        try
        {
            job();
        }
        catch (const std::exception &e)
        {
            Logger::error("Blocking worker " + std::to_string(worker_index) + " job failed: " + std::string(e.what()));
        }
        catch (...)
        {
            Logger::error("Blocking worker " + std::to_string(worker_index) + " job failed with an unknown exception");
        }
    }

    Logger::debug("Blocking worker " + std::to_string(worker_index) + " stopped");
}
