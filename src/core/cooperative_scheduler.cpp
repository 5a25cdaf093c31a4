#include "core/cooperative_scheduler.hpp"
#include "logging/logger.hpp"
#include <algorithm>

CooperativeScheduler::CooperativeScheduler(const std::string &name)
    : name_(name)
{
}

CooperativeScheduler::~CooperativeScheduler()
{
    stop();
}

void CooperativeScheduler::start()
{
    if (running_.exchange(true))
    {
        Logger::warn("Scheduler '" + name_ + "' already running");
        return;
    }

    scheduler_thread_ = std::thread(&CooperativeScheduler::schedulerLoop, this);
    Logger::debug("Scheduler '" + name_ + "' started");
}

void CooperativeScheduler::stop()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_.exchange(false))
        {
            return;
        }
    }

    queue_cv_.notify_all();

    if (scheduler_thread_.joinable())
    {
        if (isSchedulerThread())
        {
            // Stopped from one of its own tasks; the loop exits after the task returns
            scheduler_thread_.detach();
        }
        else
        {
            scheduler_thread_.join();
        }
    }

    // Released outside the lock, dropped tasks may own the last reference to a run
    std::deque<Task> dropped_tasks;
    std::vector<TimedTask> dropped_timers;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        dropped_tasks.swap(ready_tasks_);
        dropped_timers.swap(timers_);
    }
    if (!dropped_tasks.empty() || !dropped_timers.empty())
    {
        Logger::debug("Scheduler '" + name_ + "' dropped " +
                      std::to_string(dropped_tasks.size() + dropped_timers.size()) + " pending tasks on stop");
    }
    Logger::debug("Scheduler '" + name_ + "' stopped");
}

bool CooperativeScheduler::post(Task task)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_.load())
        {
            Logger::debug("Scheduler '" + name_ + "' not running, task dropped");
            return false;
        }
        ready_tasks_.push_back(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

bool CooperativeScheduler::postAfter(std::chrono::milliseconds delay, Task task)
{
    if (delay <= std::chrono::milliseconds::zero())
    {
        return post(std::move(task));
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_.load())
        {
            Logger::debug("Scheduler '" + name_ + "' not running, delayed task dropped");
            return false;
        }
        timers_.push_back(TimedTask{std::chrono::steady_clock::now() + delay, next_sequence_++, std::move(task)});
        std::push_heap(timers_.begin(), timers_.end(), &CooperativeScheduler::laterThan);
    }
    queue_cv_.notify_one();
    return true;
}

bool CooperativeScheduler::isSchedulerThread() const
{
    return std::this_thread::get_id() == scheduler_thread_.get_id();
}

size_t CooperativeScheduler::getPendingTaskCount() const
{
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return ready_tasks_.size() + timers_.size();
}

bool CooperativeScheduler::laterThan(const TimedTask &a, const TimedTask &b)
{
    if (a.due != b.due)
    {
        return a.due > b.due;
    }
    return a.sequence > b.sequence;
}

void CooperativeScheduler::promoteDueTimers(std::chrono::steady_clock::time_point now)
{
    while (!timers_.empty() && timers_.front().due <= now)
    {
        std::pop_heap(timers_.begin(), timers_.end(), &CooperativeScheduler::laterThan);
        ready_tasks_.push_back(std::move(timers_.back().task));
        timers_.pop_back();
    }
}

void CooperativeScheduler::schedulerLoop()
{
    while (true)
    {
        Task task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            while (running_.load())
            {
                promoteDueTimers(std::chrono::steady_clock::now());
                if (!ready_tasks_.empty())
                {
                    break;
                }

                if (timers_.empty())
                {
                    queue_cv_.wait(lock);
                }
                else
                {
                    queue_cv_.wait_until(lock, timers_.front().due);
                }
            }

            if (!running_.load())
            {
                break;
            }

            task = std::move(ready_tasks_.front());
            ready_tasks_.pop_front();
        }

        try
        {
            task();
        }
        catch (const std::exception &e)
        {
            Logger::error("Scheduler '" + name_ + "' task threw: " + std::string(e.what()));
        }
        catch (...)
        {
            Logger::error("Scheduler '" + name_ + "' task threw an unknown exception");
        }
    }
}
