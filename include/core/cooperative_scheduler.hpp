#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Single-threaded cooperative scheduler of one pipeline orchestrator.
 *
 * Tasks run one at a time on the scheduler thread, in the order they were
 * posted. A task never waits for I/O: an operation that has to wait registers
 * a completion and returns, and the completion posts the continuation back
 * here. Delayed tasks (retry backoff) are kept in a timer heap and become
 * ready when due, so waiting out a backoff does not occupy the thread.
 */
class CooperativeScheduler
{
public:
    using Task = std::function<void()>;

    explicit CooperativeScheduler(const std::string &name = "pipeline");
    ~CooperativeScheduler();

    void start();

    /**
     * @brief Stop the scheduler thread. Tasks still queued are dropped.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Queue a task behind every task already posted
     * @return false when the scheduler is not running and the task was dropped
     */
    bool post(Task task);

    /**
     * @brief Queue a task once the delay has elapsed
     * @return false when the scheduler is not running and the task was dropped
     */
    bool postAfter(std::chrono::milliseconds delay, Task task);

    /**
     * @brief Whether the caller is running on the scheduler thread
     */
    bool isSchedulerThread() const;

    size_t getPendingTaskCount() const;

private:
    CooperativeScheduler(const CooperativeScheduler &) = delete;
    CooperativeScheduler &operator=(const CooperativeScheduler &) = delete;

    struct TimedTask
    {
        std::chrono::steady_clock::time_point due;
        uint64_t sequence;
        Task task;
    };

    // Min-heap order on (due, sequence)
    static bool laterThan(const TimedTask &a, const TimedTask &b);

    void schedulerLoop();
    void promoteDueTimers(std::chrono::steady_clock::time_point now);

    std::string name_;
    std::atomic<bool> running_{false};
    std::thread scheduler_thread_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Task> ready_tasks_;
    std::vector<TimedTask> timers_;
    uint64_t next_sequence_{0};
};
