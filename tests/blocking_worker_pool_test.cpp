#include <gtest/gtest.h>
#include "core/blocking_worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

TEST(BlockingWorkerPoolTest, InvalidSizeFallsBackToDefault)
{
    BlockingWorkerPool zero(0);
    BlockingWorkerPool huge(1000);

    EXPECT_EQ(zero.getPoolSize(), BlockingWorkerPool::DEFAULT_POOL_SIZE);
    EXPECT_EQ(huge.getPoolSize(), BlockingWorkerPool::DEFAULT_POOL_SIZE);
}

TEST(BlockingWorkerPoolTest, SingleWorkerRunsJobsInSubmissionOrder)
{
    BlockingWorkerPool pool(1);
    std::mutex mutex;
    std::vector<int> order;

    for (int i = 0; i < 20; ++i)
    {
        ASSERT_TRUE(pool.submit([&, i]()
                                {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i); }));
    }
    pool.shutdown();

    ASSERT_EQ(order.size(), 20u);
    for (int i = 0; i < 20; ++i)
    {
        EXPECT_EQ(order[i], i);
    }
}

TEST(BlockingWorkerPoolTest, BlockingJobsDoNotStallOtherWorkers)
{
    BlockingWorkerPool pool(2);
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::promise<void> second_done;

    pool.submit([released]()
                { released.wait(); });
    pool.submit([&second_done]()
                { second_done.set_value(); });

    EXPECT_EQ(second_done.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
    release.set_value();
}

TEST(BlockingWorkerPoolTest, SubmitAfterShutdownIsRejected)
{
    BlockingWorkerPool pool(2);
    pool.shutdown();

    EXPECT_TRUE(pool.isShutdown());
    EXPECT_FALSE(pool.submit([]() {}));
}

TEST(BlockingWorkerPoolTest, EmptyJobIsRejected)
{
    BlockingWorkerPool pool(1);
    EXPECT_FALSE(pool.submit(BlockingWorkerPool::Job()));
}

TEST(BlockingWorkerPoolTest, ShutdownDrainsQueuedJobs)
{
    BlockingWorkerPool pool(1);
    std::atomic<int> done{0};

    for (int i = 0; i < 10; ++i)
    {
        pool.submit([&done]()
                    {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ++done; });
    }
    pool.shutdown();

    EXPECT_EQ(done.load(), 10);
}

TEST(BlockingWorkerPoolTest, ThrowingJobDoesNotKillWorker)
{
    BlockingWorkerPool pool(1);
    std::promise<void> after;

    pool.submit([]()
                { throw std::runtime_error("boom"); });
    pool.submit([&after]()
                { after.set_value(); });

    EXPECT_EQ(after.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
}

TEST(BlockingWorkerPoolTest, NonStandardExceptionDoesNotKillWorker)
{
    BlockingWorkerPool pool(1);
    std::promise<void> after;

    pool.submit([]()
                { throw 42; });
    pool.submit([&after]()
                { after.set_value(); });

    EXPECT_EQ(after.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
}

TEST(BlockingWorkerPoolTest, JobMayHoldTheLastReferenceToThePool)
{
    auto pool = std::make_shared<BlockingWorkerPool>(2);
    std::weak_ptr<BlockingWorkerPool> observer = pool;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::promise<void> job_ran;

    ASSERT_TRUE(pool->submit([owner = pool, released, &job_ran]()
                             {
        released.wait();
        job_ran.set_value(); }));
    pool.reset();
    EXPECT_FALSE(observer.expired());

    release.set_value();
    ASSERT_EQ(job_ran.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);

    // The pool is destroyed on its own worker once the job is released
    for (int i = 0; i < 500 && !observer.expired(); ++i)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(observer.expired());

    // Workers of a freshly built pool are unaffected
    BlockingWorkerPool next(1);
    std::promise<void> next_ran;
    next.submit([&next_ran]()
                { next_ran.set_value(); });
    EXPECT_EQ(next_ran.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
}
