#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include "core/cancellation_token.hpp"
#include "core/cooperative_scheduler.hpp"
#include "core/pipeline_errors.hpp"
#include "core/result.hpp"
#include "logging/logger.hpp"

/**
 * @brief Bounded retry policy of a pipeline stage
 *
 * max_attempts counts every call, the first one included.
 */
struct RetryPolicy
{
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{500};

    // Exponential backoff: base, 2*base, 4*base...
    std::chrono::milliseconds delayAfterAttempt(int attempt) const
    {
        int shift = attempt > 1 ? attempt - 1 : 0;
        if (shift > 16)
            shift = 16;
        return base_delay * (1 << shift);
    }
};

class ErrorRecovery
{
public:
    template <typename T, typename E>
    using AsyncOperation = std::function<void(Completion<Result<T, E>>)>;

    template <typename T, typename E>
    using RetryCompletion = std::function<void(Result<T, E>, int attempts)>;

    /**
     * @brief Run an operation, retrying retryable errors with exponential backoff.
     *
     * Every attempt's completion is marshalled onto the scheduler before it is
     * inspected, and the wait between attempts is a scheduler timer, so the
     * scheduler thread never sleeps. A provider retry-after hint replaces the
     * computed delay. on_done fires once, on the scheduler thread, with the
     * final result and the number of attempts made. Once the token is
     * cancelled no further attempt starts and on_done is not invoked.
     */
    template <typename T, typename E>
    static void retryWithBackoff(std::shared_ptr<CooperativeScheduler> scheduler,
                                 const RetryPolicy &policy,
                                 const CancellationToken &token,
                                 const std::string &operation_name,
                                 AsyncOperation<T, E> operation,
                                 RetryCompletion<T, E> on_done)
    {
        auto retrying = std::make_shared<RetryingOperation<T, E>>(
            std::move(scheduler), policy, token, operation_name, std::move(operation), std::move(on_done));
        retrying->attempt();
    }

private:
    template <typename T, typename E>
    class RetryingOperation : public std::enable_shared_from_this<RetryingOperation<T, E>>
    {
    public:
        RetryingOperation(std::shared_ptr<CooperativeScheduler> scheduler,
                          const RetryPolicy &policy,
                          const CancellationToken &token,
                          const std::string &operation_name,
                          AsyncOperation<T, E> operation,
                          RetryCompletion<T, E> on_done)
            : scheduler_(std::move(scheduler)), policy_(policy), token_(token),
              operation_name_(operation_name), operation_(std::move(operation)), on_done_(std::move(on_done))
        {
        }

        void attempt()
        {
            if (token_.isCancelled())
            {
                Logger::debug("Operation '" + operation_name_ + "' cancelled before attempt " + std::to_string(attempts_ + 1));
                return;
            }

            ++attempts_;
            auto self = this->shared_from_this();
            operation_([self](Result<T, E> result)
                       { self->scheduler_->post([self, result]() mutable
                                                { self->handle(std::move(result)); }); });
        }

    private:
        void handle(Result<T, E> result)
        {
            if (token_.isCancelled())
            {
                Logger::debug("Operation '" + operation_name_ + "' completed after cancellation, result dropped");
                return;
            }

            if (result.ok() || !result.error().isRetryable())
            {
                on_done_(std::move(result), attempts_);
                return;
            }

            int max_attempts = policy_.max_attempts > 0 ? policy_.max_attempts : 1;
            if (attempts_ >= max_attempts)
            {
                Logger::error("Operation '" + operation_name_ + "' failed after " + std::to_string(attempts_) +
                              " attempts: " + result.error().message);
                on_done_(std::move(result), attempts_);
                return;
            }

            auto delay = retryAfterHint(result.error()).value_or(policy_.delayAfterAttempt(attempts_));
            Logger::warn("Operation '" + operation_name_ + "' failed, retrying in " +
                         std::to_string(delay.count()) + "ms (attempt " + std::to_string(attempts_) +
                         "/" + std::to_string(max_attempts) + "): " + result.error().message);

            auto self = this->shared_from_this();
            scheduler_->postAfter(delay, [self]()
                                  { self->attempt(); });
        }

        std::shared_ptr<CooperativeScheduler> scheduler_;
        RetryPolicy policy_;
        CancellationToken token_;
        std::string operation_name_;
        AsyncOperation<T, E> operation_;
        RetryCompletion<T, E> on_done_;
        int attempts_ = 0;
    };
};
