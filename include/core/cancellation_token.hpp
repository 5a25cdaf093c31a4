#pragma once

#include <atomic>
#include <memory>

/**
 * @brief Shared cancellation flag of one pipeline run.
 *
 * Copies observe the same flag. Once cancelled it stays cancelled.
 */
class CancellationToken
{
public:
    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { cancelled_->store(true); }
    bool isCancelled() const noexcept { return cancelled_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};
