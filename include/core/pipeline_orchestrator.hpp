#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include "core/cooperative_scheduler.hpp"
#include "core/error_recovery.hpp"
#include "core/pipeline_result.hpp"
#include "core/pipeline_stages.hpp"
#include "core/provider_selector.hpp"

/**
 * @brief Stage collaborators of the pipeline
 */
struct PipelineCollaborators
{
    std::shared_ptr<ScriptGenerator> script_generator;
    std::shared_ptr<AssetResolver> asset_resolver;
    std::shared_ptr<VideoComposer> video_composer;
};

/**
 * @brief Output locations of run artifacts
 */
struct PipelinePaths
{
    std::string output_dir = "./output";
    std::string temp_dir = "./temp";
};

class PipelineRun;

/**
 * @brief Drives one channel through script, audio, assets and video.
 *
 * Error Handling Policy:
 * - Configuration errors are detected before the first stage starts and
 *   reported as a PREFLIGHT failure; no collaborator is called.
 * - Within a stage, retryable errors are retried with exponential backoff up
 *   to RetryPolicy::max_attempts; any other error, or exhausting the attempts,
 *   fails the run at that stage and no later stage runs.
 * - Exceptions thrown by collaborators are converted into the stage's
 *   non-retryable error kind.
 * - runPipeline() always returns a terminal result naming stage and error kind.
 *
 * Stages run on the orchestrator's own cooperative scheduler, one at a time.
 * Each orchestrator serves one run at a time; concurrent channels use separate
 * orchestrators that may share the registry and the blocking worker pool.
 */
class PipelineOrchestrator
{
public:
    PipelineOrchestrator(ProviderSelector selector,
                         PipelineCollaborators collaborators,
                         const RetryPolicy &retry_policy = RetryPolicy(),
                         const PipelinePaths &paths = PipelinePaths());

    /**
     * @brief Cancel the run in progress and wait until its runPipeline() call returns
     */
    ~PipelineOrchestrator();

    /**
     * @brief Run the pipeline for a channel and topic, blocking until the run terminates
     *
     * Must not be called from the orchestrator's scheduler thread.
     *
     * @throws std::logic_error when called from the scheduler thread
     */
    PipelineResult runPipeline(const std::string &channel_name, const std::string &topic);

    /**
     * @brief Cancel the run in progress, if any
     *
     * The run ends with a CANCELLED failure at its current stage; pending
     * retries are dropped and late completions are ignored.
     */
    void cancel();

    PipelineState getState() const { return state_->load(); }

private:
    PipelineOrchestrator(const PipelineOrchestrator &) = delete;
    PipelineOrchestrator &operator=(const PipelineOrchestrator &) = delete;

    ProviderSelector selector_;
    PipelineCollaborators collaborators_;
    RetryPolicy retry_policy_;
    PipelinePaths paths_;

    std::shared_ptr<CooperativeScheduler> scheduler_;
    std::shared_ptr<std::atomic<PipelineState>> state_;

    // Serializes runs on this orchestrator
    std::mutex run_mutex_;
    std::atomic<bool> closing_{false};

    mutable std::mutex current_run_mutex_;
    std::shared_ptr<PipelineRun> current_run_;
};
