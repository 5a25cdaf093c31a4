#include "core/pipeline_orchestrator.hpp"
#include "core/script_sections.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <future>
#include <optional>
#include <stdexcept>

namespace fs = std::filesystem;

/**
 * @brief State machine of a single pipeline run.
 *
 * Every member function except start() and cancel() runs on the scheduler
 * thread, so the run-scoped artifacts need no locking.
 */
class PipelineRun : public std::enable_shared_from_this<PipelineRun>
{
public:
    PipelineRun(std::shared_ptr<CooperativeScheduler> scheduler,
                const PipelineCollaborators &collaborators,
                SynthesisBinding binding,
                const RetryPolicy &policy,
                const PipelinePaths &paths,
                const std::string &topic,
                std::shared_ptr<std::atomic<PipelineState>> state,
                Completion<PipelineResult> on_finished)
        : scheduler_(std::move(scheduler)), collaborators_(collaborators), binding_(std::move(binding)),
          policy_(policy), paths_(paths), topic_(topic), state_(std::move(state)), on_finished_(std::move(on_finished))
    {
    }

    void start()
    {
        auto self = shared_from_this();
        if (!scheduler_->post([self]()
                              { self->generateScript(); }))
        {
            // Scheduler already stopped: report instead of leaving the caller waiting
            finish(PipelineResult::Failure({PipelineStage::PREFLIGHT, PipelineErrorKind::CANCELLED,
                                            "Pipeline scheduler is not running", 0, PartialArtifacts()}));
        }
    }

    void cancel()
    {
        token_.cancel();
        auto self = shared_from_this();
        scheduler_->post([self]()
                         { self->fail(self->currentStage(), PipelineErrorKind::CANCELLED, "Run cancelled", 0); });
    }

private:
    const std::string &channelName() const { return binding_.channel.name; }

    void generateScript()
    {
        if (finished_)
        {
            return;
        }
        transition(PipelineState::SCRIPT_GENERATING);
        Logger::info("[LLM] Generating script for topic '" + topic_ + "' (language " + binding_.channel.language + ")");

        auto self = shared_from_this();
        ErrorRecovery::retryWithBackoff<ScriptText, GenerationError>(
            scheduler_, policy_, token_, "script generation",
            [self](Completion<GenerationResult> done)
            {
                try
                {
                    self->collaborators_.script_generator->generate(self->topic_, self->binding_.channel.language, self->token_, done);
                }
                catch (const std::exception &e)
                {
                    done(GenerationResult::Failure({GenerationErrorKind::INVALID_PROMPT,
                                                    "Script generator threw: " + std::string(e.what())}));
                }
            },
            [self](GenerationResult result, int attempts)
            { self->onScript(std::move(result), attempts); });
    }

    void onScript(GenerationResult result, int attempts)
    {
        if (!result.ok())
        {
            fail(PipelineStage::SCRIPT_GENERATING, PipelineErrors::toPipelineKind(result.error().kind),
                 result.error().message, attempts);
            return;
        }

        script_ = std::move(result.value());
        sections_ = ScriptSections::split(script_);
        if (sections_.empty())
        {
            fail(PipelineStage::SCRIPT_GENERATING, PipelineErrorKind::INVALID_PROMPT,
                 "Script generator returned an empty script", attempts);
            return;
        }

        Logger::info("[LLM] Script ready: " + std::to_string(script_.size()) + " chars, " +
                     std::to_string(sections_.size()) + " sections");
        synthesizeAudio();
    }

    void synthesizeAudio()
    {
        transition(PipelineState::SYNTHESIZING);

        SpeechRequest request;
        request.text = script_;
        request.voice_id = binding_.selection.voice_id;
        request.output_path = (fs::path(paths_.temp_dir) / (channelName() + "_narration.mp3")).string();

        const std::string provider_name = TtsProviders::getProviderName(binding_.selection.provider);
        Logger::info("[TTS] Provider=" + provider_name + " Output=" + request.output_path);

        auto self = shared_from_this();
        ErrorRecovery::retryWithBackoff<AudioArtifact, SynthesisError>(
            scheduler_, policy_, token_, "speech synthesis (" + provider_name + ")",
            [self, request](SynthesisCompletion done)
            {
                try
                {
                    self->binding_.synthesizer->synthesize(request, self->token_, done);
                }
                catch (const std::exception &e)
                {
                    done(SynthesisResult::Failure({SynthesisErrorKind::UNEXPECTED_RESPONSE,
                                                   "Synthesizer threw: " + std::string(e.what()),
                                                   std::nullopt}));
                }
            },
            [self](SynthesisResult result, int attempts)
            { self->onAudio(std::move(result), attempts); });
    }

    void onAudio(SynthesisResult result, int attempts)
    {
        if (!result.ok())
        {
            Logger::error("[TTS] Failed to generate audio: " + result.error().message);
            fail(PipelineStage::SYNTHESIZING, PipelineErrors::toPipelineKind(result.error().kind),
                 result.error().message, attempts);
            return;
        }

        audio_ = std::move(result.value());
        Logger::info("[TTS] Audio ready: " + audio_->location + " (" +
                     std::to_string(audio_->duration.count()) + " ms)");
        resolveAssets();
    }

    void resolveAssets()
    {
        transition(PipelineState::ASSET_RESOLVING);

        auto self = shared_from_this();
        ErrorRecovery::retryWithBackoff<std::vector<AssetItem>, AssetError>(
            scheduler_, policy_, token_, "asset resolution",
            [self](Completion<AssetResult> done)
            {
                try
                {
                    self->collaborators_.asset_resolver->resolve(self->sections_, self->token_, done);
                }
                catch (const std::exception &e)
                {
                    done(AssetResult::Failure({AssetErrorKind::FETCH_FAILED,
                                               "Asset resolver threw: " + std::string(e.what())}));
                }
            },
            [self](AssetResult result, int attempts)
            { self->onAssets(std::move(result), attempts); });
    }

    void onAssets(AssetResult result, int attempts)
    {
        if (!result.ok())
        {
            fail(PipelineStage::ASSET_RESOLVING, PipelineErrors::toPipelineKind(result.error().kind),
                 result.error().message, attempts);
            return;
        }

        assets_ = std::move(result.value());
        Logger::info("[ASSETS] Resolved " + std::to_string(assets_.size()) + " assets");
        composeVideo();
    }

    void composeVideo()
    {
        transition(PipelineState::COMPOSING);

        const std::string output_path = (fs::path(paths_.output_dir) / (channelName() + "_final_video.mp4")).string();
        Logger::info("[VIDEO] Rendering video with " + std::to_string(assets_.size()) + " assets");

        auto self = shared_from_this();
        ErrorRecovery::retryWithBackoff<std::string, RenderError>(
            scheduler_, policy_, token_, "video composition",
            [self, output_path](Completion<RenderResult> done)
            {
                try
                {
                    self->collaborators_.video_composer->compose(*self->audio_, self->assets_, output_path, self->token_, done);
                }
                catch (const std::exception &e)
                {
                    done(RenderResult::Failure({RenderErrorKind::ENCODING_FAILED,
                                                "Video composer threw: " + std::string(e.what())}));
                }
            },
            [self](RenderResult result, int attempts)
            { self->onVideo(std::move(result), attempts); });
    }

    void onVideo(RenderResult result, int attempts)
    {
        if (!result.ok())
        {
            fail(PipelineStage::COMPOSING, PipelineErrors::toPipelineKind(result.error().kind),
                 result.error().message, attempts);
            return;
        }

        Logger::info("[VIDEO] Video saved at " + result.value());
        transition(PipelineState::DONE);
        finish(PipelineResult::Success(PipelineSuccess{result.value()}));
    }

    void transition(PipelineState next)
    {
        PipelineState previous = state_->exchange(next);
        Logger::debug("[PIPELINE] " + channelName() + ": " + PipelineStates::getStateName(previous) +
                      " -> " + PipelineStates::getStateName(next));
    }

    PipelineStage currentStage() const
    {
        switch (state_->load())
        {
        case PipelineState::SCRIPT_GENERATING:
            return PipelineStage::SCRIPT_GENERATING;
        case PipelineState::SYNTHESIZING:
            return PipelineStage::SYNTHESIZING;
        case PipelineState::ASSET_RESOLVING:
            return PipelineStage::ASSET_RESOLVING;
        case PipelineState::COMPOSING:
            return PipelineStage::COMPOSING;
        default:
            return PipelineStage::PREFLIGHT;
        }
    }

    void fail(PipelineStage stage, PipelineErrorKind kind, const std::string &message, int attempts)
    {
        if (finished_)
        {
            return;
        }

        // Nothing started after a fatal failure may still run
        token_.cancel();

        PartialArtifacts partial;
        partial.script = script_;
        if (audio_)
        {
            partial.audio_location = audio_->location;
        }
        for (const auto &asset : assets_)
        {
            partial.asset_locations.push_back(asset.location);
        }

        Logger::error("[PIPELINE] " + channelName() + " failed at " + PipelineStates::getStageName(stage) +
                      " (" + PipelineErrors::getKindName(kind) + "): " + message);
        transition(PipelineState::FAILED);
        finish(PipelineResult::Failure({stage, kind, message, attempts, std::move(partial)}));
    }

    void finish(PipelineResult result)
    {
        if (finished_)
        {
            return;
        }
        finished_ = true;

        // Run-scoped intermediates end with the run
        script_.clear();
        sections_.clear();
        audio_.reset();
        assets_.clear();

        if (on_finished_)
        {
            on_finished_(std::move(result));
        }
    }

    std::shared_ptr<CooperativeScheduler> scheduler_;
    PipelineCollaborators collaborators_;
    SynthesisBinding binding_;
    RetryPolicy policy_;
    PipelinePaths paths_;
    std::string topic_;
    std::shared_ptr<std::atomic<PipelineState>> state_;
    Completion<PipelineResult> on_finished_;
    CancellationToken token_;
    bool finished_ = false;

    ScriptText script_;
    std::vector<ScriptSection> sections_;
    std::optional<AudioArtifact> audio_;
    std::vector<AssetItem> assets_;
};

PipelineOrchestrator::PipelineOrchestrator(ProviderSelector selector,
                                           PipelineCollaborators collaborators,
                                           const RetryPolicy &retry_policy,
                                           const PipelinePaths &paths)
    : selector_(std::move(selector)), collaborators_(std::move(collaborators)), retry_policy_(retry_policy),
      paths_(paths), scheduler_(std::make_shared<CooperativeScheduler>("pipeline")),
      state_(std::make_shared<std::atomic<PipelineState>>(PipelineState::IDLE))
{
    if (!collaborators_.script_generator || !collaborators_.asset_resolver || !collaborators_.video_composer)
    {
        throw std::invalid_argument("PipelineOrchestrator requires a script generator, asset resolver and video composer");
    }
    if (retry_policy_.max_attempts < 1)
    {
        Logger::warn("Invalid retry max_attempts " + std::to_string(retry_policy_.max_attempts) + ", using 1");
        retry_policy_.max_attempts = 1;
    }

    scheduler_->start();
}

PipelineOrchestrator::~PipelineOrchestrator()
{
    closing_.store(true);
    cancel();

    // A run in progress ends as CANCELLED on the scheduler; wait for its caller to return
    std::lock_guard<std::mutex> run_lock(run_mutex_);
    scheduler_->stop();
    Logger::debug("PipelineOrchestrator destructor called");
}

PipelineResult PipelineOrchestrator::runPipeline(const std::string &channel_name, const std::string &topic)
{
    if (scheduler_->isSchedulerThread())
    {
        throw std::logic_error("runPipeline must not be called from the pipeline scheduler thread");
    }

    std::lock_guard<std::mutex> run_lock(run_mutex_);
    state_->store(PipelineState::IDLE);
    Logger::info("[PIPELINE] Starting run: channel=" + channel_name + " topic=" + topic);

    // Configuration is checked before any stage is entered
    auto binding = selector_.bind(channel_name);
    if (!binding.ok())
    {
        state_->store(PipelineState::FAILED);
        PipelineResult result = PipelineResult::Failure({PipelineStage::PREFLIGHT,
                                                         PipelineErrors::toPipelineKind(binding.error().kind),
                                                         binding.error().message, 0, PartialArtifacts()});
        Logger::error("[PIPELINE] " + PipelineStates::describe(result));
        return result;
    }

    auto promise = std::make_shared<std::promise<PipelineResult>>();
    std::future<PipelineResult> future = promise->get_future();

    auto run = std::make_shared<PipelineRun>(scheduler_, collaborators_, std::move(binding.value()), retry_policy_,
                                             paths_, topic, state_,
                                             [promise](PipelineResult result)
                                             { promise->set_value(std::move(result)); });
    {
        std::lock_guard<std::mutex> lock(current_run_mutex_);
        current_run_ = run;
        if (closing_.load())
        {
            // Destructor started before this run was registered
            run->cancel();
        }
    }

    run->start();
    PipelineResult result = future.get();

    {
        std::lock_guard<std::mutex> lock(current_run_mutex_);
        current_run_.reset();
    }

    Logger::info("[PIPELINE] Run finished: " + PipelineStates::describe(result));
    return result;
}

void PipelineOrchestrator::cancel()
{
    std::lock_guard<std::mutex> lock(current_run_mutex_);
    if (current_run_)
    {
        Logger::info("[PIPELINE] Cancelling run in progress");
        current_run_->cancel();
    }
}
