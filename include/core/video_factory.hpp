#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "core/blocking_worker_pool.hpp"
#include "core/channel_registry.hpp"
#include "core/pipeline_config.hpp"
#include "core/pipeline_orchestrator.hpp"
#include "core/process_runner.hpp"
#include "core/stock_photo_fetcher.hpp"
#include "tts/speech_synthesizer.hpp"

/**
 * @brief Vendor connections handed to the factory.
 *
 * Only the script generator is required. A provider without a transport has
 * no synthesizer, so channels bound to it fail before the first stage.
 */
struct VideoFactoryTransports
{
    std::shared_ptr<ScriptGenerator> script_generator;
    std::shared_ptr<AsyncSpeechTransport> edge_transport;
    std::shared_ptr<BlockingSpeechTransport> elevenlabs_transport;
    std::shared_ptr<PhotoSearchTransport> photo_transport;
    std::shared_ptr<CommandRunner> command_runner; // ProcessRunner when unset
};

/**
 * @brief Builds the pipeline components from settings and runs one channel.
 *
 * Every orchestrator created here shares the registry, the blocking worker
 * pool and the stage collaborators; each run gets its own orchestrator.
 */
class VideoFactory
{
public:
    /**
     * @throws std::invalid_argument without a script generator or pool, or on an invalid channel list
     */
    VideoFactory(const FactorySettings &settings,
                 const std::vector<ChannelConfig> &channels,
                 std::shared_ptr<BlockingWorkerPool> pool,
                 VideoFactoryTransports transports);

    std::unique_ptr<PipelineOrchestrator> createOrchestrator() const;

    /**
     * @brief Run the pipeline for a channel on a fresh orchestrator
     * @param topic Falls back to the configured theme, then to the channel name
     */
    PipelineResult run(const std::string &channel_name, const std::string &topic = "") const;

    ProviderSelector createSelector() const;

    std::shared_ptr<const ChannelRegistry> getRegistry() const { return registry_; }
    bool hasSynthesizer(TtsProvider provider) const { return synthesizers_.count(provider) > 0; }

private:
    FactorySettings settings_;
    std::shared_ptr<const ChannelRegistry> registry_;
    std::shared_ptr<BlockingWorkerPool> pool_;
    std::map<TtsProvider, std::shared_ptr<SpeechSynthesizer>> synthesizers_;
    PipelineCollaborators collaborators_;
};
