#include "core/video_factory.hpp"
#include "core/directory_asset_resolver.hpp"
#include "core/ffmpeg_video_composer.hpp"
#include "logging/logger.hpp"
#include "tts/blocking_synthesizer_adapter.hpp"
#include "tts/edge_synthesizer.hpp"
#include "tts/elevenlabs_synthesizer.hpp"
#include <stdexcept>

VideoFactory::VideoFactory(const FactorySettings &settings,
                           const std::vector<ChannelConfig> &channels,
                           std::shared_ptr<BlockingWorkerPool> pool,
                           VideoFactoryTransports transports)
    : settings_(settings), registry_(std::make_shared<const ChannelRegistry>(channels)), pool_(std::move(pool))
{
    if (!pool_)
    {
        throw std::invalid_argument("VideoFactory requires a blocking worker pool");
    }
    if (!transports.script_generator)
    {
        throw std::invalid_argument("VideoFactory requires a script generator");
    }

    if (transports.edge_transport)
    {
        synthesizers_[TtsProvider::EDGE] = std::make_shared<EdgeSynthesizer>(transports.edge_transport);
    }
    if (transports.elevenlabs_transport)
    {
        auto provider = std::make_shared<ElevenLabsSynthesizer>(transports.elevenlabs_transport,
                                                                settings_.elevenlabs_api_key);
        synthesizers_[TtsProvider::ELEVENLABS] = std::make_shared<BlockingSynthesizerAdapter>(provider, pool_);
    }

    std::shared_ptr<StockPhotoFetcher> photo_fetcher;
    if (transports.photo_transport)
    {
        photo_fetcher = std::make_shared<StockPhotoFetcher>(settings_.assets, transports.photo_transport);
    }
    else if (settings_.assets.auto_generate)
    {
        Logger::warn("[ASSETS] Auto-generate enabled but no photo service is available");
    }

    auto runner = transports.command_runner ? transports.command_runner : std::make_shared<ProcessRunner>();

    collaborators_.script_generator = transports.script_generator;
    collaborators_.asset_resolver = std::make_shared<DirectoryAssetResolver>(settings_.paths, pool_, photo_fetcher);
    collaborators_.video_composer = std::make_shared<FfmpegVideoComposer>(settings_.video, pool_, runner);

    Logger::info("[PIPELINE] Video factory ready with " + std::to_string(synthesizers_.size()) +
                 " speech providers and " + std::to_string(registry_->size()) + " channels");
}

ProviderSelector VideoFactory::createSelector() const
{
    return ProviderSelector(registry_, settings_.tts_provider_active, synthesizers_);
}

std::unique_ptr<PipelineOrchestrator> VideoFactory::createOrchestrator() const
{
    PipelinePaths paths;
    paths.output_dir = settings_.paths.output_dir;
    paths.temp_dir = settings_.paths.temp_dir;
    return std::make_unique<PipelineOrchestrator>(createSelector(), collaborators_, settings_.retry, paths);
}

PipelineResult VideoFactory::run(const std::string &channel_name, const std::string &topic) const
{
    std::string run_topic = topic;
    if (run_topic.empty())
    {
        run_topic = settings_.assets.theme.empty() ? channel_name : settings_.assets.theme;
    }

    auto orchestrator = createOrchestrator();
    return orchestrator->runPipeline(channel_name, run_topic);
}
