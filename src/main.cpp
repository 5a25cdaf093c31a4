#include "core/channel_registry.hpp"
#include "core/pipeline_config.hpp"
#include "core/provider_selector.hpp"
#include "core/script_file_generator.hpp"
#include "core/video_factory.hpp"
#include "logging/logger.hpp"
#include "tts/edge_tts_command_transport.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "Video Factory - provider preflight and pipeline runner" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --settings, -s PATH   Settings file (default: config/settings.yaml)" << std::endl;
        std::cout << "  --channels, -c PATH   Channels file (default: config/channels.json)" << std::endl;
        std::cout << "  --channel NAME        Check one channel instead of all" << std::endl;
        std::cout << "  --run                 Produce a video for --channel instead of checking" << std::endl;
        std::cout << "  --script PATH         Narration script of the run (required with --run)" << std::endl;
        std::cout << "  --topic TEXT          Topic of the run (default: assets theme)" << std::endl;
        std::cout << "  --help, -h            Show this help message" << std::endl;
    }

    int runChannel(const FactorySettings &settings, const std::vector<ChannelConfig> &channels,
                   const std::string &channel, const std::string &script_path, const std::string &topic)
    {
        auto pool = std::make_shared<BlockingWorkerPool>(settings.blocking_pool_size);
        auto runner = std::make_shared<ProcessRunner>();

        VideoFactoryTransports transports;
        transports.script_generator = std::make_shared<ScriptFileGenerator>(script_path);
        transports.command_runner = runner;
        if (runner->findExecutable(EdgeTtsCommandTransport::CLIENT_BINARY))
        {
            transports.edge_transport = std::make_shared<EdgeTtsCommandTransport>(pool, runner);
        }
        else
        {
            Logger::warn("[TTS] " + std::string(EdgeTtsCommandTransport::CLIENT_BINARY) +
                         " not found on PATH, Edge voices are unavailable");
        }
        // No HTTP client ships with this binary; ElevenLabs and stock photos need injected transports

        PipelineResult result = [&]()
        {
            VideoFactory factory(settings, channels, pool, transports);
            return factory.run(channel, topic);
        }();
        pool->shutdown();

        if (!result.ok())
        {
            std::cout << channel << ": " << PipelineStates::describe(result) << std::endl;
            return 1;
        }
        std::cout << channel << ": " << result.value().video_path << std::endl;
        return 0;
    }
}

int main(int argc, char *argv[])
{
    std::string settings_path = "config/settings.yaml";
    std::string channels_path = "config/channels.json";
    std::string only_channel;
    std::string script_path;
    std::string topic;
    bool run = false;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "--run")
        {
            run = true;
            continue;
        }

        if (i + 1 >= argc)
        {
            std::cerr << "Error: missing value for " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        if (arg == "--settings" || arg == "-s")
        {
            settings_path = argv[++i];
        }
        else if (arg == "--channels" || arg == "-c")
        {
            channels_path = argv[++i];
        }
        else if (arg == "--channel")
        {
            only_channel = argv[++i];
        }
        else if (arg == "--script")
        {
            script_path = argv[++i];
        }
        else if (arg == "--topic")
        {
            topic = argv[++i];
        }
        else
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if (run && (only_channel.empty() || script_path.empty()))
    {
        std::cerr << "Error: --run requires --channel and --script" << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    FactorySettings settings;
    std::vector<ChannelConfig> channel_configs;
    std::shared_ptr<const ChannelRegistry> registry;
    try
    {
        settings = ConfigLoader::loadSettings(settings_path);
        Logger::init(settings.log_level);
        channel_configs = ConfigLoader::loadChannels(channels_path);
        registry = std::make_shared<const ChannelRegistry>(channel_configs);
    }
    catch (const std::exception &e)
    {
        Logger::error("[CONFIG] " + std::string(e.what()));
        return 1;
    }

    if (registry->size() == 0)
    {
        Logger::error("[CONFIG] No channels configured.");
        return 1;
    }

    if (run)
    {
        return runChannel(settings, channel_configs, only_channel, script_path, topic);
    }

    ProviderSelector selector(registry, settings.tts_provider_active);
    Logger::info("[CONFIG] Active TTS provider: " + selector.getActiveProvider());

    std::vector<std::string> channels = only_channel.empty() ? registry->channelNames()
                                                             : std::vector<std::string>{only_channel};

    int failures = 0;
    for (const auto &name : channels)
    {
        auto selection = selector.resolve(name);
        if (selection.ok())
        {
            std::cout << name << ": " << TtsProviders::getProviderName(selection.value().provider)
                      << " voice=" << selection.value().voice_id << std::endl;
        }
        else
        {
            ++failures;
            std::cout << name << ": " << PipelineErrors::getKindName(selection.error().kind)
                      << " (" << selection.error().message << ")" << std::endl;
        }
    }

    if (failures > 0)
    {
        Logger::error("[CONFIG] " + std::to_string(failures) + " of " + std::to_string(channels.size()) +
                      " channels failed provider resolution");
        return 1;
    }

    Logger::info("[CONFIG] All " + std::to_string(channels.size()) + " channels resolved");
    return 0;
}
