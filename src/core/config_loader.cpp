#include "core/pipeline_config.hpp"
#include "core/blocking_worker_pool.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace
{
    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    template <typename T>
    void readOptional(const YAML::Node &node, const char *key, T &target)
    {
        if (node && node[key])
        {
            target = node[key].as<T>();
        }
    }
}

FactorySettings ConfigLoader::loadSettings(const std::string &file_path)
{
    FactorySettings settings = parseSettings(readFile(file_path));

    const char *env_key = std::getenv(API_KEY_ENV);
    if (env_key != nullptr && *env_key != '\0')
    {
        settings.elevenlabs_api_key = env_key;
        Logger::debug("[CONFIG] ElevenLabs API key taken from environment");
    }

    Logger::info("[CONFIG] Settings loaded from: " + file_path);
    return settings;
}

FactorySettings ConfigLoader::parseSettings(const std::string &yaml_text)
{
    FactorySettings settings;

    try
    {
        YAML::Node config = YAML::Load(yaml_text);
        if (config && !config.IsNull() && !config.IsMap())
        {
            throw ConfigLoadError("Settings must be a YAML mapping");
        }

        readOptional(config, "log_level", settings.log_level);
        readOptional(config, "tts_provider_active", settings.tts_provider_active);
        settings.tts_provider_active = toLower(settings.tts_provider_active);
        readOptional(config, "elevenlabs_api_key", settings.elevenlabs_api_key);

        const YAML::Node &retry = config["retry"];
        readOptional(retry, "max_attempts", settings.retry.max_attempts);
        if (retry && retry["base_delay_ms"])
        {
            settings.retry.base_delay = std::chrono::milliseconds(retry["base_delay_ms"].as<int>());
        }

        const YAML::Node &threading = config["threading"];
        if (threading && threading["blocking_pool_size"])
        {
            int pool_size = threading["blocking_pool_size"].as<int>();
            settings.blocking_pool_size = pool_size > 0 ? static_cast<size_t>(pool_size) : 0;
        }

        const YAML::Node &paths = config["paths"];
        readOptional(paths, "assets_dir", settings.paths.assets_dir);
        readOptional(paths, "output_dir", settings.paths.output_dir);
        readOptional(paths, "temp_dir", settings.paths.temp_dir);

        const YAML::Node &assets = config["assets"];
        readOptional(assets, "auto_generate", settings.assets.auto_generate);
        readOptional(assets, "theme", settings.assets.theme);
        readOptional(assets, "pexels_api_key", settings.assets.pexels_api_key);
        readOptional(assets, "pexels_per_page", settings.assets.pexels_per_page);

        const YAML::Node &video = config["video"];
        readOptional(video, "resolution", settings.video.resolution);
        readOptional(video, "fps", settings.video.fps);
        readOptional(video, "image_duration_seconds", settings.video.image_duration_seconds);
    }
    catch (const YAML::Exception &e)
    {
        throw ConfigLoadError("Malformed settings: " + std::string(e.what()));
    }

    if (!validateSettings(settings))
    {
        throw ConfigLoadError("Invalid settings");
    }
    return settings;
}

std::vector<ChannelConfig> ConfigLoader::loadChannels(const std::string &file_path)
{
    auto channels = parseChannels(readFile(file_path));
    Logger::info("[CONFIG] Loaded " + std::to_string(channels.size()) + " channels from: " + file_path);
    return channels;
}

std::vector<ChannelConfig> ConfigLoader::parseChannels(const std::string &json_text)
{
    std::vector<ChannelConfig> channels;

    try
    {
        auto json_obj = nlohmann::json::parse(json_text);
        if (!json_obj.is_array())
        {
            throw ConfigLoadError("Channels must be a JSON array");
        }

        for (const auto &entry : json_obj)
        {
            ChannelConfig channel;
            channel.name = entry.value("name", "");
            if (channel.name.empty())
            {
                throw ConfigLoadError("Channel entry without a name");
            }
            channel.language = entry.value("language", "");

            if (entry.contains("voice_ids"))
            {
                for (const auto &item : entry["voice_ids"].items())
                {
                    auto provider = TtsProviders::fromString(item.key());
                    if (!provider)
                    {
                        Logger::warn("[CONFIG] Channel " + channel.name + ": ignoring voice for unknown provider '" +
                                     item.key() + "'");
                        continue;
                    }
                    channel.voice_ids[*provider] = item.value().get<std::string>();
                }
            }

            channels.push_back(std::move(channel));
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        throw ConfigLoadError("Malformed channels: " + std::string(e.what()));
    }

    return channels;
}

bool ConfigLoader::validateSettings(const FactorySettings &settings)
{
    if (!Logger::isValidLevel(settings.log_level))
    {
        Logger::error("[CONFIG] Invalid log level: " + settings.log_level);
        return false;
    }
    if (settings.retry.max_attempts < 1)
    {
        Logger::error("[CONFIG] Invalid retry.max_attempts: " + std::to_string(settings.retry.max_attempts));
        return false;
    }
    if (settings.retry.base_delay.count() < 0)
    {
        Logger::error("[CONFIG] Invalid retry.base_delay_ms: " + std::to_string(settings.retry.base_delay.count()));
        return false;
    }
    if (!BlockingWorkerPool::validatePoolSize(settings.blocking_pool_size))
    {
        Logger::error("[CONFIG] Invalid threading.blocking_pool_size: " + std::to_string(settings.blocking_pool_size));
        return false;
    }
    if (settings.assets.pexels_per_page < 1 || settings.assets.pexels_per_page > 80)
    {
        Logger::error("[CONFIG] Invalid assets.pexels_per_page: " + std::to_string(settings.assets.pexels_per_page));
        return false;
    }
    if (settings.video.resolution != "720p" && settings.video.resolution != "1080p" && settings.video.resolution != "4k")
    {
        Logger::error("[CONFIG] Invalid video.resolution: " + settings.video.resolution);
        return false;
    }
    if (settings.video.fps < 1)
    {
        Logger::error("[CONFIG] Invalid video.fps: " + std::to_string(settings.video.fps));
        return false;
    }
    if (settings.video.image_duration_seconds < 1)
    {
        Logger::error("[CONFIG] Invalid video.image_duration_seconds: " +
                      std::to_string(settings.video.image_duration_seconds));
        return false;
    }
    return true;
}

std::string ConfigLoader::readFile(const std::string &file_path)
{
    std::ifstream file(file_path);
    if (!file.is_open())
    {
        throw ConfigLoadError("Could not open config file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}
