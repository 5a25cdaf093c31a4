#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include "core/channel_registry.hpp"
#include "core/error_recovery.hpp"

struct PathSettings
{
    std::string assets_dir = "./assets";
    std::string output_dir = "./output";
    std::string temp_dir = "./temp";
};

struct VideoSettings
{
    std::string resolution = "1080p"; // 720p, 1080p or 4k
    int fps = 30;
    int image_duration_seconds = 3;
};

/**
 * @brief Stock photo download used when the assets directory is empty
 */
struct AssetSettings
{
    bool auto_generate = false;
    std::string theme; // Search query; also the default topic of a run
    std::string pexels_api_key;
    int pexels_per_page = 6;
};

/**
 * @brief Settings of the video factory, read from settings.yaml
 */
struct FactorySettings
{
    std::string log_level = "INFO";
    // Lowercased, otherwise kept verbatim; validated when a channel is resolved
    std::string tts_provider_active = "edge";
    std::string elevenlabs_api_key;
    RetryPolicy retry;
    size_t blocking_pool_size = 4;
    PathSettings paths;
    AssetSettings assets;
    VideoSettings video;
};

/**
 * @brief Thrown when a configuration file cannot be read, parsed or validated
 */
class ConfigLoadError : public std::runtime_error
{
public:
    explicit ConfigLoadError(const std::string &message) : std::runtime_error(message) {}
};

class ConfigLoader
{
public:
    static constexpr const char *API_KEY_ENV = "ELEVENLABS_API_KEY";

    /**
     * @brief Load settings.yaml; ELEVENLABS_API_KEY in the environment overrides the file
     * @throws ConfigLoadError on an unreadable, malformed or invalid file
     */
    static FactorySettings loadSettings(const std::string &file_path);

    /**
     * @brief Parse settings from YAML text. Missing keys keep their defaults.
     * @throws ConfigLoadError on malformed YAML or values rejected by validateSettings
     */
    static FactorySettings parseSettings(const std::string &yaml_text);

    /**
     * @brief Load channels.json
     * @throws ConfigLoadError on an unreadable or malformed file
     */
    static std::vector<ChannelConfig> loadChannels(const std::string &file_path);

    /**
     * @brief Parse channel definitions from JSON text
     *
     * Expects an array of {"name", "language", "voice_ids": {provider: voice}}.
     * Voice entries for providers this build does not know are skipped with a warning.
     *
     * @throws ConfigLoadError on malformed JSON or a channel without a name
     */
    static std::vector<ChannelConfig> parseChannels(const std::string &json_text);

    /**
     * @brief Check value ranges, logging the reason of a rejection
     */
    static bool validateSettings(const FactorySettings &settings);

private:
    static std::string readFile(const std::string &file_path);
};
